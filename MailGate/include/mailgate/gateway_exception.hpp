/** GatewayException [MailGate]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef GatewayException_hpp
#define GatewayException_hpp

#include <stdio.h>
#include <string>
#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"
#include "mailgate/generic_exception.hpp"

enum class GatewayErrorKind {
    Unauthenticated,
    InvalidCredentials,
    BadRequest,
    ConnectorUnavailable,
    FolderUnavailable,
    OperationFailed,
};

std::string GatewayErrorKindName(GatewayErrorKind kind);

/*
 Every failure the gateway reports to a caller. `key` is a short machine
 readable reason ("no-session", "ErrorConnection"), `debuginfo` the human
 readable cause and `stage` the step of the operation that failed.
*/
class GatewayException : public GenericException {
    bool retryable = false;

public:
    GatewayException(GatewayErrorKind kind, std::string key, std::string di, bool retryable = false);
    GatewayException(mailcore::ErrorCode c, std::string di);

    GatewayErrorKind kind;
    std::string key;
    std::string debuginfo;
    std::string stage;

    static GatewayErrorKind kindForErrorCode(mailcore::ErrorCode c);

    void setStageIfUnset(std::string s);

    bool isRetryable();

    // "Unauthorized", "BadRequest" or "ServerError"
    std::string statusClass();
    int statusCode();

    nlohmann::json toJSON();
};


#endif /* GatewayException_hpp */
