/** MailUtils [MailGate]
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

#ifndef MailUtils_hpp
#define MailUtils_hpp

#include <memory>
#include <string>
#include <vector>

#include <stdio.h>
#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"

#include "mailgate/models/session.hpp"

class GatewayConfig;

class MailUtils {

public:
    static std::string toBase58(const unsigned char * pbegin, size_t len);

    static std::string getEnvUTF8(std::string key);

    static nlohmann::json merge(const nlohmann::json &a, const nlohmann::json &b);

    static std::string randomToken(size_t bytes);

    static std::vector<uint32_t> uidsOfIndexSet(mailcore::IndexSet * set);

    static std::string stringOrBlank(mailcore::String * str);

    // The unfolded value of the first header named `name` in the raw message, or "".
    static std::string rawHeaderValue(mailcore::Data * data, std::string name);

    static void configureSessionForCredentials(mailcore::IMAPSession & session, GatewayConfig * config, const Credentials & creds);
    static void configureSessionForCredentials(mailcore::SMTPSession & session, GatewayConfig * config, const Credentials & creds);
};

#endif /* MailUtils_hpp */
