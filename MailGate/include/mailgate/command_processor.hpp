/** CommandProcessor [MailGate]
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

#ifndef CommandProcessor_hpp
#define CommandProcessor_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailgate/mail_gateway.hpp"
#include "mailgate/gateway_exception.hpp"

/*
 Dispatches one command packet to the gateway and builds the response
 packet. perform() never throws: every failure becomes a response with a
 401, 400 or 500 status and an "error" object.
*/
class CommandProcessor {
    std::shared_ptr<MailGateway> gateway;
    std::shared_ptr<spdlog::logger> logger;

    nlohmann::json performLogin(nlohmann::json & packet);
    nlohmann::json performListFolder(nlohmann::json & packet);
    nlohmann::json performFetchDetail(nlohmann::json & packet);
    nlohmann::json performSaveDraft(nlohmann::json & packet);
    nlohmann::json performSend(nlohmann::json & packet);
    nlohmann::json performLogout(nlohmann::json & packet);

public:
    CommandProcessor(std::shared_ptr<MailGateway> gateway);

    nlohmann::json perform(nlohmann::json & packet);

    // The response for a line that could not be parsed at all.
    static nlohmann::json malformedResponse(std::string detail);

    static nlohmann::json errorResponse(nlohmann::json requestId, GatewayException & ex);

    // Throws a BadRequest GatewayException if the field is missing (when
    // required) or not a string.
    static std::string stringField(nlohmann::json & packet, std::string key, bool required = true, std::string fallback = "");
};

#endif /* CommandProcessor_hpp */
