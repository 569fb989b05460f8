/** GatewayConfig [MailGate]
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

#ifndef GatewayConfig_hpp
#define GatewayConfig_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

/*
 Deployment settings for the single mailbox provider the gateway fronts.
 Keys that are absent from the JSON fall back to the provider defaults in
 constants.hpp.
*/
class GatewayConfig {
    nlohmann::json _data;

public:
    GatewayConfig(nlohmann::json json);

    static nlohmann::json defaults();

    // Returns the name of the first malformed field, or "" when usable.
    std::string valid();

    std::string IMAPHost();
    unsigned int IMAPPort();
    bool IMAPAllowInsecureSSL();

    std::string SMTPHost();
    unsigned int SMTPPort();
    bool SMTPAllowInsecureSSL();

    unsigned int connectionTimeout();
    unsigned int sessionTTL();

    nlohmann::json toJSON();
};

#endif /* GatewayConfig_hpp */
