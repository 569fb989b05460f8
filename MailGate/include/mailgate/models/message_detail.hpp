/** MessageDetail [MailGate]
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

#ifndef MessageDetail_hpp
#define MessageDetail_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

class MessageDetail {
    nlohmann::json _data;

public:
    MessageDetail(std::string id, std::string from, std::string to, std::string subject, std::string date, std::string body);

    std::string id() const;
    std::string from() const;
    std::string to() const;
    std::string subject() const;
    std::string date() const;
    std::string body() const;

    nlohmann::json toJSON() const;
};

#endif /* MessageDetail_hpp */
