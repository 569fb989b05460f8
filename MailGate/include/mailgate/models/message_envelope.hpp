/** MessageEnvelope [MailGate]
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

#ifndef MessageEnvelope_hpp
#define MessageEnvelope_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"

/*
 The summary of one message in a folder listing. `counterpart` is the
 sender for received mail and the recipients for sent mail and drafts, and
 is serialized under the `from` key.
*/
class MessageEnvelope {
    nlohmann::json _data;

public:
    MessageEnvelope(std::string id, std::string counterpart, std::string subject, std::string date, std::string preview);

    std::string id() const;
    std::string counterpart() const;
    std::string subject() const;
    std::string date() const;
    std::string preview() const;

    nlohmann::json toJSON() const;
};

#endif /* MessageEnvelope_hpp */
