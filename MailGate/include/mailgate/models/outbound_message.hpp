/** OutboundMessage [MailGate]
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

#ifndef OutboundMessage_hpp
#define OutboundMessage_hpp

#include <stdio.h>
#include <string>
#include "MailCore/MailCore.h"

/*
 A plain text message composed by the caller. The same builder output is
 handed to SMTP and appended to Drafts or Sent, but nothing relies on the
 two copies being byte-identical.
*/
class OutboundMessage {
    std::string _from;
    std::string _to;
    std::string _subject;
    std::string _body;

public:
    OutboundMessage(std::string from, std::string to, std::string subject, std::string body);

    // Throws a BadRequest GatewayException when `to` holds no usable address.
    mailcore::Array * recipients();
    mailcore::Address * sender();

    mailcore::Data * messageData();
};

#endif /* OutboundMessage_hpp */
