/** MessageNormalizer [MailGate]
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

#ifndef MessageNormalizer_hpp
#define MessageNormalizer_hpp

#include <stdio.h>
#include <string>
#include "MailCore/MailCore.h"

#include "mailgate/models/message_envelope.hpp"
#include "mailgate/models/message_detail.hpp"

enum class MessageRoleHint {
    Received,
    Outgoing,
};

/*
 Turns raw RFC 822 bytes into the typed records the gateway returns. This is
 the only place raw protocol payloads are read. No HTML stripping and no
 charset repair happen here: the body is whatever the first text part
 decodes to.
*/
class MessageNormalizer {

public:
    static MessageEnvelope envelope(std::string id, mailcore::Data * raw, MessageRoleHint hint);
    static MessageDetail detail(std::string id, mailcore::Data * raw);

    // The decoded text of the main part, or of the first part of a multipart
    // message. Nested multiparts and attached messages are not walked.
    static std::string primaryText(mailcore::MessageParser * parser);

    static std::string preview(std::string body);

    static std::string sender(mailcore::MessageHeader * header);
    static std::string recipients(mailcore::MessageHeader * header);
    static std::string subject(mailcore::MessageHeader * header);
};

#endif /* MessageNormalizer_hpp */
