#include "mailgate/message_normalizer.hpp"
#include "mailgate/gateway_exception.hpp"
#include "mailgate/mail_utils.hpp"
#include "mailgate/constants.hpp"

using namespace mailcore;

static std::string textOfLeafPart(AbstractPart * part) {
    if (part == nullptr || part->partType() != PartTypeSingle) {
        return "";
    }
    return MailUtils::stringOrBlank(((Attachment *)part)->decodedString());
}

static MessageParser * parserForRaw(Data * raw) {
    if (raw == nullptr) {
        throw GatewayException(GatewayErrorKind::OperationFailed, "empty-message", "The server returned no message data.");
    }
    MessageParser * parser = MessageParser::messageParserWithData(raw);
    if (parser == nullptr || parser->header() == nullptr) {
        throw GatewayException(GatewayErrorKind::OperationFailed, "unparseable-message", "The message could not be parsed.");
    }
    return parser;
}

MessageEnvelope MessageNormalizer::envelope(std::string id, Data * raw, MessageRoleHint hint) {
    MessageParser * parser = parserForRaw(raw);
    MessageHeader * header = parser->header();

    std::string counterpart = (hint == MessageRoleHint::Outgoing) ? recipients(header) : sender(header);

    return MessageEnvelope(id, counterpart, subject(header), MailUtils::rawHeaderValue(raw, "Date"), preview(primaryText(parser)));
}

MessageDetail MessageNormalizer::detail(std::string id, Data * raw) {
    MessageParser * parser = parserForRaw(raw);
    MessageHeader * header = parser->header();

    return MessageDetail(id, sender(header), recipients(header), subject(header), MailUtils::rawHeaderValue(raw, "Date"), primaryText(parser));
}

std::string MessageNormalizer::primaryText(MessageParser * parser) {
    AbstractPart * main = parser->mainPart();
    if (main == nullptr) {
        return "";
    }

    switch (main->partType()) {
        case PartTypeSingle:
            return textOfLeafPart(main);

        case PartTypeMultipartMixed:
        case PartTypeMultipartRelated:
        case PartTypeMultipartAlternative:
        case PartTypeMultipartSigned: {
            Array * parts = ((AbstractMultipart *)main)->parts();
            if (parts == nullptr || parts->count() == 0) {
                return "";
            }
            return textOfLeafPart((AbstractPart *)parts->objectAtIndex(0));
        }

        default:
            return "";
    }
}

std::string MessageNormalizer::preview(std::string body) {
    if (body.size() == 0) {
        return PLACEHOLDER_EMPTY_PREVIEW;
    }
    String * str = String::stringWithUTF8Characters(body.c_str());
    if (str->length() > MAILGATE_PREVIEW_LENGTH) {
        str = str->substringToIndex(MAILGATE_PREVIEW_LENGTH);
    }
    return MailUtils::stringOrBlank(str);
}

std::string MessageNormalizer::sender(MessageHeader * header) {
    Address * from = header->from();
    if (from == nullptr || from->nonEncodedRFC822String() == nullptr || from->nonEncodedRFC822String()->length() == 0) {
        return PLACEHOLDER_UNKNOWN_ADDRESS;
    }
    return MailUtils::stringOrBlank(from->nonEncodedRFC822String());
}

std::string MessageNormalizer::recipients(MessageHeader * header) {
    Array * to = header->to();
    if (to == nullptr || to->count() == 0) {
        return PLACEHOLDER_UNKNOWN_ADDRESS;
    }
    std::string result = MailUtils::stringOrBlank(Address::nonEncodedRFC822StringForAddresses(to));
    return result.size() ? result : PLACEHOLDER_UNKNOWN_ADDRESS;
}

std::string MessageNormalizer::subject(MessageHeader * header) {
    String * s = header->subject();
    if (s == nullptr) {
        return PLACEHOLDER_NO_SUBJECT;
    }
    return MailUtils::stringOrBlank(s);
}
