#include "mailgate/models/outbound_message.hpp"
#include "mailgate/gateway_exception.hpp"
#include "mailgate/constants.hpp"

using namespace mailcore;

OutboundMessage::OutboundMessage(std::string from, std::string to, std::string subject, std::string body) :
    _from(from), _to(to), _subject(subject), _body(body)
{
}

Address * OutboundMessage::sender() {
    return Address::addressWithMailbox(AS_TRANSIENT_MCSTR(_from));
}

Array * OutboundMessage::recipients() {
    Array * parsed = Address::addressesWithRFC822String(AS_TRANSIENT_MCSTR(_to));
    Array * recipients = Array::array();

    if (parsed != nullptr) {
        for (unsigned int ii = 0; ii < parsed->count(); ii ++) {
            Address * addr = (Address *)parsed->objectAtIndex(ii);
            if (addr->mailbox() == nullptr || addr->mailbox()->length() == 0) {
                continue;
            }
            recipients->addObject(addr);
        }
    }
    if (recipients->count() == 0) {
        throw GatewayException(GatewayErrorKind::BadRequest, "invalid-recipient", "`" + _to + "` does not contain a recipient address.");
    }
    return recipients;
}

Data * OutboundMessage::messageData() {
    MessageBuilder builder;
    builder.header()->setFrom(sender());
    builder.header()->setTo(recipients());
    builder.header()->setSubject(AS_TRANSIENT_MCSTR(_subject));
    builder.header()->setUserAgent(MCSTR(MAILGATE_USER_AGENT));
    builder.header()->setDate(time(0));
    builder.setTextBody(AS_TRANSIENT_MCSTR(_body));
    return builder.data();
}
