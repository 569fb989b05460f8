/** MailGateway [MailGate]
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

#ifndef MailGateway_hpp
#define MailGateway_hpp

#include <stdio.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailgate/session_store.hpp"
#include "mailgate/mailbox_connector.hpp"
#include "mailgate/models/message_envelope.hpp"
#include "mailgate/models/message_detail.hpp"
#include "mailgate/models/send_receipt.hpp"

/*
 The operations exposed to callers. Each one resolves its session, opens
 the connections it needs, does its work and closes them again. Nothing is
 cached between calls except the session itself.

 Failures after the session lookup are GatewayExceptions tagged with the
 stage that was running ("connect", "resolve-folder", "search", "fetch",
 "normalize", "compose", "submit", "append").
*/
class MailGateway {
    std::shared_ptr<SessionStore> store;
    std::shared_ptr<MailboxConnector> connector;
    std::shared_ptr<spdlog::logger> logger;

    // Tags failures with the running stage. Rejected credentials are only
    // reported as such while checking them; afterwards they are OperationFailed.
    void runInStages(std::function<void(std::string & stage)> fn, bool checkingCredentials = false);
    void archiveSentCopy(const Credentials & creds, mailcore::Data * messageData, SendReceipt & receipt);

public:
    MailGateway(std::shared_ptr<SessionStore> store, std::shared_ptr<MailboxConnector> connector);

    std::string login(std::string emailAddress, std::string secret);

    std::vector<MessageEnvelope> listFolder(std::string token, std::string folder);

    MessageDetail fetchDetail(std::string token, std::string id, std::string folder = "Inbox");

    void saveDraft(std::string token, std::string to, std::string subject, std::string body);

    // Succeeds once SMTP accepts the message. Archiving to Sent is best
    // effort and its outcome is only reported in the receipt.
    SendReceipt send(std::string token, std::string to, std::string subject, std::string body);

    void logout(std::string token);

    nlohmann::json health();

    static uint32_t uidForId(std::string id);
};

#endif /* MailGateway_hpp */
