/** MailboxConnector [MailGate]
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

#ifndef MailboxConnector_hpp
#define MailboxConnector_hpp

#include <stdio.h>
#include <time.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "spdlog/spdlog.h"

#include "mailgate/gateway_config.hpp"
#include "mailgate/folder_resolver.hpp"
#include "mailgate/models/session.hpp"

typedef std::function<mailcore::IMAPSession *()> IMAPSessionFactory;
typedef std::function<mailcore::SMTPSession *()> SMTPSessionFactory;

/*
 One authenticated IMAP connection, scoped to a single gateway operation.
 The connection owns one reference to its session and disconnects and
 releases it when destroyed, whichever way the operation exits.
*/
class IMAPConnection {
    mailcore::IMAPSession * session;
    std::shared_ptr<spdlog::logger> logger;

public:
    IMAPConnection(mailcore::IMAPSession * session);
    ~IMAPConnection();

    void open();

    FolderResolution resolveFolder(FolderRole role, FolderIntent intent);

    // Returns the provider path that was selected. Throws FolderUnavailable
    // once every alias (and, for appends, the create fallback) has failed.
    std::string selectFolder(FolderRole role, FolderIntent intent);

    // At most `limit` UIDs, highest (newest) first.
    std::vector<uint32_t> recentUIDs(std::string path, size_t limit);

    mailcore::Data * fetchRaw(std::string path, uint32_t uid);

    uint32_t append(std::string path, mailcore::Data * messageData, mailcore::MessageFlag flags, time_t date);
};

class SMTPConnection {
    mailcore::SMTPSession * session;
    std::shared_ptr<spdlog::logger> logger;

public:
    SMTPConnection(mailcore::SMTPSession * session);
    ~SMTPConnection();

    void submit(mailcore::Address * from, mailcore::Array * recipients, mailcore::Data * messageData);

    // Connects and authenticates without sending anything.
    void verify(mailcore::Address * from);
};

/*
 Forwards IMAP and SMTP traffic to the spdlog logger at debug level. Lines
 mailcore marks as private (LOGIN, AUTH) are replaced so credentials never
 reach the log.
*/
class ProtocolTraceLogger : public mailcore::ConnectionLogger {
    std::shared_ptr<spdlog::logger> logger;

public:
    ProtocolTraceLogger();

    void log(void * sender, mailcore::ConnectionLogType logType, mailcore::Data * buffer);
};

class MailboxConnector {
    std::shared_ptr<GatewayConfig> config;
    IMAPSessionFactory imapFactory;
    SMTPSessionFactory smtpFactory;
    mailcore::ConnectionLogger * connectionLogger;
    std::shared_ptr<spdlog::logger> logger;

public:
    MailboxConnector(std::shared_ptr<GatewayConfig> config, IMAPSessionFactory imapFactory = nullptr, SMTPSessionFactory smtpFactory = nullptr);

    void setConnectionLogger(mailcore::ConnectionLogger * logger);

    // Opens, authenticates and immediately closes an IMAP connection.
    // Throws InvalidCredentials or ConnectorUnavailable.
    void probe(const Credentials & creds);

    std::unique_ptr<IMAPConnection> openIMAP(const Credentials & creds);
    std::unique_ptr<SMTPConnection> openSMTP(const Credentials & creds);
};

#endif /* MailboxConnector_hpp */
