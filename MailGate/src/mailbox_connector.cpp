#include "mailgate/mailbox_connector.hpp"
#include "mailgate/gateway_exception.hpp"
#include "mailgate/mail_utils.hpp"
#include "mailgate/constants.hpp"

using namespace mailcore;

// IMAPConnection

IMAPConnection::IMAPConnection(IMAPSession * session) :
    session(session), logger(spdlog::get("logger"))
{
}

IMAPConnection::~IMAPConnection() {
    session->disconnect();
    session->release();
}

void IMAPConnection::open() {
    ErrorCode err = ErrorNone;
    session->connect(&err);
    if (err != ErrorNone) {
        throw GatewayException(err, "connect");
    }
    session->login(&err);
    if (err != ErrorNone) {
        throw GatewayException(err, "login");
    }
}

FolderResolution IMAPConnection::resolveFolder(FolderRole role, FolderIntent intent) {
    IMAPSession * s = session;

    FolderResolver::FolderCommand select = [s](const std::string & path) {
        ErrorCode err = ErrorNone;
        s->select(AS_TRANSIENT_MCSTR(path), &err);
        return err;
    };
    FolderResolver::FolderCommand create = [s](const std::string & path) {
        ErrorCode err = ErrorNone;
        s->createFolder(AS_TRANSIENT_MCSTR(path), &err);
        return err;
    };

    return FolderResolver::resolve(role, intent, select, create);
}

std::string IMAPConnection::selectFolder(FolderRole role, FolderIntent intent) {
    FolderResolution resolution = resolveFolder(role, intent);
    std::string name = FolderResolver::nameForRole(role);

    std::string tried;
    for (const auto & attempt : resolution.attempts) {
        std::string errName = ErrorCodeToTypeMap.count(attempt.error) ? ErrorCodeToTypeMap[attempt.error] : std::to_string((int)attempt.error);
        logger->info("-- {} `{}`: {}", attempt.create ? "create" : "select", attempt.path, errName);
        if (!attempt.create) {
            tried += (tried.size() ? ", " : "") + attempt.path;
        }
    }

    if (resolution.resolved) {
        return resolution.path;
    }
    if (resolution.stoppedOnTransportFailure()) {
        throw GatewayException(resolution.lastError(), "select " + resolution.attempts.back().path);
    }
    throw GatewayException(GatewayErrorKind::FolderUnavailable, "folder-unavailable", "Could not open the " + name + " folder (tried " + tried + ").");
}

std::vector<uint32_t> IMAPConnection::recentUIDs(std::string path, size_t limit) {
    ErrorCode err = ErrorNone;
    IndexSet * found = session->search(AS_TRANSIENT_MCSTR(path), IMAPSearchExpression::searchAll(), &err);
    if (err != ErrorNone) {
        throw GatewayException(err, "search");
    }

    // IndexSet keeps its ranges in ascending order. UIDs grow with arrival,
    // so the tail of the set holds the newest messages.
    std::vector<uint32_t> uids = MailUtils::uidsOfIndexSet(found);
    std::vector<uint32_t> recent {};
    for (auto it = uids.rbegin(); it != uids.rend() && recent.size() < limit; it++) {
        recent.push_back(*it);
    }
    return recent;
}

Data * IMAPConnection::fetchRaw(std::string path, uint32_t uid) {
    ErrorCode err = ErrorNone;
    Data * data = session->fetchMessageByUID(AS_TRANSIENT_MCSTR(path), uid, nullptr, &err);
    if (err != ErrorNone) {
        throw GatewayException(err, "fetchMessageByUID");
    }
    if (data == nullptr || data->length() == 0) {
        throw GatewayException(GatewayErrorKind::OperationFailed, "message-not-found", "No message with id " + std::to_string(uid) + " in " + path + ".");
    }
    return data;
}

uint32_t IMAPConnection::append(std::string path, Data * messageData, MessageFlag flags, time_t date) {
    ErrorCode err = ErrorNone;
    uint32_t createdUID = 0;
    session->appendMessageWithCustomFlagsAndDate(AS_TRANSIENT_MCSTR(path), messageData, flags, nullptr, date, nullptr, &createdUID, &err);
    if (err != ErrorNone) {
        throw GatewayException(err, "appendMessage");
    }
    logger->info("-- Appended message to `{}` (UID {})", path, createdUID);
    return createdUID;
}

// SMTPConnection

SMTPConnection::SMTPConnection(SMTPSession * session) :
    session(session), logger(spdlog::get("logger"))
{
}

SMTPConnection::~SMTPConnection() {
    // the SMTP stream is closed when the session is freed
    session->release();
}

void SMTPConnection::submit(Address * from, Array * recipients, Data * messageData) {
    ErrorCode err = ErrorNone;
    session->sendMessage(from, recipients, messageData, nullptr, &err);
    if (err != ErrorNone) {
        std::string errName = ErrorCodeToTypeMap.count(err) ? ErrorCodeToTypeMap[err] : std::to_string((int)err);
        logger->info("-X An SMTP error occurred: {} LibEtPan code: {}", errName, session->lastLibetpanError());
        throw GatewayException(err, "sendMessage");
    }
}

void SMTPConnection::verify(Address * from) {
    ErrorCode err = ErrorNone;
    session->checkAccount(from, &err);
    if (err != ErrorNone) {
        std::string errName = ErrorCodeToTypeMap.count(err) ? ErrorCodeToTypeMap[err] : std::to_string((int)err);
        logger->info("-X SMTP account check failed: {} LibEtPan code: {}", errName, session->lastLibetpanError());
        throw GatewayException(err, "checkAccount");
    }
}

// ProtocolTraceLogger

ProtocolTraceLogger::ProtocolTraceLogger() :
    logger(spdlog::get("logger"))
{
}

void ProtocolTraceLogger::log(void * sender, ConnectionLogType logType, Data * buffer) {
    if (buffer == nullptr) {
        return;
    }
    if (logType == ConnectionLogTypeSentPrivate) {
        logger->debug(">> [credentials redacted]");
        return;
    }
    std::string line(buffer->bytes(), buffer->length());
    while (line.size() > 0 && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    const char * direction = (logType == ConnectionLogTypeSent) ? ">>" : "<<";
    logger->debug("{} {}", direction, line);
}

// MailboxConnector

MailboxConnector::MailboxConnector(std::shared_ptr<GatewayConfig> config, IMAPSessionFactory imapFactory, SMTPSessionFactory smtpFactory) :
    config(config), imapFactory(imapFactory), smtpFactory(smtpFactory), connectionLogger(nullptr), logger(spdlog::get("logger"))
{
    if (!this->imapFactory) {
        this->imapFactory = []() { return new IMAPSession(); };
    }
    if (!this->smtpFactory) {
        this->smtpFactory = []() { return new SMTPSession(); };
    }
}

void MailboxConnector::setConnectionLogger(ConnectionLogger * logger) {
    connectionLogger = logger;
}

void MailboxConnector::probe(const Credentials & creds) {
    logger->info("Probing IMAP credentials for {}", creds.emailAddress);
    try {
        std::unique_ptr<IMAPConnection> conn = openIMAP(creds);
    } catch (GatewayException & ex) {
        // the probe only distinguishes bad credentials from an unreachable server
        if (ex.kind != GatewayErrorKind::InvalidCredentials) {
            throw GatewayException(GatewayErrorKind::ConnectorUnavailable, ex.key, ex.debuginfo, true);
        }
        throw;
    }
}

std::unique_ptr<IMAPConnection> MailboxConnector::openIMAP(const Credentials & creds) {
    IMAPSession * session = imapFactory();
    std::unique_ptr<IMAPConnection> conn(new IMAPConnection(session));

    MailUtils::configureSessionForCredentials(*session, config.get(), creds);
    if (connectionLogger) {
        session->setConnectionLogger(connectionLogger);
    }
    conn->open();
    return conn;
}

std::unique_ptr<SMTPConnection> MailboxConnector::openSMTP(const Credentials & creds) {
    SMTPSession * session = smtpFactory();
    std::unique_ptr<SMTPConnection> conn(new SMTPConnection(session));

    MailUtils::configureSessionForCredentials(*session, config.get(), creds);
    if (connectionLogger) {
        session->setConnectionLogger(connectionLogger);
    }
    return conn;
}
