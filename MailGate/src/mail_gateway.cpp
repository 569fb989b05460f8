#include "mailgate/mail_gateway.hpp"
#include <stdint.h>
#include "mailgate/gateway_exception.hpp"
#include "mailgate/folder_resolver.hpp"
#include "mailgate/message_normalizer.hpp"
#include "mailgate/constants.hpp"
#include "mailgate/models/outbound_message.hpp"

using namespace mailcore;

MailGateway::MailGateway(std::shared_ptr<SessionStore> store, std::shared_ptr<MailboxConnector> connector) :
    store(store), connector(connector), logger(spdlog::get("logger"))
{
}

void MailGateway::runInStages(std::function<void(std::string & stage)> fn, bool checkingCredentials) {
    std::string stage = "";
    try {
        fn(stage);
    } catch (GatewayException & ex) {
        ex.setStageIfUnset(stage);
        if (ex.kind == GatewayErrorKind::InvalidCredentials && !checkingCredentials) {
            // The session itself is valid: the server refused it mid-operation.
            GatewayException wrapped(GatewayErrorKind::OperationFailed, ex.key, "The server rejected the session's credentials: " + ex.debuginfo);
            wrapped.setStageIfUnset(ex.stage);
            throw wrapped;
        }
        throw;
    } catch (std::exception & ex) {
        GatewayException wrapped(GatewayErrorKind::OperationFailed, "unexpected-error", ex.what());
        wrapped.setStageIfUnset(stage);
        throw wrapped;
    }
}

std::string MailGateway::login(std::string emailAddress, std::string secret) {
    AutoreleasePool pool;

    if (emailAddress == "" || secret == "") {
        throw GatewayException(GatewayErrorKind::BadRequest, "missing-credentials", "An email address and password are required.");
    }

    Credentials creds {emailAddress, secret};
    runInStages([&](std::string & stage) {
        stage = "connect";
        connector->probe(creds);
    }, true);

    std::string token = store->create(emailAddress, secret);
    logger->info("-- Created session for {}", emailAddress);
    return token;
}

std::vector<MessageEnvelope> MailGateway::listFolder(std::string token, std::string folder) {
    AutoreleasePool pool;
    Credentials creds = store->resolve(token);
    FolderRole role = FolderResolver::roleForName(folder);

    std::vector<MessageEnvelope> results {};
    runInStages([&](std::string & stage) {
        stage = "connect";
        std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);

        stage = "resolve-folder";
        std::string path = conn->selectFolder(role, FolderIntent::Read);

        stage = "search";
        std::vector<uint32_t> uids = conn->recentUIDs(path, MAILGATE_LIST_LIMIT);

        MessageRoleHint hint = FolderResolver::isOutgoingRole(role) ? MessageRoleHint::Outgoing : MessageRoleHint::Received;
        for (uint32_t uid : uids) {
            stage = "fetch";
            Data * raw = conn->fetchRaw(path, uid);
            stage = "normalize";
            results.push_back(MessageNormalizer::envelope(std::to_string(uid), raw, hint));
        }
        logger->info("-- Listed {} messages from `{}` for {}", results.size(), path, creds.emailAddress);
    });
    return results;
}

MessageDetail MailGateway::fetchDetail(std::string token, std::string id, std::string folder) {
    AutoreleasePool pool;
    Credentials creds = store->resolve(token);
    FolderRole role = FolderResolver::roleForName(folder);
    uint32_t uid = uidForId(id);

    std::unique_ptr<MessageDetail> result;
    runInStages([&](std::string & stage) {
        stage = "connect";
        std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);

        stage = "resolve-folder";
        std::string path = conn->selectFolder(role, FolderIntent::Read);

        stage = "fetch";
        Data * raw = conn->fetchRaw(path, uid);

        stage = "normalize";
        result.reset(new MessageDetail(MessageNormalizer::detail(std::to_string(uid), raw)));
    });
    return *result;
}

void MailGateway::saveDraft(std::string token, std::string to, std::string subject, std::string body) {
    AutoreleasePool pool;
    Credentials creds = store->resolve(token);

    runInStages([&](std::string & stage) {
        stage = "compose";
        OutboundMessage message(creds.emailAddress, to, subject, body);
        Data * data = message.messageData();

        stage = "connect";
        std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);

        stage = "resolve-folder";
        std::string path = conn->selectFolder(FolderRole::Drafts, FolderIntent::Append);

        stage = "append";
        conn->append(path, data, MessageFlagDraft, time(0));
    });
}

SendReceipt MailGateway::send(std::string token, std::string to, std::string subject, std::string body) {
    AutoreleasePool pool;
    Credentials creds = store->resolve(token);
    SendReceipt receipt;

    Data * data = nullptr;
    runInStages([&](std::string & stage) {
        stage = "compose";
        OutboundMessage message(creds.emailAddress, to, subject, body);
        Array * recipients = message.recipients();
        data = message.messageData();

        stage = "connect";
        std::unique_ptr<SMTPConnection> smtp = connector->openSMTP(creds);

        stage = "submit";
        smtp->submit(message.sender(), recipients, data);
        logger->info("-- Sent message from {} to {} recipient(s)", creds.emailAddress, recipients->count());
    });

    archiveSentCopy(creds, data, receipt);
    return receipt;
}

void MailGateway::archiveSentCopy(const Credentials & creds, Data * messageData, SendReceipt & receipt) {
    // The message has been delivered. Nothing below may turn that into a failure.
    try {
        std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
        std::string path = conn->selectFolder(FolderRole::Sent, FolderIntent::Append);
        conn->append(path, messageData, MessageFlagSeen, time(0));
        receipt.setArchived(path);
    } catch (GatewayException & ex) {
        logger->warn("-X Message was sent but could not be archived to Sent: {}", ex.toJSON().dump());
        receipt.setWarning("Email sent but could not be saved to the Sent folder: " + ex.debuginfo);
    } catch (std::exception & ex) {
        logger->warn("-X Message was sent but could not be archived to Sent: {}", ex.what());
        receipt.setWarning("Email sent but could not be saved to the Sent folder: " + std::string(ex.what()));
    }
}

void MailGateway::logout(std::string token) {
    store->invalidate(token);
}

nlohmann::json MailGateway::health() {
    return {
        {"status", "OK"},
        {"sessions", store->size()},
    };
}

uint32_t MailGateway::uidForId(std::string id) {
    if (id.size() == 0 || id.size() > 10 || id.find_first_not_of("0123456789") != std::string::npos) {
        throw GatewayException(GatewayErrorKind::BadRequest, "invalid-id", "`" + id + "` is not a message id.");
    }
    unsigned long long value = std::stoull(id);
    if (value == 0 || value > UINT32_MAX) {
        throw GatewayException(GatewayErrorKind::BadRequest, "invalid-id", "`" + id + "` is not a message id.");
    }
    return (uint32_t)value;
}
