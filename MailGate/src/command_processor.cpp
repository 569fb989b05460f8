#include "mailgate/command_processor.hpp"
#include "mailgate/gateway_exception.hpp"

using namespace nlohmann;

CommandProcessor::CommandProcessor(std::shared_ptr<MailGateway> gateway) :
    gateway(gateway), logger(spdlog::get("logger"))
{
}

json CommandProcessor::perform(json & packet) {
    json requestId = (packet.is_object() && packet.count("requestId")) ? packet["requestId"] : json();

    try {
        if (!packet.is_object()) {
            throw GatewayException(GatewayErrorKind::BadRequest, "invalid-packet", "Commands must be JSON objects.");
        }
        std::string type = stringField(packet, "type");
        logger->info("[{}] Running {}", requestId.dump(), type);

        json resp;
        if (type == "login") {
            resp = performLogin(packet);

        } else if (type == "list-folder") {
            resp = performListFolder(packet);

        } else if (type == "fetch-detail") {
            resp = performFetchDetail(packet);

        } else if (type == "save-draft") {
            resp = performSaveDraft(packet);

        } else if (type == "send") {
            resp = performSend(packet);

        } else if (type == "logout") {
            resp = performLogout(packet);

        } else if (type == "health") {
            json health = gateway->health();
            resp = {
                {"status_text", health["status"]},
                {"sessions", health["sessions"]},
            };

        } else {
            throw GatewayException(GatewayErrorKind::BadRequest, "unknown-type", "Unsure of how to process command type `" + type + "`.");
        }

        resp["requestId"] = requestId;
        resp["status"] = 200;
        logger->info("[{}] -- Succeeded", requestId.dump());
        return resp;

    } catch (GatewayException & ex) {
        logger->error("[{}] -- Failed ({})", requestId.dump(), ex.toJSON().dump());
        return errorResponse(requestId, ex);

    } catch (std::exception & ex) {
        GatewayException wrapped(GatewayErrorKind::OperationFailed, "unexpected-error", ex.what());
        logger->error("[{}] -- Failed ({})", requestId.dump(), wrapped.toJSON().dump());
        return errorResponse(requestId, wrapped);
    }
}

json CommandProcessor::performLogin(json & packet) {
    std::string email = stringField(packet, "email");
    std::string token = gateway->login(email, stringField(packet, "password"));
    return {
        {"access_token", token},
        {"token_type", "bearer"},
        {"email", email},
    };
}

json CommandProcessor::performListFolder(json & packet) {
    std::string folder = stringField(packet, "folder");
    json emails = json::array();
    for (const auto & envelope : gateway->listFolder(stringField(packet, "token"), folder)) {
        emails.push_back(envelope.toJSON());
    }
    return {
        {"emails", emails},
        {"folder", folder},
    };
}

json CommandProcessor::performFetchDetail(json & packet) {
    std::string id;
    if (packet.count("id") && packet["id"].is_number_integer()) {
        id = std::to_string(packet["id"].get<long long>());
    } else {
        id = stringField(packet, "id");
    }
    MessageDetail detail = gateway->fetchDetail(stringField(packet, "token"), id, stringField(packet, "folder", false, "Inbox"));
    return detail.toJSON();
}

json CommandProcessor::performSaveDraft(json & packet) {
    gateway->saveDraft(stringField(packet, "token"), stringField(packet, "to"), stringField(packet, "subject", false), stringField(packet, "body", false));
    return {
        {"status_text", "Draft saved successfully"},
    };
}

json CommandProcessor::performSend(json & packet) {
    SendReceipt receipt = gateway->send(stringField(packet, "token"), stringField(packet, "to"), stringField(packet, "subject", false), stringField(packet, "body", false));
    json resp = receipt.toJSON();
    resp["status_text"] = "Email sent successfully";
    return resp;
}

json CommandProcessor::performLogout(json & packet) {
    gateway->logout(stringField(packet, "token", false));
    return {
        {"status_text", "Logged out"},
    };
}

json CommandProcessor::malformedResponse(std::string detail) {
    GatewayException ex(GatewayErrorKind::BadRequest, "invalid-json", detail);
    return errorResponse(json(), ex);
}

json CommandProcessor::errorResponse(json requestId, GatewayException & ex) {
    return {
        {"requestId", requestId},
        {"status", ex.statusCode()},
        {"error", ex.toJSON()},
    };
}

std::string CommandProcessor::stringField(json & packet, std::string key, bool required, std::string fallback) {
    if (!packet.count(key) || packet[key].is_null()) {
        if (required) {
            throw GatewayException(GatewayErrorKind::BadRequest, "missing-field", "`" + key + "` is required.");
        }
        return fallback;
    }
    if (!packet[key].is_string()) {
        throw GatewayException(GatewayErrorKind::BadRequest, "invalid-field", "`" + key + "` must be a string.");
    }
    return packet[key].get<std::string>();
}
