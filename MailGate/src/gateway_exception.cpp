#include "mailgate/gateway_exception.hpp"
#include "mailgate/constants.hpp"

std::string GatewayErrorKindName(GatewayErrorKind kind) {
    switch (kind) {
        case GatewayErrorKind::Unauthenticated: return "Unauthenticated";
        case GatewayErrorKind::InvalidCredentials: return "InvalidCredentials";
        case GatewayErrorKind::BadRequest: return "BadRequest";
        case GatewayErrorKind::ConnectorUnavailable: return "ConnectorUnavailable";
        case GatewayErrorKind::FolderUnavailable: return "FolderUnavailable";
        case GatewayErrorKind::OperationFailed: return "OperationFailed";
    }
    return "OperationFailed";
}

GatewayException::GatewayException(GatewayErrorKind kind, std::string key, std::string di, bool retryable) :
    GenericException(GatewayErrorKindName(kind) + ": " + di), retryable(retryable), kind(kind), key(key), debuginfo(di)
{
}

GatewayException::GatewayException(mailcore::ErrorCode c, std::string di) :
    GenericException(), kind(kindForErrorCode(c)), key(""), debuginfo(di)
{
    if (ErrorCodeToTypeMap.count(c)) {
        key = ErrorCodeToTypeMap[c];
    } else {
        key = "Error" + std::to_string((int)c);
    }
    _what = GatewayErrorKindName(kind) + ": " + key + " (" + di + ")";

    if (kind == GatewayErrorKind::ConnectorUnavailable) {
        retryable = true;
    }
    if (c == mailcore::ErrorFetch) {
        // a fetch failing mid-stream is usually an abrupt connection termination
        retryable = true;
    }
}

GatewayErrorKind GatewayException::kindForErrorCode(mailcore::ErrorCode c) {
    switch (c) {
        case mailcore::ErrorConnection:
        case mailcore::ErrorTLSNotAvailable:
        case mailcore::ErrorStartTLSNotAvailable:
        case mailcore::ErrorCertificate:
        case mailcore::ErrorParse:
        case mailcore::ErrorNoValidServerFound:
        case mailcore::ErrorGmailTooManySimultaneousConnections:
        case mailcore::ErrorGmailExceededBandwidthLimit:
        case mailcore::ErrorYahooUnavailable:
            return GatewayErrorKind::ConnectorUnavailable;

        case mailcore::ErrorAuthentication:
        case mailcore::ErrorAuthenticationRequired:
        case mailcore::ErrorInvalidAccount:
        case mailcore::ErrorGmailIMAPNotEnabled:
        case mailcore::ErrorGmailApplicationSpecificPasswordRequired:
        case mailcore::ErrorOutlookLoginViaWebBrowser:
        case mailcore::ErrorTiscaliSimplePassword:
        case mailcore::ErrorNeedsConnectToWebmail:
            return GatewayErrorKind::InvalidCredentials;

        case mailcore::ErrorNoRecipient:
            return GatewayErrorKind::BadRequest;

        default:
            return GatewayErrorKind::OperationFailed;
    }
}

void GatewayException::setStageIfUnset(std::string s) {
    if (stage == "") {
        stage = s;
    }
}

bool GatewayException::isRetryable() {
    return retryable;
}

std::string GatewayException::statusClass() {
    switch (kind) {
        case GatewayErrorKind::Unauthenticated:
        case GatewayErrorKind::InvalidCredentials:
            return "Unauthorized";
        case GatewayErrorKind::BadRequest:
            return "BadRequest";
        default:
            return "ServerError";
    }
}

int GatewayException::statusCode() {
    std::string c = statusClass();
    if (c == "Unauthorized") return 401;
    if (c == "BadRequest") return 400;
    return 500;
}

nlohmann::json GatewayException::toJSON() {
    return {
        {"what", what()},
        {"class", statusClass()},
        {"kind", GatewayErrorKindName(kind)},
        {"key", key},
        {"stage", stage},
        {"detail", debuginfo},
        {"retryable", retryable},
    };
}
