#include "mailgate/gateway_config.hpp"
#include "mailgate/mail_utils.hpp"
#include "mailgate/constants.hpp"

GatewayConfig::GatewayConfig(nlohmann::json json) {
    _data = GatewayConfig::defaults();
    if (json.is_object()) {
        _data = MailUtils::merge(_data, json);
    }
}

nlohmann::json GatewayConfig::defaults() {
    return {
        {"imap_host", DEFAULT_IMAP_HOST},
        {"imap_port", DEFAULT_IMAP_PORT},
        {"imap_allow_insecure_ssl", false},
        {"smtp_host", DEFAULT_SMTP_HOST},
        {"smtp_port", DEFAULT_SMTP_PORT},
        {"smtp_allow_insecure_ssl", false},
        {"connection_timeout", DEFAULT_CONNECTION_TIMEOUT},
        {"session_ttl", 0},
    };
}

static bool isPort(const nlohmann::json & val) {
    if (val.is_number_integer()) {
        return val.get<int>() > 0 && val.get<int>() < 65536;
    }
    if (val.is_string()) {
        try {
            int port = std::stoi(val.get<std::string>());
            return port > 0 && port < 65536;
        } catch (std::exception &) {
            return false;
        }
    }
    return false;
}

std::string GatewayConfig::valid() {
    if (!(_data["imap_host"].is_string() && _data["imap_host"].get<std::string>() != "")) {
        return "imap_host";
    }
    if (!isPort(_data["imap_port"])) {
        return "imap_port";
    }
    if (!(_data["smtp_host"].is_string() && _data["smtp_host"].get<std::string>() != "")) {
        return "smtp_host";
    }
    if (!isPort(_data["smtp_port"])) {
        return "smtp_port";
    }
    if (!_data["imap_allow_insecure_ssl"].is_boolean()) {
        return "imap_allow_insecure_ssl";
    }
    if (!_data["smtp_allow_insecure_ssl"].is_boolean()) {
        return "smtp_allow_insecure_ssl";
    }
    if (!(_data["connection_timeout"].is_number_integer() && _data["connection_timeout"].get<int>() > 0)) {
        return "connection_timeout";
    }
    if (!(_data["session_ttl"].is_number_integer() && _data["session_ttl"].get<int>() >= 0)) {
        return "session_ttl";
    }
    return ""; // true
}

std::string GatewayConfig::IMAPHost() {
    return _data["imap_host"].get<std::string>();
}

unsigned int GatewayConfig::IMAPPort() {
    nlohmann::json & val = _data["imap_port"];
    return val.is_string() ? std::stoi(val.get<std::string>()) : val.get<unsigned int>();
}

bool GatewayConfig::IMAPAllowInsecureSSL() {
    return _data["imap_allow_insecure_ssl"].get<bool>();
}

std::string GatewayConfig::SMTPHost() {
    return _data["smtp_host"].get<std::string>();
}

unsigned int GatewayConfig::SMTPPort() {
    nlohmann::json & val = _data["smtp_port"];
    return val.is_string() ? std::stoi(val.get<std::string>()) : val.get<unsigned int>();
}

bool GatewayConfig::SMTPAllowInsecureSSL() {
    return _data["smtp_allow_insecure_ssl"].get<bool>();
}

unsigned int GatewayConfig::connectionTimeout() {
    return _data["connection_timeout"].get<unsigned int>();
}

unsigned int GatewayConfig::sessionTTL() {
    return _data["session_ttl"].get<unsigned int>();
}

nlohmann::json GatewayConfig::toJSON() {
    return _data;
}
