#include "mailgate/models/message_envelope.hpp"

MessageEnvelope::MessageEnvelope(std::string id, std::string counterpart, std::string subject, std::string date, std::string preview) {
    _data["id"] = id;
    _data["from"] = counterpart;
    _data["subject"] = subject;
    _data["date"] = date;
    _data["preview"] = preview;
}

std::string MessageEnvelope::id() const {
    return _data["id"].get<std::string>();
}

std::string MessageEnvelope::counterpart() const {
    return _data["from"].get<std::string>();
}

std::string MessageEnvelope::subject() const {
    return _data["subject"].get<std::string>();
}

std::string MessageEnvelope::date() const {
    return _data["date"].get<std::string>();
}

std::string MessageEnvelope::preview() const {
    return _data["preview"].get<std::string>();
}

nlohmann::json MessageEnvelope::toJSON() const {
    return _data;
}
