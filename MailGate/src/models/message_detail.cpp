#include "mailgate/models/message_detail.hpp"

MessageDetail::MessageDetail(std::string id, std::string from, std::string to, std::string subject, std::string date, std::string body) {
    _data["id"] = id;
    _data["from"] = from;
    _data["to"] = to;
    _data["subject"] = subject;
    _data["date"] = date;
    _data["body"] = body;
}

std::string MessageDetail::id() const {
    return _data["id"].get<std::string>();
}

std::string MessageDetail::from() const {
    return _data["from"].get<std::string>();
}

std::string MessageDetail::to() const {
    return _data["to"].get<std::string>();
}

std::string MessageDetail::subject() const {
    return _data["subject"].get<std::string>();
}

std::string MessageDetail::date() const {
    return _data["date"].get<std::string>();
}

std::string MessageDetail::body() const {
    return _data["body"].get<std::string>();
}

nlohmann::json MessageDetail::toJSON() const {
    return _data;
}
