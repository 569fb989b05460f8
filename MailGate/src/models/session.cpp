#include "mailgate/models/session.hpp"

Session::Session(std::string emailAddress, std::string secret, time_t createdAt) :
    _createdAt(createdAt)
{
    _credentials.emailAddress = emailAddress;
    _credentials.secret = secret;
}

time_t Session::createdAt() const {
    return _createdAt;
}

const Credentials & Session::credentials() const {
    return _credentials;
}
