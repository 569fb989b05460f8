#include "mailgate/session_store.hpp"
#include "mailgate/gateway_exception.hpp"
#include "mailgate/mail_utils.hpp"
#include "mailgate/constants.hpp"

SessionStore::SessionStore(time_t ttl, std::function<time_t()> clock) :
    _ttl(ttl), _clock(clock)
{
    if (!_clock) {
        _clock = []() { return time(0); };
    }
}

SessionStore::~SessionStore() {
}

std::string SessionStore::create(std::string emailAddress, std::string secret) {
    std::string token = MailUtils::randomToken(MAILGATE_TOKEN_BYTES);

    std::lock_guard<std::mutex> guard(_sessionsLock);
    _sessions.erase(token);
    _sessions.emplace(token, Session(emailAddress, secret, _clock()));
    return token;
}

Credentials SessionStore::resolve(std::string token) {
    std::lock_guard<std::mutex> guard(_sessionsLock);

    auto it = _sessions.find(token);
    if (it == _sessions.end()) {
        throw GatewayException(GatewayErrorKind::Unauthenticated, "no-session", "Invalid or expired session");
    }
    if (_ttl > 0 && _clock() - it->second.createdAt() >= _ttl) {
        _sessions.erase(it);
        throw GatewayException(GatewayErrorKind::Unauthenticated, "session-expired", "Invalid or expired session");
    }
    return it->second.credentials();
}

void SessionStore::invalidate(std::string token) {
    std::lock_guard<std::mutex> guard(_sessionsLock);
    _sessions.erase(token);
}

size_t SessionStore::size() {
    std::lock_guard<std::mutex> guard(_sessionsLock);
    return _sessions.size();
}
