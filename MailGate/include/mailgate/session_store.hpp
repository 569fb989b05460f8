/** SessionStore [MailGate]
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

#ifndef SessionStore_hpp
#define SessionStore_hpp

#include <stdio.h>
#include <time.h>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "mailgate/models/session.hpp"

/*
 Validated credentials keyed by an opaque bearer token. Entries live until
 they are invalidated or, when a TTL is configured, until they expire. The
 store is in-memory only and shared by every request thread.
*/
class SessionStore {
    std::map<std::string, Session> _sessions;
    std::mutex _sessionsLock;
    time_t _ttl;
    std::function<time_t()> _clock;

public:
    // `ttl` is in seconds, 0 disables expiry.
    SessionStore(time_t ttl = 0, std::function<time_t()> clock = nullptr);
    ~SessionStore();

    std::string create(std::string emailAddress, std::string secret);

    // Throws an Unauthenticated GatewayException for unknown or expired tokens.
    Credentials resolve(std::string token);

    void invalidate(std::string token);

    size_t size();
};

#endif /* SessionStore_hpp */
