/** Session [MailGate]
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

#ifndef Session_hpp
#define Session_hpp

#include <stdio.h>
#include <time.h>
#include <string>

struct Credentials {
    std::string emailAddress;
    std::string secret;
};

/*
 A validated credential pair held in memory under an opaque token. Sessions
 are never mutated after creation and never serialized: the secret must not
 reach the disk or the log.
*/
class Session {
    Credentials _credentials;
    time_t _createdAt;

public:
    Session(std::string emailAddress, std::string secret, time_t createdAt);

    time_t createdAt() const;

    const Credentials & credentials() const;
};

#endif /* Session_hpp */
