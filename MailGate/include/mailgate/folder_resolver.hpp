/** FolderResolver [MailGate]
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

#ifndef FolderResolver_hpp
#define FolderResolver_hpp

#include <stdio.h>
#include <functional>
#include <string>
#include <vector>
#include "MailCore/MailCore.h"

enum class FolderRole {
    Inbox,
    Drafts,
    Sent,
    Trash,
};

enum class FolderIntent {
    Read,
    Append,
};

enum class SelectOutcome {
    Selected,
    Missing,
    TransportFailure,
};

struct FolderAttempt {
    std::string path;
    bool create;
    SelectOutcome outcome;
    mailcore::ErrorCode error;
};

struct FolderResolution {
    FolderRole role;
    bool resolved;
    std::string path;
    std::vector<FolderAttempt> attempts;

    // The error of the last attempt, ErrorNone when resolved.
    mailcore::ErrorCode lastError() const;
    bool stoppedOnTransportFailure() const;
};

/*
 Maps the four logical folders onto provider mailbox names. Resolution walks
 the alias table in order and treats each SELECT as a value: a missing
 mailbox moves on to the next alias, anything that means the connection or
 the login is broken ends the walk. Only an Append intent may fall back to
 creating the folder under its primary name.
*/
class FolderResolver {

public:
    typedef std::function<mailcore::ErrorCode(const std::string & path)> FolderCommand;

    // Throws a BadRequest GatewayException for names outside the logical set.
    static FolderRole roleForName(std::string name);

    static std::string nameForRole(FolderRole role);
    static std::vector<std::string> candidatesForRole(FolderRole role);

    // Sent and Drafts hold mail written by the account owner.
    static bool isOutgoingRole(FolderRole role);

    static SelectOutcome outcomeForError(mailcore::ErrorCode err);

    static FolderResolution resolve(FolderRole role, FolderIntent intent, FolderCommand select, FolderCommand create);
};

#endif /* FolderResolver_hpp */
