#include "mailgate/folder_resolver.hpp"
#include "mailgate/gateway_exception.hpp"

#include <algorithm>
#include <cctype>
#include <map>

static std::map<FolderRole, std::vector<std::string>> FOLDER_ALIASES = {
    {FolderRole::Inbox, {"INBOX"}},
    {FolderRole::Drafts, {"Drafts", "[Gmail]/Drafts"}},
    {FolderRole::Sent, {"Sent", "[Gmail]/Sent Mail", "Sent Items", "Sent Messages"}},
    {FolderRole::Trash, {"Trash", "[Gmail]/Trash", "Deleted Items", "Deleted Messages"}},
};

mailcore::ErrorCode FolderResolution::lastError() const {
    if (resolved || attempts.size() == 0) {
        return mailcore::ErrorNone;
    }
    return attempts.back().error;
}

bool FolderResolution::stoppedOnTransportFailure() const {
    return !resolved && attempts.size() > 0 && attempts.back().outcome == SelectOutcome::TransportFailure;
}

FolderRole FolderResolver::roleForName(std::string name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });

    // INBOX is case-insensitive in IMAP, the others are matched exactly.
    if (lower == "inbox") {
        return FolderRole::Inbox;
    }
    if (name == "Drafts") {
        return FolderRole::Drafts;
    }
    if (name == "Sent" || name == "[Gmail]/Sent Mail") {
        return FolderRole::Sent;
    }
    if (name == "Trash") {
        return FolderRole::Trash;
    }
    throw GatewayException(GatewayErrorKind::BadRequest, "invalid-folder", "Invalid folder: " + name);
}

std::string FolderResolver::nameForRole(FolderRole role) {
    switch (role) {
        case FolderRole::Inbox: return "Inbox";
        case FolderRole::Drafts: return "Drafts";
        case FolderRole::Sent: return "Sent";
        case FolderRole::Trash: return "Trash";
    }
    return "Inbox";
}

std::vector<std::string> FolderResolver::candidatesForRole(FolderRole role) {
    return FOLDER_ALIASES[role];
}

bool FolderResolver::isOutgoingRole(FolderRole role) {
    return role == FolderRole::Sent || role == FolderRole::Drafts;
}

SelectOutcome FolderResolver::outcomeForError(mailcore::ErrorCode err) {
    if (err == mailcore::ErrorNone) {
        return SelectOutcome::Selected;
    }
    GatewayErrorKind kind = GatewayException::kindForErrorCode(err);
    if (kind == GatewayErrorKind::ConnectorUnavailable || kind == GatewayErrorKind::InvalidCredentials) {
        return SelectOutcome::TransportFailure;
    }
    return SelectOutcome::Missing;
}

FolderResolution FolderResolver::resolve(FolderRole role, FolderIntent intent, FolderCommand select, FolderCommand create) {
    FolderResolution result;
    result.role = role;
    result.resolved = false;

    std::vector<std::string> candidates = candidatesForRole(role);

    for (const auto & path : candidates) {
        mailcore::ErrorCode err = select(path);
        SelectOutcome outcome = outcomeForError(err);
        result.attempts.push_back({path, false, outcome, err});

        if (outcome == SelectOutcome::Selected) {
            result.resolved = true;
            result.path = path;
            return result;
        }
        if (outcome == SelectOutcome::TransportFailure) {
            return result;
        }
    }

    if (intent != FolderIntent::Append || !create) {
        return result;
    }

    std::string primary = candidates.front();
    mailcore::ErrorCode err = create(primary);
    SelectOutcome outcome = outcomeForError(err);
    result.attempts.push_back({primary, true, outcome, err});
    if (outcome != SelectOutcome::Selected) {
        return result;
    }

    err = select(primary);
    outcome = outcomeForError(err);
    result.attempts.push_back({primary, false, outcome, err});
    if (outcome == SelectOutcome::Selected) {
        result.resolved = true;
        result.path = primary;
    }
    return result;
}
