#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>

#include "mailgate/gateway_exception.hpp"
#include "GatewayHarness.hpp"

using namespace mailcore;
using ::testing::HasSubstr;

class MailboxConnectorTest : public GatewayHarness {
protected:
    Credentials creds {"me@example.com", "hunter2"};

    bool sawCommand(std::string command) {
        return std::find(box.commands.begin(), box.commands.end(), command) != box.commands.end();
    }

    GatewayException probeFailure() {
        try {
            connector->probe(creds);
        } catch (GatewayException & ex) {
            return ex;
        }
        return GatewayException(GatewayErrorKind::OperationFailed, "no-exception", "probe succeeded");
    }
};

TEST_F(MailboxConnectorTest, ProbeSucceedsAndDisconnects) {
    connector->probe(creds);

    EXPECT_EQ(box.connections, 1);
    EXPECT_EQ(box.disconnects, 1);
    ASSERT_EQ(imapSessions.size(), 1u);
    EXPECT_STREQ(imapSessions[0]->hostname()->UTF8Characters(), "imap.migadu.com");
    EXPECT_EQ(imapSessions[0]->port(), 993u);
    EXPECT_STREQ(imapSessions[0]->username()->UTF8Characters(), "me@example.com");
}

TEST_F(MailboxConnectorTest, ProbeWithRejectedLoginIsInvalidCredentials) {
    box.loginError = ErrorAuthentication;

    GatewayException ex = probeFailure();
    EXPECT_EQ(ex.kind, GatewayErrorKind::InvalidCredentials);
    EXPECT_EQ(ex.statusCode(), 401);
    EXPECT_FALSE(ex.isRetryable());
    EXPECT_EQ(box.disconnects, 1);
}

TEST_F(MailboxConnectorTest, ProbeWithUnreachableServerIsConnectorUnavailable) {
    box.connectError = ErrorConnection;

    GatewayException ex = probeFailure();
    EXPECT_EQ(ex.kind, GatewayErrorKind::ConnectorUnavailable);
    EXPECT_EQ(ex.key, "ErrorConnection");
    EXPECT_TRUE(ex.isRetryable());
    EXPECT_EQ(ex.statusCode(), 500);
    EXPECT_EQ(box.disconnects, 1);
}

TEST_F(MailboxConnectorTest, ProbeTreatsUnexpectedLoginFailuresAsUnavailable) {
    box.loginError = ErrorCapability;

    GatewayException ex = probeFailure();
    EXPECT_EQ(ex.kind, GatewayErrorKind::ConnectorUnavailable);
    EXPECT_EQ(ex.key, "ErrorCapability");
}

TEST_F(MailboxConnectorTest, SelectFolderFallsBackToProviderAlias) {
    box.addFolder("[Gmail]/Sent Mail");
    {
        std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
        EXPECT_EQ(conn->selectFolder(FolderRole::Sent, FolderIntent::Read), "[Gmail]/Sent Mail");
    }
    EXPECT_TRUE(sawCommand("select Sent"));
    EXPECT_FALSE(sawCommand("create Sent"));
    EXPECT_EQ(box.disconnects, 1);
}

TEST_F(MailboxConnectorTest, SelectFolderReportsEveryAliasTried) {
    std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
    try {
        conn->selectFolder(FolderRole::Trash, FolderIntent::Read);
        FAIL() << "expected FolderUnavailable";
    } catch (GatewayException & ex) {
        EXPECT_EQ(ex.kind, GatewayErrorKind::FolderUnavailable);
        EXPECT_THAT(ex.debuginfo, HasSubstr("Trash"));
        EXPECT_THAT(ex.debuginfo, HasSubstr("Deleted Messages"));
    }
    EXPECT_FALSE(box.hasFolder("Trash"));
}

TEST_F(MailboxConnectorTest, SelectFolderStopsOnTransportFailure) {
    box.addFolder("[Gmail]/Sent Mail");
    box.selectErrors["Sent"] = ErrorConnection;

    std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
    try {
        conn->selectFolder(FolderRole::Sent, FolderIntent::Append);
        FAIL() << "expected ConnectorUnavailable";
    } catch (GatewayException & ex) {
        EXPECT_EQ(ex.kind, GatewayErrorKind::ConnectorUnavailable);
    }
    EXPECT_FALSE(sawCommand("select [Gmail]/Sent Mail"));
    EXPECT_FALSE(sawCommand("create Sent"));
}

TEST_F(MailboxConnectorTest, AppendIntentCreatesMissingFolder) {
    std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
    EXPECT_EQ(conn->selectFolder(FolderRole::Drafts, FolderIntent::Append), "Drafts");
    EXPECT_TRUE(box.hasFolder("Drafts"));
    EXPECT_FALSE(box.hasFolder("[Gmail]/Drafts"));
}

TEST_F(MailboxConnectorTest, RecentUIDsAreNewestFirstAndLimited) {
    for (int i = 0; i < 15; i++) {
        box.addMessage("INBOX", rawMessage("a@example.com", "me@example.com", "m" + std::to_string(i), "", "x"));
    }
    std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
    std::vector<uint32_t> uids = conn->recentUIDs("INBOX", 10);

    std::vector<uint32_t> expected = {15, 14, 13, 12, 11, 10, 9, 8, 7, 6};
    EXPECT_EQ(uids, expected);
    EXPECT_TRUE(conn->recentUIDs("INBOX", 0).empty());
}

TEST_F(MailboxConnectorTest, RecentUIDsOfAnEmptyFolder) {
    std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
    EXPECT_TRUE(conn->recentUIDs("INBOX", 10).empty());
}

TEST_F(MailboxConnectorTest, FetchRawOfUnknownUIDFails) {
    std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
    try {
        conn->fetchRaw("INBOX", 42);
        FAIL() << "expected message-not-found";
    } catch (GatewayException & ex) {
        EXPECT_EQ(ex.kind, GatewayErrorKind::OperationFailed);
        EXPECT_EQ(ex.key, "message-not-found");
    }
}

TEST_F(MailboxConnectorTest, AppendReturnsTheNewUID) {
    box.addFolder("Drafts");
    box.addMessage("Drafts", rawMessage("me@example.com", "a@example.com", "one", "", "x"));

    std::unique_ptr<IMAPConnection> conn = connector->openIMAP(creds);
    std::string raw = rawMessage("me@example.com", "a@example.com", "two", "", "y");
    Data * data = Data::dataWithBytes(raw.data(), (unsigned int)raw.size());

    EXPECT_EQ(conn->append("Drafts", data, MessageFlagDraft, time(0)), 2u);
    EXPECT_EQ(box.folders["Drafts"][2], raw);
}

TEST_F(MailboxConnectorTest, SubmitFailureIsRaised) {
    box.sendError = ErrorSendMessage;
    std::unique_ptr<SMTPConnection> smtp = connector->openSMTP(creds);

    Array * recipients = Array::array();
    recipients->addObject(Address::addressWithMailbox(MCSTR("a@example.com")));
    std::string raw = rawMessage("me@example.com", "a@example.com", "s", "", "b");

    EXPECT_THROW(smtp->submit(Address::addressWithMailbox(MCSTR("me@example.com")), recipients, Data::dataWithBytes(raw.data(), (unsigned int)raw.size())), GatewayException);
    EXPECT_TRUE(box.sent.empty());
}
