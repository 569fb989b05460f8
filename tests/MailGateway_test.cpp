#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mailgate/gateway_exception.hpp"
#include "GatewayHarness.hpp"

using namespace mailcore;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class MailGatewayTest : public GatewayHarness {
protected:
    template <typename Fn>
    GatewayException failureOf(Fn fn) {
        try {
            fn();
        } catch (GatewayException & ex) {
            return ex;
        }
        return GatewayException(GatewayErrorKind::OperationFailed, "no-exception", "operation succeeded");
    }
};

// login

TEST_F(MailGatewayTest, LoginIssuesAUsableToken) {
    std::string token = gateway->login("me@example.com", "hunter2");

    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(store->resolve(token).emailAddress, "me@example.com");
    EXPECT_EQ(box.disconnects, 1);
}

TEST_F(MailGatewayTest, LoginWithWrongPasswordCreatesNoSession) {
    box.loginError = ErrorAuthentication;

    GatewayException ex = failureOf([&]() { gateway->login("me@example.com", "wrong"); });
    EXPECT_EQ(ex.kind, GatewayErrorKind::InvalidCredentials);
    EXPECT_EQ(ex.stage, "connect");
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(MailGatewayTest, LoginWithUnreachableServerCreatesNoSession) {
    box.connectError = ErrorConnection;

    GatewayException ex = failureOf([&]() { gateway->login("me@example.com", "hunter2"); });
    EXPECT_EQ(ex.kind, GatewayErrorKind::ConnectorUnavailable);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(MailGatewayTest, LoginRequiresBothFields) {
    EXPECT_EQ(failureOf([&]() { gateway->login("", "hunter2"); }).kind, GatewayErrorKind::BadRequest);
    EXPECT_EQ(failureOf([&]() { gateway->login("me@example.com", ""); }).kind, GatewayErrorKind::BadRequest);
    EXPECT_EQ(box.connections, 0);
}

// session enforcement

TEST_F(MailGatewayTest, EveryOperationRejectsUnknownTokensBeforeConnecting) {
    EXPECT_EQ(failureOf([&]() { gateway->listFolder("bogus", "Inbox"); }).kind, GatewayErrorKind::Unauthenticated);
    EXPECT_EQ(failureOf([&]() { gateway->fetchDetail("bogus", "1"); }).kind, GatewayErrorKind::Unauthenticated);
    EXPECT_EQ(failureOf([&]() { gateway->saveDraft("bogus", "a@example.com", "s", "b"); }).kind, GatewayErrorKind::Unauthenticated);
    EXPECT_EQ(failureOf([&]() { gateway->send("bogus", "a@example.com", "s", "b"); }).kind, GatewayErrorKind::Unauthenticated);

    EXPECT_EQ(box.connections, 0);
    EXPECT_TRUE(imapSessions.empty());
    EXPECT_TRUE(smtpSessions.empty());
}

// listFolder

TEST_F(MailGatewayTest, ListFolderReturnsTenNewestFirst) {
    for (int i = 1; i <= 12; i++) {
        box.addMessage("INBOX", rawMessage("sender" + std::to_string(i) + "@example.com", "me@example.com", "Message " + std::to_string(i), "Mon, 1 Jan 2024 10:00:00 +0000", "Body " + std::to_string(i)));
    }

    std::vector<MessageEnvelope> list = gateway->listFolder(loggedInToken(), "Inbox");

    ASSERT_EQ(list.size(), 10u);
    EXPECT_EQ(list[0].id(), "12");
    EXPECT_EQ(list[0].subject(), "Message 12");
    EXPECT_THAT(list[0].counterpart(), HasSubstr("sender12@example.com"));
    EXPECT_THAT(list[0].preview(), StartsWith("Body 12"));
    EXPECT_EQ(list[9].id(), "3");
    EXPECT_EQ(box.disconnects, 1);
}

TEST_F(MailGatewayTest, ListFolderOfEmptyFolderIsEmpty) {
    EXPECT_TRUE(gateway->listFolder(loggedInToken(), "INBOX").empty());
}

TEST_F(MailGatewayTest, ListSentShowsRecipients) {
    box.addFolder("Sent Items");
    box.addMessage("Sent Items", rawMessage("me@example.com", "friend@example.com", "Hi", "", "Hello"));

    std::vector<MessageEnvelope> list = gateway->listFolder(loggedInToken(), "Sent");

    ASSERT_EQ(list.size(), 1u);
    EXPECT_THAT(list[0].counterpart(), HasSubstr("friend@example.com"));
    EXPECT_FALSE(box.hasFolder("Sent"));
}

TEST_F(MailGatewayTest, GmailSentNameListsTheSameFolderAsSent) {
    box.addFolder("Sent");
    box.addMessage("Sent", rawMessage("me@example.com", "a@example.com", "First", "", "One"));
    box.addMessage("Sent", rawMessage("me@example.com", "b@example.com", "Second", "", "Two"));
    std::string token = loggedInToken();

    std::vector<MessageEnvelope> plain = gateway->listFolder(token, "Sent");
    std::vector<MessageEnvelope> gmail = gateway->listFolder(token, "[Gmail]/Sent Mail");

    ASSERT_EQ(plain.size(), 2u);
    ASSERT_EQ(gmail.size(), plain.size());
    for (size_t i = 0; i < plain.size(); i++) {
        EXPECT_EQ(gmail[i].id(), plain[i].id());
        EXPECT_EQ(gmail[i].subject(), plain[i].subject());
        EXPECT_EQ(gmail[i].counterpart(), plain[i].counterpart());
    }
    EXPECT_FALSE(box.hasFolder("[Gmail]/Sent Mail"));
}

TEST_F(MailGatewayTest, RejectedLoginDuringAnOperationIsNotAnAuthFailure) {
    std::string token = loggedInToken();
    box.loginError = ErrorAuthentication;

    GatewayException ex = failureOf([&]() { gateway->listFolder(token, "Inbox"); });
    EXPECT_EQ(ex.kind, GatewayErrorKind::OperationFailed);
    EXPECT_EQ(ex.statusCode(), 500);
    EXPECT_EQ(ex.stage, "connect");
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(store->resolve(token).emailAddress, "me@example.com");
}

TEST_F(MailGatewayTest, ListFolderRejectsUnknownFolderNames) {
    GatewayException ex = failureOf([&]() { gateway->listFolder(loggedInToken(), "Spam"); });
    EXPECT_EQ(ex.kind, GatewayErrorKind::BadRequest);
    EXPECT_EQ(ex.debuginfo, "Invalid folder: Spam");
    EXPECT_EQ(box.connections, 0);
}

TEST_F(MailGatewayTest, ListFolderReportsMissingFolder) {
    GatewayException ex = failureOf([&]() { gateway->listFolder(loggedInToken(), "Trash"); });
    EXPECT_EQ(ex.kind, GatewayErrorKind::FolderUnavailable);
    EXPECT_EQ(ex.stage, "resolve-folder");
    EXPECT_EQ(box.disconnects, 1);
}

TEST_F(MailGatewayTest, ListFolderFailuresCarryTheirStage) {
    box.searchError = ErrorFetchMessageList;
    GatewayException ex = failureOf([&]() { gateway->listFolder(loggedInToken(), "Inbox"); });
    EXPECT_EQ(ex.kind, GatewayErrorKind::OperationFailed);
    EXPECT_EQ(ex.stage, "search");
    EXPECT_EQ(box.disconnects, 1);
}

// fetchDetail

TEST_F(MailGatewayTest, FetchDetailReturnsTheFullMessage) {
    uint32_t uid = box.addMessage("INBOX", rawMessage("alice@example.com", "me@example.com", "Report", "Tue, 2 Jan 2024 09:00:00 +0000", "The full body"));

    MessageDetail detail = gateway->fetchDetail(loggedInToken(), std::to_string(uid));

    EXPECT_EQ(detail.id(), std::to_string(uid));
    EXPECT_THAT(detail.from(), HasSubstr("alice@example.com"));
    EXPECT_THAT(detail.to(), HasSubstr("me@example.com"));
    EXPECT_EQ(detail.subject(), "Report");
    EXPECT_EQ(detail.date(), "Tue, 2 Jan 2024 09:00:00 +0000");
    EXPECT_THAT(detail.body(), StartsWith("The full body"));
}

TEST_F(MailGatewayTest, FetchDetailRejectsMalformedIds) {
    std::string token = loggedInToken();
    EXPECT_EQ(failureOf([&]() { gateway->fetchDetail(token, "abc"); }).kind, GatewayErrorKind::BadRequest);
    EXPECT_EQ(failureOf([&]() { gateway->fetchDetail(token, ""); }).kind, GatewayErrorKind::BadRequest);
    EXPECT_EQ(failureOf([&]() { gateway->fetchDetail(token, "0"); }).kind, GatewayErrorKind::BadRequest);
    EXPECT_EQ(failureOf([&]() { gateway->fetchDetail(token, "99999999999"); }).kind, GatewayErrorKind::BadRequest);
    EXPECT_EQ(box.connections, 0);
}

TEST_F(MailGatewayTest, FetchDetailOfMissingMessageFails) {
    GatewayException ex = failureOf([&]() { gateway->fetchDetail(loggedInToken(), "5"); });
    EXPECT_EQ(ex.key, "message-not-found");
    EXPECT_EQ(ex.stage, "fetch");
}

// saveDraft

TEST_F(MailGatewayTest, SavedDraftIsListedAndFetchable) {
    std::string token = loggedInToken();
    gateway->saveDraft(token, "friend@example.com", "Plans", "Draft body");

    EXPECT_TRUE(box.hasFolder("Drafts"));
    std::vector<MessageEnvelope> list = gateway->listFolder(token, "Drafts");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].subject(), "Plans");
    EXPECT_THAT(list[0].counterpart(), HasSubstr("friend@example.com"));

    MessageDetail detail = gateway->fetchDetail(token, list[0].id(), "Drafts");
    EXPECT_THAT(detail.body(), StartsWith("Draft body"));
    EXPECT_THAT(detail.from(), HasSubstr("me@example.com"));
    EXPECT_TRUE(box.sent.empty());
    EXPECT_EQ(box.appendedFlags["Drafts"], std::vector<MessageFlag>{MessageFlagDraft});
}

TEST_F(MailGatewayTest, LongDraftBodyIsPreviewedAndFetchedWhole) {
    std::string body = "";
    for (int i = 0; i < 150; i++) {
        body += (char)('a' + i % 26);
    }
    std::string token = loggedInToken();
    gateway->saveDraft(token, "friend@example.com", "Long", body);

    std::vector<MessageEnvelope> list = gateway->listFolder(token, "Drafts");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].preview(), body.substr(0, 100));

    MessageDetail detail = gateway->fetchDetail(token, list[0].id(), "Drafts");
    EXPECT_THAT(detail.body(), StartsWith(body));
}

TEST_F(MailGatewayTest, NonAsciiDraftSurvivesTheRoundTrip) {
    std::string token = loggedInToken();
    gateway->saveDraft(token, "friend@example.com", "Grüße", "Schöne Grüße aus Köln");

    std::vector<MessageEnvelope> list = gateway->listFolder(token, "Drafts");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].subject(), "Grüße");

    MessageDetail detail = gateway->fetchDetail(token, list[0].id(), "Drafts");
    EXPECT_THAT(detail.body(), StartsWith("Schöne Grüße aus Köln"));
}

TEST_F(MailGatewayTest, SaveDraftUsesTheGmailAliasWhenPresent) {
    box.addFolder("[Gmail]/Drafts");
    gateway->saveDraft(loggedInToken(), "friend@example.com", "Plans", "Draft body");

    EXPECT_FALSE(box.hasFolder("Drafts"));
    EXPECT_EQ(box.folders["[Gmail]/Drafts"].size(), 1u);
}

TEST_F(MailGatewayTest, SaveDraftFailsWhenAppendFails) {
    box.addFolder("Drafts");
    box.appendErrors["Drafts"] = ErrorAppend;

    GatewayException ex = failureOf([&]() { gateway->saveDraft(loggedInToken(), "friend@example.com", "s", "b"); });
    EXPECT_EQ(ex.stage, "append");
    EXPECT_EQ(ex.statusCode(), 500);
}

TEST_F(MailGatewayTest, SaveDraftRejectsUnusableRecipients) {
    GatewayException ex = failureOf([&]() { gateway->saveDraft(loggedInToken(), "", "s", "b"); });
    EXPECT_EQ(ex.kind, GatewayErrorKind::BadRequest);
    EXPECT_EQ(ex.stage, "compose");
    EXPECT_EQ(box.connections, 0);
}

// send

TEST_F(MailGatewayTest, SendDeliversAndArchivesToSent) {
    box.addFolder("Sent");
    SendReceipt receipt = gateway->send(loggedInToken(), "friend@example.com", "Hello", "Message body");

    ASSERT_EQ(box.sent.size(), 1u);
    EXPECT_THAT(box.sent[0], HasSubstr("Hello"));
    EXPECT_TRUE(receipt.archived());
    EXPECT_EQ(receipt.archiveFolder(), "Sent");
    EXPECT_EQ(receipt.warning(), "");
    EXPECT_EQ(box.folders["Sent"].size(), 1u);
    EXPECT_EQ(box.appendedFlags["Sent"], std::vector<MessageFlag>{MessageFlagSeen});
}

TEST_F(MailGatewayTest, SendCreatesSentWhenNoAliasExists) {
    SendReceipt receipt = gateway->send(loggedInToken(), "friend@example.com", "Hello", "Message body");

    EXPECT_TRUE(receipt.archived());
    EXPECT_TRUE(box.hasFolder("Sent"));
}

TEST_F(MailGatewayTest, SendSucceedsWhenArchivingFails) {
    box.createError = ErrorCreate;

    SendReceipt receipt = gateway->send(loggedInToken(), "friend@example.com", "Hello", "Message body");

    EXPECT_EQ(box.sent.size(), 1u);
    EXPECT_FALSE(receipt.archived());
    EXPECT_THAT(receipt.warning(), HasSubstr("Sent"));
}

TEST_F(MailGatewayTest, SendSucceedsWhenTheArchiveConnectionFails) {
    box.addFolder("Sent");
    box.selectErrors["Sent"] = ErrorConnection;

    SendReceipt receipt = gateway->send(loggedInToken(), "friend@example.com", "Hello", "Message body");

    EXPECT_EQ(box.sent.size(), 1u);
    EXPECT_FALSE(receipt.archived());
    EXPECT_EQ(box.disconnects, 1);
}

TEST_F(MailGatewayTest, SendFailureIsFatalAndNothingIsArchived) {
    box.addFolder("Sent");
    box.sendError = ErrorSendMessage;

    GatewayException ex = failureOf([&]() { gateway->send(loggedInToken(), "friend@example.com", "Hello", "b"); });
    EXPECT_EQ(ex.stage, "submit");
    EXPECT_EQ(ex.statusCode(), 500);
    EXPECT_TRUE(box.folders["Sent"].empty());
    EXPECT_TRUE(imapSessions.empty());
}

TEST_F(MailGatewayTest, SmtpAuthenticationFailureOnSendIsAServerError) {
    box.sendError = ErrorAuthentication;

    GatewayException ex = failureOf([&]() { gateway->send(loggedInToken(), "friend@example.com", "Hello", "b"); });
    EXPECT_EQ(ex.kind, GatewayErrorKind::OperationFailed);
    EXPECT_EQ(ex.statusCode(), 500);
    EXPECT_EQ(ex.stage, "submit");
    EXPECT_EQ(ex.key, "ErrorAuthentication");
}

TEST_F(MailGatewayTest, SendToSeveralRecipients) {
    gateway->send(loggedInToken(), "a@example.com, B <b@example.com>", "Hello", "b");

    std::vector<std::string> sends;
    for (const auto & command : box.commands) {
        if (command.find("send") == 0) sends.push_back(command);
    }
    EXPECT_EQ(sends, std::vector<std::string>{"send 2"});
}

// logout / health

TEST_F(MailGatewayTest, LogoutIsIdempotentAndRevokesTheToken) {
    std::string token = loggedInToken();

    gateway->logout(token);
    gateway->logout(token);
    gateway->logout("never-issued");

    EXPECT_EQ(failureOf([&]() { gateway->listFolder(token, "Inbox"); }).kind, GatewayErrorKind::Unauthenticated);
}

TEST_F(MailGatewayTest, HealthReportsSessionCount) {
    loggedInToken();
    loggedInToken();

    nlohmann::json health = gateway->health();
    EXPECT_EQ(health["status"], "OK");
    EXPECT_EQ(health["sessions"], 2);
    EXPECT_EQ(box.connections, 0);
}
