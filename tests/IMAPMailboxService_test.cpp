#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>

#include "mailrules/imap_mailbox_service.hpp"
#include "mailrules/batch_exception.hpp"
#include "mailrules/models/account.hpp"
#include "MockIMAPSession.hpp"
#include "TestHelpers.hpp"

using namespace mailcore;
using namespace nlohmann;
using namespace std;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::NiceMock;

class IMAPMailboxServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        json accountData = {
            {"id", "test-account"},
            {"provider", "gmail"},
            {"email_address", "test@gmail.com"},
            {"settings", {
                {"imap_host", "imap.gmail.com"},
                {"imap_port", 993},
                {"imap_username", "test@gmail.com"},
                {"imap_password", "password"},
            }}
        };
        account = make_shared<Account>(accountData);

        session = new NiceMock<MockIMAPSession>();
        session->addMockFolder("INBOX", IMAPFolderFlagInbox);
        session->addMockFolder("[Gmail]/All Mail", IMAPFolderFlagAll);
        session->addMockFolder("[Gmail]/Important", IMAPFolderFlagImportant);
        session->addMockFolder("[Gmail]/Trash", IMAPFolderFlagTrash);
        session->addMockFolder("[Gmail]/Spam", IMAPFolderFlagJunk);
        session->addMockFolder("Receipts", IMAPFolderFlagNone);
        session->addMockFolder("[Mailrules]/Social", IMAPFolderFlagNone);
        session->recordRequests();

        service = new IMAPMailboxService(session, account, SessionConfig(json{{"unprocessed_label", "pending"}}));
    }

    void TearDown() override {
        delete service;
        delete session;
    }

    AutoreleasePool pool;
    shared_ptr<Account> account;
    MockIMAPSession * session;
    IMAPMailboxService * service;
};

TEST_F(IMAPMailboxServiceTest, AssignsRolesToFolders) {
    EXPECT_EQ(service->folderWithRole("inbox")->path(), "INBOX");
    EXPECT_EQ(service->folderWithRole("all")->path(), "[Gmail]/All Mail");
    EXPECT_EQ(service->folderWithRole("trash")->path(), "[Gmail]/Trash");
    EXPECT_EQ(service->folderWithRole("spam")->path(), "[Gmail]/Spam");
    EXPECT_EQ(service->folderWithRole("archive"), nullptr);
}

TEST_F(IMAPMailboxServiceTest, FetchesFoldersOnce) {
    EXPECT_CALL(*session, fetchAllFolders(_)).Times(1);

    service->findOrCreateLabel("Receipts");
    service->findOrCreateLabel("INBOX");
    service->folderWithRole("trash");
}

TEST_F(IMAPMailboxServiceTest, FindsExistingLabelsAndCreatesMissingOnes) {
    EXPECT_CALL(*session, createFolder(_, _)).Times(1);

    auto existing = service->findOrCreateLabel("Receipts");
    EXPECT_EQ(existing->path(), "Receipts");
    EXPECT_EQ(service->findOrCreateLabel("inbox")->role(), "inbox");

    auto created = service->findOrCreateLabel("Newsletters");
    EXPECT_EQ(created->path(), "Newsletters");
    EXPECT_EQ(service->findOrCreateLabel("Newsletters").get(), created.get());
}

TEST_F(IMAPMailboxServiceTest, GroupsUIDsByFolder) {
    auto label = service->findOrCreateLabel("Receipts");
    vector<shared_ptr<Message>> messages = {
        makeMessage("m1", "t1", 100, 5, "[Gmail]/All Mail"),
        makeMessage("m2", "t1", 200, 6, "[Gmail]/All Mail"),
        makeMessage("m3", "t2", 300, 9, "[Gmail]/Spam"),
    };

    service->addLabelToMessages(label, messages);

    ASSERT_EQ(session->requests.size(), 2u);
    EXPECT_EQ(session->requests[0].folder, "[Gmail]/All Mail");
    EXPECT_THAT(session->requests[0].uids, ElementsAre(5, 6));
    EXPECT_EQ(session->requests[0].kind, IMAPStoreFlagsRequestKindAdd);
    EXPECT_THAT(session->requests[0].values, ElementsAre("Receipts"));
    EXPECT_EQ(session->requests[1].folder, "[Gmail]/Spam");
    EXPECT_THAT(session->requests[1].uids, ElementsAre(9));
}

TEST_F(IMAPMailboxServiceTest, ThreadOperationsReachEveryMessage) {
    auto thread = makeThread("t1", {makeMessage("m1", "t1", 100, 5), makeMessage("m2", "t1", 200, 6)});

    service->markThreadsUnread({thread});

    ASSERT_EQ(session->requests.size(), 1u);
    EXPECT_EQ(session->requests[0].op, "flags");
    EXPECT_THAT(session->requests[0].uids, ElementsAre(5, 6));
    EXPECT_EQ(session->requests[0].kind, IMAPStoreFlagsRequestKindRemove);
    EXPECT_THAT(session->requests[0].values, ElementsAre(to_string((int)MessageFlagSeen)));
}

TEST_F(IMAPMailboxServiceTest, SystemLabelsUseGmailKeys) {
    auto msgs = vector<shared_ptr<Message>>{makeMessage("m1", "t1", 100, 5)};

    service->removeLabelFromMessages(service->findOrCreateLabel("INBOX"), msgs);
    service->markMessagesImportant(msgs);

    ASSERT_EQ(session->requests.size(), 2u);
    EXPECT_THAT(session->requests[0].values, ElementsAre("\\Inbox"));
    EXPECT_EQ(session->requests[0].kind, IMAPStoreFlagsRequestKindRemove);
    EXPECT_THAT(session->requests[1].values, ElementsAre("\\Important"));
    EXPECT_EQ(session->requests[1].kind, IMAPStoreFlagsRequestKindAdd);
}

TEST_F(IMAPMailboxServiceTest, CategoriesAddRequestedAndRemoveExistingOthers) {
    auto msg = makeMessage("m1", "t1", 100, 5);

    service->reassignMessageCategories(msg, {MailCategory::Promotions}, MailActionUtils::complementOf({MailCategory::Promotions}));

    // [Mailrules]/Promotions is created, only [Mailrules]/Social exists to be removed.
    ASSERT_EQ(session->requests.size(), 3u);
    EXPECT_EQ(session->requests[0].op, "create");
    EXPECT_EQ(session->requests[0].folder, "[Mailrules]/Promotions");
    EXPECT_THAT(session->requests[1].values, ElementsAre("[Mailrules]/Promotions"));
    EXPECT_EQ(session->requests[1].kind, IMAPStoreFlagsRequestKindAdd);
    EXPECT_THAT(session->requests[2].values, ElementsAre("[Mailrules]/Social"));
    EXPECT_EQ(session->requests[2].kind, IMAPStoreFlagsRequestKindRemove);
}

TEST_F(IMAPMailboxServiceTest, ArchiveOnGmailRemovesInboxLabel) {
    auto thread = makeThread("t1", {makeMessage("m1", "t1", 100, 5)});

    service->moveThreadsToArchive({thread});

    ASSERT_EQ(session->requests.size(), 1u);
    EXPECT_EQ(session->requests[0].op, "labels");
    EXPECT_THAT(session->requests[0].values, ElementsAre("\\Inbox"));
    EXPECT_EQ(session->requests[0].kind, IMAPStoreFlagsRequestKindRemove);
}

TEST_F(IMAPMailboxServiceTest, TrashMoveUpdatesRemoteLocation) {
    auto msg = makeMessage("m1", "t1", 100, 5, "[Gmail]/All Mail");

    service->moveMessageToTrash(msg);

    ASSERT_EQ(session->requests.size(), 1u);
    EXPECT_EQ(session->requests[0].op, "move");
    EXPECT_THAT(session->requests[0].values, ElementsAre("[Gmail]/Trash"));
    EXPECT_EQ(msg->remoteFolderPath(), "[Gmail]/Trash");
    EXPECT_EQ(msg->remoteUID(), 1000u);

    // Later operations address the message where it now lives.
    service->markMessagesRead({msg});
    EXPECT_EQ(session->requests[1].folder, "[Gmail]/Trash");
    EXPECT_THAT(session->requests[1].uids, ElementsAre(1000));
}

TEST_F(IMAPMailboxServiceTest, InboxOnGmailRescuesTrashedMessagesFirst) {
    auto trashed = makeMessage("m1", "t1", 100, 7, "[Gmail]/Trash");
    auto archived = makeMessage("m2", "t1", 200, 8, "[Gmail]/All Mail");

    service->moveThreadsToInbox({makeThread("t1", {trashed, archived})});

    ASSERT_EQ(session->requests.size(), 3u);
    EXPECT_EQ(session->requests[0].op, "move");
    EXPECT_EQ(session->requests[0].folder, "[Gmail]/Trash");
    EXPECT_THAT(session->requests[0].values, ElementsAre("INBOX"));
    EXPECT_EQ(session->requests[1].op, "labels");
    EXPECT_EQ(session->requests[2].op, "labels");
    EXPECT_THAT(session->requests[2].values, ElementsAre("\\Inbox"));
}

TEST_F(IMAPMailboxServiceTest, LabelsRequireGmail) {
    session->setMockIsGmail(false);
    auto label = make_shared<Label>("l1", "test-account", 0);
    label->setPath("Receipts");

    try {
        service->addLabelToMessages(label, {makeMessage("m1", "t1", 100, 5)});
        FAIL() << "Expected an exception";
    } catch (BatchException & ex) {
        EXPECT_EQ(ex.key, "labels-unsupported");
        EXPECT_FALSE(ex.isRetryable());
    }
    EXPECT_TRUE(session->requests.empty());
}

TEST_F(IMAPMailboxServiceTest, OtherServersCannotRunBatches) {
    EXPECT_TRUE(service->supportsLabels());
    session->setMockIsGmail(false);
    EXPECT_FALSE(service->supportsLabels());

    auto msg = makeMessage("m1", "t1", 100, 5, "INBOX");
    try {
        service->moveMessageToTrash(msg);
        FAIL() << "Expected an exception";
    } catch (BatchException & ex) {
        EXPECT_EQ(ex.key, "labels-unsupported");
    }
    EXPECT_TRUE(session->requests.empty());
    EXPECT_EQ(msg->remoteFolderPath(), "INBOX");
}

TEST_F(IMAPMailboxServiceTest, ServerErrorsBecomeBatchExceptions) {
    EXPECT_CALL(*session, storeFlagsByUID(_, _, _, _, _)).WillOnce(testing::SetArgPointee<4>(ErrorConnection));

    try {
        service->markMessagesRead({makeMessage("m1", "t1", 100, 5)});
        FAIL() << "Expected an exception";
    } catch (BatchException & ex) {
        EXPECT_EQ(ex.key, "ErrorConnection");
        EXPECT_TRUE(ex.isRetryable());
    }
}
