#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>

#include "mailrules/action_engine.hpp"
#include "mailrules/batch_exception.hpp"
#include "MockMailboxService.hpp"
#include "TestHelpers.hpp"

using namespace nlohmann;
using namespace std;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::StrictMock;
using ::testing::Throw;

class ActionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = new NiceMock<MockMailboxService>();
        session = new SessionContext(SessionConfig(json{
            {"processed_label", "processed"},
            {"unprocessed_label", "unprocessed"},
        }), service);

        t1 = makeThread("t1", {makeMessage("m1", "t1", 100, 11), makeMessage("m2", "t1", 200, 12)});
        t2 = makeThread("t2", {makeMessage("m3", "t2", 300, 13)});
        t3 = makeThread("t3", {makeMessage("m4", "t3", 400, 14)});
    }

    void TearDown() override {
        delete session;
        delete service;
    }

    MailAction actionFrom(string str) {
        return MailAction(json::parse(str));
    }

    MockMailboxService * service;
    SessionContext * session;
    shared_ptr<Thread> t1;
    shared_ptr<Thread> t2;
    shared_ptr<Thread> t3;
};

TEST_F(ActionEngineTest, PureLabelBatch) {
    EntityDataset<Thread> dataset;
    dataset.add(t1, actionFrom(R"({"labels_to_add": ["A"]})"));
    dataset.add(t2, actionFrom(R"({"labels_to_add": ["A"]})"));
    dataset.add(t3, actionFrom(R"({"labels_to_add": ["B"]})"));

    EXPECT_CALL(*service, addLabelToThreads(LabelNamed("A"), EntityIds(vector<string>{"t1", "t2"}))).Times(1);
    EXPECT_CALL(*service, addLabelToThreads(LabelNamed("B"), EntityIds(vector<string>{"t3"}))).Times(1);
    EXPECT_CALL(*service, addLabelToThreads(LabelNamed("processed"), EntityIds(vector<string>{"t1", "t2", "t3"}))).Times(1);
    EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("unprocessed"), EntityIds(vector<string>{"t1", "t2", "t3"}))).Times(1);
    EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("A"), _)).Times(0);
    EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("B"), _)).Times(0);

    ActionEngine<Thread> engine{service, session};
    DispatchReport report = engine.applyAllActions(dataset);

    EXPECT_EQ(report.entityCount(), 3u);
    EXPECT_EQ(report.callCount(), 4u);
    EXPECT_THAT(report.ops(), ElementsAre("add_label:A", "add_label:B", "add_label:processed", "remove_label:unprocessed"));
}

TEST_F(ActionEngineTest, AddsBeforeRemoving) {
    EntityDataset<Thread> dataset;
    dataset.add(t1, actionFrom(R"({"labels_to_add": ["X"], "labels_to_remove": ["X"]})"));

    {
        InSequence seq;
        EXPECT_CALL(*service, addLabelToThreads(LabelNamed("X"), EntityIds(vector<string>{"t1"})));
        EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("X"), EntityIds(vector<string>{"t1"})));
        EXPECT_CALL(*service, addLabelToThreads(LabelNamed("processed"), _));
        EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("unprocessed"), _));
    }

    ActionEngine<Thread> engine{service, session};
    engine.applyAllActions(dataset);
}

TEST_F(ActionEngineTest, DispatchesDimensionsInFixedOrder) {
    EntityDataset<Thread> dataset;
    dataset.add(t1, actionFrom(R"({"read": "thread_read", "important": "important", "move": "archive", "categories": ["updates"], "labels_to_remove": ["R"], "labels_to_add": ["A"]})"));

    {
        InSequence seq;
        EXPECT_CALL(*service, addLabelToThreads(LabelNamed("A"), _));
        EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("R"), _));
        EXPECT_CALL(*service, reassignThreadCategories(EntityId("t1"), _, _));
        EXPECT_CALL(*service, moveThreadsToArchive(EntityIds(vector<string>{"t1"})));
        EXPECT_CALL(*service, markThreadsImportant(EntityIds(vector<string>{"t1"})));
        EXPECT_CALL(*service, markThreadsRead(EntityIds(vector<string>{"t1"})));
        EXPECT_CALL(*service, addLabelToThreads(LabelNamed("processed"), _));
        EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("unprocessed"), _));
    }

    ActionEngine<Thread> engine{service, session};
    engine.applyAllActions(dataset);
}

TEST_F(ActionEngineTest, UnsetValuesNeverCallTheService) {
    EntityDataset<Thread> dataset;
    dataset.add(t1, MailAction());
    dataset.add(t2, MailAction());

    EXPECT_CALL(*service, reassignThreadCategories(_, _, _)).Times(0);
    EXPECT_CALL(*service, moveThreadsToInbox(_)).Times(0);
    EXPECT_CALL(*service, moveThreadsToArchive(_)).Times(0);
    EXPECT_CALL(*service, moveThreadsToTrash(_)).Times(0);
    EXPECT_CALL(*service, moveMessageToInbox(_)).Times(0);
    EXPECT_CALL(*service, moveMessageToArchive(_)).Times(0);
    EXPECT_CALL(*service, moveMessageToTrash(_)).Times(0);
    EXPECT_CALL(*service, markThreadsImportant(_)).Times(0);
    EXPECT_CALL(*service, markThreadsUnimportant(_)).Times(0);
    EXPECT_CALL(*service, markThreadsRead(_)).Times(0);
    EXPECT_CALL(*service, markThreadsUnread(_)).Times(0);
    EXPECT_CALL(*service, markMessagesRead(_)).Times(0);
    EXPECT_CALL(*service, markMessagesUnread(_)).Times(0);
    EXPECT_CALL(*service, addLabelToThreads(LabelNamed("processed"), EntityIds(vector<string>{"t1", "t2"}))).Times(1);
    EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("unprocessed"), EntityIds(vector<string>{"t1", "t2"}))).Times(1);

    ActionEngine<Thread> engine{service, session};
    engine.applyAllActions(dataset);
}

TEST_F(ActionEngineTest, CategoryReassignmentRemovesEveryOtherCategory) {
    EntityDataset<Thread> dataset;
    dataset.add(t1, actionFrom(R"({"categories": ["social"]})"));
    dataset.add(t2, actionFrom(R"({"labels_to_add": ["A"]})"));

    EXPECT_CALL(*service, reassignThreadCategories(EntityId("t1"),
        ElementsAre(MailCategory::Social),
        ElementsAre(MailCategory::Primary, MailCategory::Promotions, MailCategory::Updates, MailCategory::Forums))).Times(1);
    EXPECT_CALL(*service, reassignThreadCategories(EntityId("t2"), _, _)).Times(0);

    ActionEngine<Thread> engine{service, session};
    engine.applyAllActions(dataset);
}

TEST_F(ActionEngineTest, FailedCallSkipsLaterStepsAndBookkeeping) {
    EntityDataset<Thread> dataset;
    dataset.add(t1, actionFrom(R"({"labels_to_add": ["A"], "move": "trash", "read": "thread_read"})"));

    EXPECT_CALL(*service, addLabelToThreads(LabelNamed("A"), _)).Times(1);
    EXPECT_CALL(*service, moveThreadsToTrash(_)).WillOnce(Throw(BatchException(mailcore::ErrorConnection, "moveMessages")));
    EXPECT_CALL(*service, markThreadsRead(_)).Times(0);
    EXPECT_CALL(*service, addLabelToThreads(LabelNamed("processed"), _)).Times(0);
    EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("unprocessed"), _)).Times(0);

    ActionEngine<Thread> engine{service, session};
    try {
        engine.applyAllActions(dataset);
        FAIL() << "Expected an exception";
    } catch (BatchException & ex) {
        EXPECT_EQ(ex.key, "ErrorConnection");
        EXPECT_TRUE(ex.isRetryable());
    }
}

TEST_F(ActionEngineTest, MalformedInputStopsBeforeAnyCall) {
    StrictMock<MockMailboxService> strict;
    SessionContext strictSession{SessionConfig(json{{"unprocessed_label", "unprocessed"}}), &strict};

    EntityDataset<Thread> dataset;
    dataset.add(t1, actionFrom(R"({"labels_to_add": ["A"]})"));
    dataset.add(t2, actionFrom(R"({"labels_to_add": [""]})"));

    ActionEngine<Thread> engine{&strict, &strictSession};
    EXPECT_THROW(engine.applyAllActions(dataset), BatchException);
}

TEST_F(ActionEngineTest, MailboxWithoutLabelsIsRejectedBeforeAnyChange) {
    StrictMock<MockMailboxService> strict;
    SessionContext strictSession{SessionConfig(json{{"processed_label", "processed"}, {"unprocessed_label", "unprocessed"}}), &strict};
    EXPECT_CALL(strict, supportsLabels()).WillRepeatedly(testing::Return(false));

    EntityDataset<Thread> dataset;
    dataset.add(t1, actionFrom(R"({"move": "trash", "read": "thread_read"})"));

    ActionEngine<Thread> engine{&strict, &strictSession};
    try {
        engine.applyAllActions(dataset);
        FAIL() << "Expected an exception";
    } catch (BatchException & ex) {
        EXPECT_EQ(ex.key, "labels-unsupported");
        EXPECT_FALSE(ex.isMalformedInput());
    }
}

TEST_F(ActionEngineTest, EachRecordLandsInOneMoveGroup) {
    EntityDataset<Thread> dataset;
    MailAction trashed;
    trashed.setMoveState(MoveState::ToTrash);
    MailAction overwritten;
    overwritten.setMoveState(MoveState::ToArchive);
    EXPECT_THROW(overwritten.setMoveState(MoveState::ToTrash), BatchException);

    dataset.add(t1, trashed);
    dataset.add(t2, overwritten);

    EXPECT_CALL(*service, moveThreadsToTrash(EntityIds(vector<string>{"t1"}))).Times(1);
    EXPECT_CALL(*service, moveThreadsToArchive(EntityIds(vector<string>{"t2"}))).Times(1);
    EXPECT_CALL(*service, moveThreadsToInbox(_)).Times(0);

    ActionEngine<Thread> engine{service, session};
    engine.applyAllActions(dataset);
}

TEST_F(ActionEngineTest, EmptyDatasetMakesNoCalls) {
    StrictMock<MockMailboxService> strict;
    SessionContext strictSession{SessionConfig(json{{"processed_label", "processed"}, {"unprocessed_label", "unprocessed"}}), &strict};
    EntityDataset<Thread> dataset;

    ActionEngine<Thread> engine{&strict, &strictSession};
    DispatchReport report = engine.applyAllActions(dataset);

    EXPECT_EQ(report.callCount(), 0u);
    EXPECT_EQ(report.toJSON()["operations"], json::array());
}

TEST_F(ActionEngineTest, NoProcessedLabelOnlyRemovesUnprocessed) {
    SessionContext bare{SessionConfig(json{{"processed_label", ""}, {"unprocessed_label", "unprocessed"}}), service};
    EntityDataset<Thread> dataset;
    dataset.add(t1, MailAction());

    EXPECT_CALL(*service, addLabelToThreads(_, _)).Times(0);
    EXPECT_CALL(*service, removeLabelFromThreads(LabelNamed("unprocessed"), EntityIds(vector<string>{"t1"}))).Times(1);

    ActionEngine<Thread> engine{service, &bare};
    engine.applyAllActions(dataset);
}

TEST_F(ActionEngineTest, RecordMovesAtThreadGranularityMoveEachMessage) {
    EntityDataset<Thread> dataset;
    dataset.add(t1, actionFrom(R"({"move": "message_trash", "read": "message_unread"})"));

    EXPECT_CALL(*service, moveMessageToTrash(EntityId("m1"))).Times(1);
    EXPECT_CALL(*service, moveMessageToTrash(EntityId("m2"))).Times(1);
    EXPECT_CALL(*service, moveThreadsToTrash(_)).Times(0);
    EXPECT_CALL(*service, markMessagesUnread(EntityIds(vector<string>{"m1", "m2"}))).Times(1);

    ActionEngine<Thread> engine{service, session};
    DispatchReport report = engine.applyAllActions(dataset);

    EXPECT_THAT(report.ops(), ElementsAre("move_messages:message_trash", "mark_messages:message_unread", "add_label:processed", "remove_label:unprocessed"));
    EXPECT_EQ(report.entries[0].calls, 2u);
}

TEST_F(ActionEngineTest, LabelsAreResolvedOncePerSession) {
    EXPECT_CALL(*service, findOrCreateLabel("A")).Times(1);
    EXPECT_CALL(*service, findOrCreateLabel("processed")).Times(1);
    EXPECT_CALL(*service, findOrCreateLabel("unprocessed")).Times(1);

    ActionEngine<Thread> engine{service, session};
    for (int batch = 0; batch < 2; batch ++) {
        EntityDataset<Thread> dataset;
        dataset.add(t1, actionFrom(R"({"labels_to_add": ["A"]})"));
        engine.applyAllActions(dataset);
    }
}

// Message granularity

class MessageEngineTest : public ActionEngineTest {
protected:
    void SetUp() override {
        ActionEngineTest::SetUp();
        dataset.addThread(t1);
        dataset.addThread(t2);
    }

    shared_ptr<Message> messageOf(shared_ptr<Thread> thread, size_t index) {
        return thread->messages()[index];
    }

    EntityDataset<Message> dataset;
};

TEST_F(MessageEngineTest, ThreadLevelOperationsReachEachParentOnce) {
    dataset.add(messageOf(t1, 0), actionFrom(R"({"move": "archive", "read": "thread_read"})"));
    dataset.add(messageOf(t1, 1), actionFrom(R"({"move": "archive", "read": "thread_read"})"));
    dataset.add(messageOf(t2, 0), actionFrom(R"({"move": "archive"})"));

    EXPECT_CALL(*service, moveThreadsToArchive(EntityIds(vector<string>{"t1", "t2"}))).Times(1);
    EXPECT_CALL(*service, markThreadsRead(EntityIds(vector<string>{"t1"}))).Times(1);

    ActionEngine<Message> engine{service, session};
    engine.applyAllActions(dataset);
}

TEST_F(MessageEngineTest, UsesMessageOperations) {
    dataset.add(messageOf(t1, 0), actionFrom(R"({"labels_to_add": ["A"], "important": "unimportant", "categories": ["promotions"], "move": "message_inbox"})"));
    dataset.add(messageOf(t2, 0), actionFrom(R"({"read": "message_read"})"));

    EXPECT_CALL(*service, addLabelToMessages(LabelNamed("A"), EntityIds(vector<string>{"m1"}))).Times(1);
    EXPECT_CALL(*service, reassignMessageCategories(EntityId("m1"), ElementsAre(MailCategory::Promotions), _)).Times(1);
    EXPECT_CALL(*service, moveMessageToInbox(EntityId("m1"))).Times(1);
    EXPECT_CALL(*service, markMessagesUnimportant(EntityIds(vector<string>{"m1"}))).Times(1);
    EXPECT_CALL(*service, markMessagesRead(EntityIds(vector<string>{"m3"}))).Times(1);
    EXPECT_CALL(*service, addLabelToMessages(LabelNamed("processed"), EntityIds(vector<string>{"m1", "m3"}))).Times(1);
    EXPECT_CALL(*service, removeLabelFromMessages(LabelNamed("unprocessed"), EntityIds(vector<string>{"m1", "m3"}))).Times(1);
    EXPECT_CALL(*service, addLabelToThreads(_, _)).Times(0);

    ActionEngine<Message> engine{service, session};
    engine.applyAllActions(dataset);
}

TEST_F(MessageEngineTest, MissingParentThreadIsMalformed) {
    auto orphan = makeMessage("m9", "t9", 900);
    dataset.add(messageOf(t1, 0), actionFrom(R"({"labels_to_add": ["A"]})"));
    dataset.add(orphan, actionFrom(R"({"labels_to_add": ["A"], "move": "trash"})"));

    EXPECT_CALL(*service, addLabelToMessages(_, _)).Times(0);
    EXPECT_CALL(*service, removeLabelFromMessages(_, _)).Times(0);
    EXPECT_CALL(*service, moveThreadsToTrash(_)).Times(0);

    ActionEngine<Message> engine{service, session};
    try {
        engine.applyAllActions(dataset);
        FAIL() << "Expected an exception";
    } catch (BatchException & ex) {
        EXPECT_TRUE(ex.isMalformedInput());
    }
}
