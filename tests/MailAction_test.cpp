#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mailrules/mail_action.hpp"
#include "mailrules/batch_exception.hpp"

using namespace nlohmann;
using namespace std;
using ::testing::ElementsAre;

TEST(MailActionTest, DefaultsToUnset) {
    MailAction action;
    EXPECT_EQ(action.moveState(), MoveState::Unset);
    EXPECT_EQ(action.importance(), ImportanceState::Unset);
    EXPECT_EQ(action.readState(), ReadState::Unset);
    EXPECT_TRUE(action.labelsToAdd.empty());
    EXPECT_TRUE(action.categories.empty());
    EXPECT_TRUE(action.isEmpty());
    EXPECT_EQ(action.toJSON(), json::object());
}

TEST(MailActionTest, ParsesEveryField) {
    MailAction action(json::parse(R"({
        "labels_to_add": ["Receipts", "Finance"],
        "labels_to_remove": ["Later"],
        "categories": ["social"],
        "move": "message_trash",
        "important": "unimportant",
        "read": "thread_read"
    })"));

    EXPECT_EQ(action.labelsToAdd, (set<string>{"Finance", "Receipts"}));
    EXPECT_EQ(action.labelsToRemove, (set<string>{"Later"}));
    EXPECT_EQ(action.categories, (set<MailCategory>{MailCategory::Social}));
    EXPECT_EQ(action.moveState(), MoveState::RecordToTrash);
    EXPECT_EQ(action.importance(), ImportanceState::MarkUnimportant);
    EXPECT_EQ(action.readState(), ReadState::ThreadRead);
    EXPECT_FALSE(action.isEmpty());
}

TEST(MailActionTest, SerializesOnlyWhatIsSet) {
    MailAction action;
    action.labelsToAdd.insert("A");
    action.setMoveState(MoveState::ToArchive);

    json expected = {{"labels_to_add", json::array({"A"})}, {"move", "archive"}};
    EXPECT_EQ(action.toJSON(), expected);
}

TEST(MailActionTest, RejectsUnknownValues) {
    try {
        MailAction action(json::parse(R"({"move": "sideways"})"));
        FAIL() << "Expected an exception";
    } catch (BatchException & ex) {
        EXPECT_TRUE(ex.isMalformedInput());
        EXPECT_FALSE(ex.isRetryable());
    }
    EXPECT_THROW(MailAction(json::parse(R"({"categories": ["newsletters"]})")), BatchException);
    EXPECT_THROW(MailAction(json::parse(R"({"labels_to_add": [1, 2]})")), BatchException);
    EXPECT_THROW(MailAction(json::parse(R"({"read": true})")), BatchException);
    EXPECT_THROW(MailAction(json::parse(R"(["not", "an", "object"])")), BatchException);
}

TEST(MailActionTest, EnumFieldsAreWrittenOnce) {
    MailAction action;
    action.setMoveState(MoveState::ToTrash);
    EXPECT_NO_THROW(action.setMoveState(MoveState::ToTrash));
    EXPECT_THROW(action.setMoveState(MoveState::ToArchive), BatchException);
    EXPECT_EQ(action.moveState(), MoveState::ToTrash);

    action.setImportance(ImportanceState::MarkImportant);
    EXPECT_THROW(action.setImportance(ImportanceState::MarkUnimportant), BatchException);

    action.setReadState(ReadState::RecordUnread);
    EXPECT_THROW(action.setReadState(ReadState::Unset), BatchException);
}

TEST(MailActionTest, ComplementFollowsCategoryOrder) {
    EXPECT_THAT(MailActionUtils::complementOf({MailCategory::Social}),
        ElementsAre(MailCategory::Primary, MailCategory::Promotions, MailCategory::Updates, MailCategory::Forums));
    EXPECT_TRUE(MailActionUtils::complementOf(set<MailCategory>(ALL_MAIL_CATEGORIES.begin(), ALL_MAIL_CATEGORIES.end())).empty());
}

TEST(MailActionTest, RecordLevelVariants) {
    EXPECT_TRUE(MailActionUtils::isRecordLevel(MoveState::RecordToInbox));
    EXPECT_FALSE(MailActionUtils::isRecordLevel(MoveState::ToInbox));
    EXPECT_TRUE(MailActionUtils::isRecordLevel(ReadState::RecordRead));
    EXPECT_FALSE(MailActionUtils::isRecordLevel(ReadState::ThreadUnread));
}
