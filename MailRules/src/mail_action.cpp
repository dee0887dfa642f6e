#include "mailrules/mail_action.hpp"
#include "mailrules/batch_exception.hpp"

using namespace std;
using namespace nlohmann;


string MailActionUtils::toString(MailCategory category) {
    switch (category) {
        case MailCategory::Primary:
            return "primary";
        case MailCategory::Social:
            return "social";
        case MailCategory::Promotions:
            return "promotions";
        case MailCategory::Updates:
            return "updates";
        case MailCategory::Forums:
            return "forums";
        default:
            return "unknown";
    }
}

string MailActionUtils::toString(MoveState state) {
    switch (state) {
        case MoveState::Unset:
            return "";
        case MoveState::ToInbox:
            return "inbox";
        case MoveState::ToArchive:
            return "archive";
        case MoveState::ToTrash:
            return "trash";
        case MoveState::RecordToInbox:
            return "message_inbox";
        case MoveState::RecordToArchive:
            return "message_archive";
        case MoveState::RecordToTrash:
            return "message_trash";
        default:
            return "unknown";
    }
}

string MailActionUtils::toString(ImportanceState state) {
    switch (state) {
        case ImportanceState::Unset:
            return "";
        case ImportanceState::MarkImportant:
            return "important";
        case ImportanceState::MarkUnimportant:
            return "unimportant";
        default:
            return "unknown";
    }
}

string MailActionUtils::toString(ReadState state) {
    switch (state) {
        case ReadState::Unset:
            return "";
        case ReadState::ThreadRead:
            return "thread_read";
        case ReadState::ThreadUnread:
            return "thread_unread";
        case ReadState::RecordRead:
            return "message_read";
        case ReadState::RecordUnread:
            return "message_unread";
        default:
            return "unknown";
    }
}

MailCategory MailActionUtils::categoryFromString(const string & str) {
    for (auto category : ALL_MAIL_CATEGORIES) {
        if (toString(category) == str) return category;
    }
    throw BatchException(BATCH_MALFORMED_INPUT, "Unknown category \"" + str + "\"", false);
}

MoveState MailActionUtils::moveStateFromString(const string & str) {
    for (auto state : ALL_MOVE_STATES) {
        if (state != MoveState::Unset && toString(state) == str) return state;
    }
    throw BatchException(BATCH_MALFORMED_INPUT, "Unknown move \"" + str + "\"", false);
}

ImportanceState MailActionUtils::importanceFromString(const string & str) {
    for (auto state : ALL_IMPORTANCE_STATES) {
        if (state != ImportanceState::Unset && toString(state) == str) return state;
    }
    throw BatchException(BATCH_MALFORMED_INPUT, "Unknown importance \"" + str + "\"", false);
}

ReadState MailActionUtils::readStateFromString(const string & str) {
    for (auto state : ALL_READ_STATES) {
        if (state != ReadState::Unset && toString(state) == str) return state;
    }
    throw BatchException(BATCH_MALFORMED_INPUT, "Unknown read state \"" + str + "\"", false);
}

bool MailActionUtils::isRecordLevel(MoveState state) {
    return state == MoveState::RecordToInbox ||
           state == MoveState::RecordToArchive ||
           state == MoveState::RecordToTrash;
}

bool MailActionUtils::isRecordLevel(ReadState state) {
    return state == ReadState::RecordRead || state == ReadState::RecordUnread;
}

vector<MailCategory> MailActionUtils::complementOf(const set<MailCategory> & categories) {
    vector<MailCategory> results{};
    for (auto category : ALL_MAIL_CATEGORIES) {
        if (!categories.count(category)) {
            results.push_back(category);
        }
    }
    return results;
}

// MailAction

static set<string> _labelSetFromJSON(const json & json, const char * key) {
    set<string> results{};
    if (!json.count(key) || json[key].is_null()) {
        return results;
    }
    if (!json[key].is_array()) {
        throw BatchException(BATCH_MALFORMED_INPUT, string(key) + " must be an array of label names.", false);
    }
    for (const auto & item : json[key]) {
        if (!item.is_string()) {
            throw BatchException(BATCH_MALFORMED_INPUT, string(key) + " must contain only strings.", false);
        }
        results.insert(item.get<string>());
    }
    return results;
}

static string _enumStringFromJSON(const json & json, const char * key) {
    if (!json.count(key) || json[key].is_null()) {
        return "";
    }
    if (!json[key].is_string()) {
        throw BatchException(BATCH_MALFORMED_INPUT, string(key) + " must be a string.", false);
    }
    return json[key].get<string>();
}

MailAction::MailAction() :
    _moveState(MoveState::Unset),
    _importance(ImportanceState::Unset),
    _readState(ReadState::Unset)
{
}

MailAction::MailAction(const json & json) :
    MailAction()
{
    if (!json.is_object()) {
        throw BatchException(BATCH_MALFORMED_INPUT, "An action must be a JSON object.", false);
    }

    labelsToAdd = _labelSetFromJSON(json, "labels_to_add");
    labelsToRemove = _labelSetFromJSON(json, "labels_to_remove");

    if (json.count("categories") && !json["categories"].is_null()) {
        if (!json["categories"].is_array()) {
            throw BatchException(BATCH_MALFORMED_INPUT, "categories must be an array.", false);
        }
        for (const auto & item : json["categories"]) {
            if (!item.is_string()) {
                throw BatchException(BATCH_MALFORMED_INPUT, "categories must contain only strings.", false);
            }
            categories.insert(MailActionUtils::categoryFromString(item.get<string>()));
        }
    }

    string move = _enumStringFromJSON(json, "move");
    if (move != "") {
        setMoveState(MailActionUtils::moveStateFromString(move));
    }
    string important = _enumStringFromJSON(json, "important");
    if (important != "") {
        setImportance(MailActionUtils::importanceFromString(important));
    }
    string read = _enumStringFromJSON(json, "read");
    if (read != "") {
        setReadState(MailActionUtils::readStateFromString(read));
    }
}

MoveState MailAction::moveState() const {
    return _moveState;
}

void MailAction::setMoveState(MoveState state) {
    if (_moveState != MoveState::Unset && _moveState != state) {
        throw BatchException(BATCH_MALFORMED_INPUT, "move is already set to " + MailActionUtils::toString(_moveState), false);
    }
    _moveState = state;
}

ImportanceState MailAction::importance() const {
    return _importance;
}

void MailAction::setImportance(ImportanceState state) {
    if (_importance != ImportanceState::Unset && _importance != state) {
        throw BatchException(BATCH_MALFORMED_INPUT, "important is already set to " + MailActionUtils::toString(_importance), false);
    }
    _importance = state;
}

ReadState MailAction::readState() const {
    return _readState;
}

void MailAction::setReadState(ReadState state) {
    if (_readState != ReadState::Unset && _readState != state) {
        throw BatchException(BATCH_MALFORMED_INPUT, "read is already set to " + MailActionUtils::toString(_readState), false);
    }
    _readState = state;
}

bool MailAction::isEmpty() const {
    return labelsToAdd.empty() && labelsToRemove.empty() && categories.empty() &&
        _moveState == MoveState::Unset &&
        _importance == ImportanceState::Unset &&
        _readState == ReadState::Unset;
}

json MailAction::toJSON() const {
    json result = json::object();
    if (labelsToAdd.size() > 0) {
        result["labels_to_add"] = labelsToAdd;
    }
    if (labelsToRemove.size() > 0) {
        result["labels_to_remove"] = labelsToRemove;
    }
    if (categories.size() > 0) {
        json cats = json::array();
        for (auto category : categories) {
            cats.push_back(MailActionUtils::toString(category));
        }
        result["categories"] = cats;
    }
    if (_moveState != MoveState::Unset) {
        result["move"] = MailActionUtils::toString(_moveState);
    }
    if (_importance != ImportanceState::Unset) {
        result["important"] = MailActionUtils::toString(_importance);
    }
    if (_readState != ReadState::Unset) {
        result["read"] = MailActionUtils::toString(_readState);
    }
    return result;
}
