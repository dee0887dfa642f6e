/** MailAction [MailRules]
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

#ifndef MailAction_hpp
#define MailAction_hpp

#include <stdio.h>
#include <set>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

// Gmail's inbox tabs. Exactly one applies to a message, so assigning one
// means removing every other.
enum class MailCategory {
    Primary,
    Social,
    Promotions,
    Updates,
    Forums
};

// `Record*` variants act on individual messages even when the batch is
// grouped by thread.
enum class MoveState {
    Unset,
    ToInbox,
    ToArchive,
    ToTrash,
    RecordToInbox,
    RecordToArchive,
    RecordToTrash
};

enum class ImportanceState {
    Unset,
    MarkImportant,
    MarkUnimportant
};

enum class ReadState {
    Unset,
    ThreadRead,
    ThreadUnread,
    RecordRead,
    RecordUnread
};

static const std::vector<MailCategory> ALL_MAIL_CATEGORIES = {
    MailCategory::Primary,
    MailCategory::Social,
    MailCategory::Promotions,
    MailCategory::Updates,
    MailCategory::Forums,
};

static const std::vector<MoveState> ALL_MOVE_STATES = {
    MoveState::Unset,
    MoveState::ToInbox,
    MoveState::ToArchive,
    MoveState::ToTrash,
    MoveState::RecordToInbox,
    MoveState::RecordToArchive,
    MoveState::RecordToTrash,
};

static const std::vector<ImportanceState> ALL_IMPORTANCE_STATES = {
    ImportanceState::Unset,
    ImportanceState::MarkImportant,
    ImportanceState::MarkUnimportant,
};

static const std::vector<ReadState> ALL_READ_STATES = {
    ReadState::Unset,
    ReadState::ThreadRead,
    ReadState::ThreadUnread,
    ReadState::RecordRead,
    ReadState::RecordUnread,
};

class MailActionUtils {
public:
    static std::string toString(MailCategory category);
    static std::string toString(MoveState state);
    static std::string toString(ImportanceState state);
    static std::string toString(ReadState state);

    // The parsers throw malformed-input for strings they do not know.
    static MailCategory categoryFromString(const std::string & str);
    static MoveState moveStateFromString(const std::string & str);
    static ImportanceState importanceFromString(const std::string & str);
    static ReadState readStateFromString(const std::string & str);

    static bool isRecordLevel(MoveState state);
    static bool isRecordLevel(ReadState state);

    // Every category except the ones given, in ALL_MAIL_CATEGORIES order.
    static std::vector<MailCategory> complementOf(const std::set<MailCategory> & categories);
};

/*
 The mutations the rule stage decided for one thread or message. The label
 sets may overlap; removal is applied after addition. Each enum field may be
 assigned once, a second assignment of a different value is rejected.
 */
class MailAction {
    MoveState _moveState;
    ImportanceState _importance;
    ReadState _readState;

public:
    std::set<std::string> labelsToAdd;
    std::set<std::string> labelsToRemove;
    std::set<MailCategory> categories;

    MailAction();
    MailAction(const nlohmann::json & json);

    MoveState moveState() const;
    void setMoveState(MoveState state);

    ImportanceState importance() const;
    void setImportance(ImportanceState state);

    ReadState readState() const;
    void setReadState(ReadState state);

    bool isEmpty() const;

    nlohmann::json toJSON() const;
};

#endif /* MailAction_hpp */
