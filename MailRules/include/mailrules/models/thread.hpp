/** Thread [MailRules]
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

#ifndef Thread_hpp
#define Thread_hpp

#include <stdio.h>
#include <memory>
#include <vector>
#include <string>
#include "SQLiteCpp/SQLiteCpp.h"

#include "mailrules/models/mail_model.hpp"
#include "mailrules/models/message.hpp"

#include "nlohmann/json.hpp"


class Thread : public MailModel {

    std::vector<std::shared_ptr<Message>> _messages;

public:
    static std::string TABLE_NAME;

    Thread(SQLite::Statement & query);
    Thread(nlohmann::json json);

    std::string subject();
    std::string gThrId();
    time_t lastMessageTimestamp();

    // Messages are not part of the stored row. The store attaches them,
    // oldest first.
    std::vector<std::shared_ptr<Message>> & messages();
    void setMessages(std::vector<std::shared_ptr<Message>> messages);

    std::string firstMessageSubject();
    std::shared_ptr<Message> latestMessage();

    /*
     Returns the messages newer than `oldestToProcess`. When every message is
     older, the latest message is returned alone so a thread is never empty.
     */
    std::vector<std::shared_ptr<Message>> messagesToProcess(time_t oldestToProcess);

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* Thread_hpp */
