/** DatasetLoader [MailRules]
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

#ifndef DatasetLoader_hpp
#define DatasetLoader_hpp

#include <stdio.h>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailrules/entity_dataset.hpp"
#include "mailrules/mail_store.hpp"
#include "mailrules/session_context.hpp"

/*
 Builds datasets from a batch file written by the rule stage:

   {"entities": [{"id": "...", "action": {...}}, ...]}

 Ids the store does not know are logged and skipped. In message batches,
 a message older than the session's cutoff is skipped unless it is the
 latest message of its thread.
 */
class DatasetLoader {
    MailStore * store;
    SessionContext * session;
    std::shared_ptr<spdlog::logger> logger;

public:
    DatasetLoader(MailStore * store, SessionContext * session);

    EntityDataset<Thread> loadThreads(const nlohmann::json & batch);
    EntityDataset<Message> loadMessages(const nlohmann::json & batch);

private:
    const nlohmann::json & entitiesOf(const nlohmann::json & batch);
};

#endif /* DatasetLoader_hpp */
