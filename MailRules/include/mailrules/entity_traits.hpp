/** EntityTraits [MailRules]
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

#ifndef EntityTraits_hpp
#define EntityTraits_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "mailrules/entity_dataset.hpp"
#include "mailrules/mailbox_service.hpp"

/*
 Binds the engine to the mailbox operations of one granularity. Labels,
 categories and importance act on the entities themselves. Thread-level
 moves and read states act on the threads of the entities, and record-level
 ones act on their messages.
 */
template<typename Entity>
struct EntityTraits;

template<>
struct EntityTraits<Thread> {
    static std::string noun();

    static void addLabel(MailboxService * service, std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Thread>> & threads);
    static void removeLabel(MailboxService * service, std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Thread>> & threads);
    static void reassignCategories(MailboxService * service, std::shared_ptr<Thread> thread, const std::vector<MailCategory> & add, const std::vector<MailCategory> & remove);
    static void markImportant(MailboxService * service, const std::vector<std::shared_ptr<Thread>> & threads);
    static void markUnimportant(MailboxService * service, const std::vector<std::shared_ptr<Thread>> & threads);

    static std::vector<std::shared_ptr<Thread>> threadsOf(EntityDataset<Thread> & dataset, const std::vector<std::shared_ptr<Thread>> & threads);
    static std::vector<std::shared_ptr<Message>> messagesOf(EntityDataset<Thread> & dataset, const std::vector<std::shared_ptr<Thread>> & threads);
};

template<>
struct EntityTraits<Message> {
    static std::string noun();

    static void addLabel(MailboxService * service, std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Message>> & messages);
    static void removeLabel(MailboxService * service, std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Message>> & messages);
    static void reassignCategories(MailboxService * service, std::shared_ptr<Message> message, const std::vector<MailCategory> & add, const std::vector<MailCategory> & remove);
    static void markImportant(MailboxService * service, const std::vector<std::shared_ptr<Message>> & messages);
    static void markUnimportant(MailboxService * service, const std::vector<std::shared_ptr<Message>> & messages);

    // Parent threads, each listed once.
    static std::vector<std::shared_ptr<Thread>> threadsOf(EntityDataset<Message> & dataset, const std::vector<std::shared_ptr<Message>> & messages);
    static std::vector<std::shared_ptr<Message>> messagesOf(EntityDataset<Message> & dataset, const std::vector<std::shared_ptr<Message>> & messages);
};

#endif /* EntityTraits_hpp */
