/** MailboxService [MailRules]
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

#ifndef MailboxService_hpp
#define MailboxService_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "mailrules/mail_action.hpp"
#include "mailrules/models/label.hpp"
#include "mailrules/models/message.hpp"
#include "mailrules/models/thread.hpp"

/*
 The mutations the engine can request from the server holding the mailbox.
 Every call is synchronous and either succeeds for all the entities passed
 or throws a BatchException. Implementations never retry.
 */
class MailboxService {
public:
    virtual ~MailboxService() {}

    // False when the mailbox cannot hold labels. Bookkeeping always changes
    // labels, so no batch can complete against such a mailbox.
    virtual bool supportsLabels() = 0;

    virtual std::shared_ptr<Label> findOrCreateLabel(std::string name) = 0;

    virtual void addLabelToThreads(std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Thread>> & threads) = 0;
    virtual void removeLabelFromThreads(std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Thread>> & threads) = 0;
    virtual void addLabelToMessages(std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Message>> & messages) = 0;
    virtual void removeLabelFromMessages(std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Message>> & messages) = 0;

    // Categories can only be reassigned one entity at a time.
    virtual void reassignThreadCategories(std::shared_ptr<Thread> thread, const std::vector<MailCategory> & add, const std::vector<MailCategory> & remove) = 0;
    virtual void reassignMessageCategories(std::shared_ptr<Message> message, const std::vector<MailCategory> & add, const std::vector<MailCategory> & remove) = 0;

    virtual void moveThreadsToInbox(const std::vector<std::shared_ptr<Thread>> & threads) = 0;
    virtual void moveThreadsToArchive(const std::vector<std::shared_ptr<Thread>> & threads) = 0;
    virtual void moveThreadsToTrash(const std::vector<std::shared_ptr<Thread>> & threads) = 0;

    virtual void moveMessageToInbox(std::shared_ptr<Message> message) = 0;
    virtual void moveMessageToArchive(std::shared_ptr<Message> message) = 0;
    virtual void moveMessageToTrash(std::shared_ptr<Message> message) = 0;

    virtual void markThreadsImportant(const std::vector<std::shared_ptr<Thread>> & threads) = 0;
    virtual void markThreadsUnimportant(const std::vector<std::shared_ptr<Thread>> & threads) = 0;
    virtual void markMessagesImportant(const std::vector<std::shared_ptr<Message>> & messages) = 0;
    virtual void markMessagesUnimportant(const std::vector<std::shared_ptr<Message>> & messages) = 0;

    virtual void markThreadsRead(const std::vector<std::shared_ptr<Thread>> & threads) = 0;
    virtual void markThreadsUnread(const std::vector<std::shared_ptr<Thread>> & threads) = 0;
    virtual void markMessagesRead(const std::vector<std::shared_ptr<Message>> & messages) = 0;
    virtual void markMessagesUnread(const std::vector<std::shared_ptr<Message>> & messages) = 0;
};

#endif /* MailboxService_hpp */
