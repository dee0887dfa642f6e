/** IMAPMailboxService [MailRules]
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

#ifndef IMAPMailboxService_hpp
#define IMAPMailboxService_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "MailCore/MailCore.h"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailrules/mailbox_service.hpp"
#include "mailrules/session_context.hpp"
#include "mailrules/models/account.hpp"
#include "mailrules/models/label.hpp"
#include "mailrules/models/message.hpp"
#include "mailrules/models/thread.hpp"

/*
 MailboxService backed by an IMAP connection. Everything except read state
 needs Gmail's X-GM-LABELS extension: inbox and archive are label changes
 there, and trash is a move to the folder with the trash role.

 Messages are grouped by the folder they currently live in and each group
 is sent as one STORE or MOVE. Moves update the messages' remote folder and
 UID in memory so later calls in the same batch address them correctly.
 */
class IMAPMailboxService : public MailboxService {
    mailcore::IMAPSession * session;
    std::shared_ptr<Account> account;
    SessionConfig config;
    std::shared_ptr<spdlog::logger> logger;

    bool _foldersLoaded;
    char _delimiter;
    std::vector<std::shared_ptr<Label>> _folders;

public:
    IMAPMailboxService(mailcore::IMAPSession * session, std::shared_ptr<Account> account, SessionConfig config);

    bool isGmail();
    bool supportsLabels();

    std::vector<std::shared_ptr<Label>> & folders();
    std::shared_ptr<Label> folderWithPath(std::string path);
    std::shared_ptr<Label> folderWithRole(std::string role);

    std::string categoryLabelPath(MailCategory category);

    std::shared_ptr<Label> findOrCreateLabel(std::string name);

    void addLabelToThreads(std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Thread>> & threads);
    void removeLabelFromThreads(std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Thread>> & threads);
    void addLabelToMessages(std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Message>> & messages);
    void removeLabelFromMessages(std::shared_ptr<Label> label, const std::vector<std::shared_ptr<Message>> & messages);

    void reassignThreadCategories(std::shared_ptr<Thread> thread, const std::vector<MailCategory> & add, const std::vector<MailCategory> & remove);
    void reassignMessageCategories(std::shared_ptr<Message> message, const std::vector<MailCategory> & add, const std::vector<MailCategory> & remove);

    void moveThreadsToInbox(const std::vector<std::shared_ptr<Thread>> & threads);
    void moveThreadsToArchive(const std::vector<std::shared_ptr<Thread>> & threads);
    void moveThreadsToTrash(const std::vector<std::shared_ptr<Thread>> & threads);

    void moveMessageToInbox(std::shared_ptr<Message> message);
    void moveMessageToArchive(std::shared_ptr<Message> message);
    void moveMessageToTrash(std::shared_ptr<Message> message);

    void markThreadsImportant(const std::vector<std::shared_ptr<Thread>> & threads);
    void markThreadsUnimportant(const std::vector<std::shared_ptr<Thread>> & threads);
    void markMessagesImportant(const std::vector<std::shared_ptr<Message>> & messages);
    void markMessagesUnimportant(const std::vector<std::shared_ptr<Message>> & messages);

    void markThreadsRead(const std::vector<std::shared_ptr<Thread>> & threads);
    void markThreadsUnread(const std::vector<std::shared_ptr<Thread>> & threads);
    void markMessagesRead(const std::vector<std::shared_ptr<Message>> & messages);
    void markMessagesUnread(const std::vector<std::shared_ptr<Message>> & messages);

private:
    void loadFolders();
    void requireGmail(std::string op);

    void storeLabels(const std::vector<std::shared_ptr<Message>> & messages, mailcore::IMAPStoreFlagsRequestKind kind, std::vector<std::string> xgmValues);
    void storeFlags(const std::vector<std::shared_ptr<Message>> & messages, mailcore::IMAPStoreFlagsRequestKind kind, mailcore::MessageFlag flags);
    void moveMessagesToFolder(const std::vector<std::shared_ptr<Message>> & messages, std::shared_ptr<Label> destFolder);

    void moveMessages(const std::vector<std::shared_ptr<Message>> & messages, std::string role);
    void reassignCategories(const std::vector<std::shared_ptr<Message>> & messages, const std::vector<MailCategory> & add, const std::vector<MailCategory> & remove);
};

#endif /* IMAPMailboxService_hpp */
