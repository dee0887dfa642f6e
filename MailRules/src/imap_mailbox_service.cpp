#include <algorithm>
#include <cctype>

#include "mailrules/imap_mailbox_service.hpp"
#include "mailrules/batch_exception.hpp"
#include "mailrules/constants.hpp"
#include "mailrules/mail_utils.hpp"

using namespace mailcore;
using namespace std;


static string _xgmKeyForLabel(shared_ptr<Label> label) {
    if (label->role() == "inbox") {
        return "\\Inbox";
    }
    if (label->role() == "important") {
        return "\\Important";
    }
    return label->path();
}

static vector<shared_ptr<Message>> _messagesOfThreads(const vector<shared_ptr<Thread>> & threads) {
    vector<shared_ptr<Message>> results{};
    for (auto & thread : threads) {
        auto & messages = thread->messages();
        results.insert(results.end(), messages.begin(), messages.end());
    }
    return results;
}

static map<string, vector<shared_ptr<Message>>> _messagesByFolder(const vector<shared_ptr<Message>> & messages) {
    map<string, vector<shared_ptr<Message>>> results{};
    for (auto & msg : messages) {
        results[msg->remoteFolderPath()].push_back(msg);
    }
    return results;
}

static shared_ptr<IndexSet> _uidsOf(const vector<shared_ptr<Message>> & messages) {
    auto uids = make_shared<IndexSet>();
    for (auto & msg : messages) {
        uids->addIndex(msg->remoteUID());
    }
    return uids;
}


IMAPMailboxService::IMAPMailboxService(IMAPSession * session, shared_ptr<Account> account, SessionConfig config) :
    session(session),
    account(account),
    config(config),
    logger(spdlog::get("logger")),
    _foldersLoaded(false),
    _delimiter('/')
{
}

bool IMAPMailboxService::isGmail() {
    // Capabilities are only known once logged in, which listing folders does.
    loadFolders();
    IndexSet * capabilities = session->storedCapabilities();
    return capabilities != nullptr && capabilities->containsIndex(IMAPCapabilityGmail);
}

bool IMAPMailboxService::supportsLabels() {
    return isGmail();
}

void IMAPMailboxService::requireGmail(string op) {
    if (!isGmail()) {
        throw BatchException("labels-unsupported", op + " requires a server with Gmail labels.", false);
    }
}

void IMAPMailboxService::loadFolders() {
    if (_foldersLoaded) {
        return;
    }
    AutoreleasePool pool;

    ErrorCode err = ErrorCode::ErrorNone;
    Array * remoteFolders = session->fetchAllFolders(&err);
    if (err != ErrorCode::ErrorNone) {
        throw BatchException(err, "fetchAllFolders");
    }

    _folders.clear();
    for (unsigned int ii = 0; ii < remoteFolders->count(); ii ++) {
        IMAPFolder * remote = (IMAPFolder *)remoteFolders->objectAtIndex(ii);
        if (ii == 0) {
            _delimiter = remote->delimiter();
        }
        _folders.push_back(make_shared<Label>(account->id(), remote, MailUtils::roleForFolder(remote)));
    }
    _foldersLoaded = true;
    logger->info("Loaded {} folders and labels", _folders.size());
}

vector<shared_ptr<Label>> & IMAPMailboxService::folders() {
    loadFolders();
    return _folders;
}

shared_ptr<Label> IMAPMailboxService::folderWithPath(string path) {
    for (auto & folder : folders()) {
        if (folder->path() == path) {
            return folder;
        }
    }
    return nullptr;
}

shared_ptr<Label> IMAPMailboxService::folderWithRole(string role) {
    for (auto & folder : folders()) {
        if (folder->role() == role) {
            return folder;
        }
    }
    return nullptr;
}

string IMAPMailboxService::categoryLabelPath(MailCategory category) {
    string configured = config.categoryLabel(category);
    if (configured != "") {
        return configured;
    }
    string name = MailActionUtils::toString(category);
    name[0] = (char)toupper(name[0]);

    loadFolders();
    return MAILRULES_FOLDER_PREFIX + _delimiter + name;
}

shared_ptr<Label> IMAPMailboxService::findOrCreateLabel(string name) {
    auto existing = folderWithPath(name);
    if (existing != nullptr) {
        return existing;
    }

    // Rules may name system labels ("Inbox", "Important") rather than paths.
    string lower = name;
    transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    for (auto & folder : folders()) {
        if (folder->role() != "" && folder->role() == lower) {
            return folder;
        }
    }

    AutoreleasePool pool;
    ErrorCode err = ErrorCode::ErrorNone;
    session->createFolder(AS_MCSTR(name), &err);
    if (err != ErrorCode::ErrorNone) {
        throw BatchException(err, "createFolder - " + name);
    }
    logger->info("Created label: {}", name);

    IMAPFolder * created = new IMAPFolder();
    created->autorelease();
    created->setPath(AS_MCSTR(name));
    created->setDelimiter(_delimiter);

    auto label = make_shared<Label>(account->id(), created, "");
    _folders.push_back(label);
    return label;
}

// Low level operations. Each one issues a single request per remote folder.

void IMAPMailboxService::storeLabels(const vector<shared_ptr<Message>> & messages, IMAPStoreFlagsRequestKind kind, vector<string> xgmValues) {
    if (messages.empty() || xgmValues.empty()) {
        return;
    }
    AutoreleasePool pool;

    Array * labels = new mailcore::Array{};
    labels->autorelease();
    for (auto & value : xgmValues) {
        labels->addObject(AS_MCSTR(value));
    }

    for (auto & pair : _messagesByFolder(messages)) {
        auto uids = _uidsOf(pair.second);
        ErrorCode err = ErrorCode::ErrorNone;
        session->storeLabelsByUID(AS_MCSTR(pair.first), uids.get(), kind, labels, &err);
        if (err != ErrorCode::ErrorNone) {
            throw BatchException(err, kind == IMAPStoreFlagsRequestKindAdd ? "storeLabelsByUID - add" : "storeLabelsByUID - remove");
        }
    }
}

void IMAPMailboxService::storeFlags(const vector<shared_ptr<Message>> & messages, IMAPStoreFlagsRequestKind kind, MessageFlag flags) {
    if (messages.empty()) {
        return;
    }
    AutoreleasePool pool;

    for (auto & pair : _messagesByFolder(messages)) {
        auto uids = _uidsOf(pair.second);
        ErrorCode err = ErrorCode::ErrorNone;
        session->storeFlagsByUID(AS_MCSTR(pair.first), uids.get(), kind, flags, &err);
        if (err != ErrorCode::ErrorNone) {
            throw BatchException(err, "storeFlagsByUID");
        }
    }
}

// Moves the messages and updates their remote folder and UID. Without the
// MOVE extension this falls back to COPY, STORE \Deleted and EXPUNGE.

void IMAPMailboxService::moveMessagesToFolder(const vector<shared_ptr<Message>> & messages, shared_ptr<Label> destFolder) {
    AutoreleasePool pool;
    String * destPath = AS_MCSTR(destFolder->path());
    bool canMove = session->storedCapabilities() != nullptr && session->storedCapabilities()->containsIndex(IMAPCapabilityMove);

    for (auto & pair : _messagesByFolder(messages)) {
        if (pair.first == destFolder->path()) {
            continue;
        }
        String * path = AS_MCSTR(pair.first);
        auto uids = _uidsOf(pair.second);
        ErrorCode err = ErrorCode::ErrorNone;
        HashMap * uidmap = nullptr;

        if (canMove) {
            session->moveMessages(path, uids.get(), destPath, &uidmap, &err);
            if (err != ErrorCode::ErrorNone) {
                throw BatchException(err, "moveMessages");
            }
        } else {
            session->copyMessages(path, uids.get(), destPath, &uidmap, &err);
            if (err != ErrorCode::ErrorNone) {
                throw BatchException(err, "moveMessages(copy)");
            }
            session->storeFlagsByUID(path, uids.get(), IMAPStoreFlagsRequestKindAdd, MessageFlagDeleted, &err);
            if (err != ErrorCode::ErrorNone) {
                throw BatchException(err, "moveMessages(copy cleanup)");
            }
            session->expunge(path, &err);
            if (err != ErrorCode::ErrorNone) {
                throw BatchException(err, "moveMessages(copy cleanup)");
            }
        }

        // Only returned if the server supports UIDPLUS.
        if (uidmap == nullptr) {
            logger->warn("-- Server did not return new UIDs for {} messages moved to {}", pair.second.size(), destFolder->path());
            continue;
        }
        for (auto & msg : pair.second) {
            Value * currentUID = Value::valueWithUnsignedLongValue(msg->remoteUID());
            Value * newUID = (Value *)uidmap->objectForKey(currentUID);
            if (!newUID) {
                logger->error("-- Could not find new UID for message {}", msg->id());
                continue;
            }
            msg->setRemoteFolder(destFolder.get());
            msg->setRemoteUID(newUID->unsignedIntValue());
        }
    }
}

/*
 On Gmail the inbox and archive are both views of All Mail, so inbox and
 archive are label changes. Messages in the Trash or Spam have to be moved
 out first, since removing a label does not take them out of either.
 Trash is a move to the folder with the trash role.
 */
void IMAPMailboxService::moveMessages(const vector<shared_ptr<Message>> & messages, string role) {
    if (messages.empty()) {
        return;
    }
    requireGmail("move");

    if (role == "trash") {
        auto dest = folderWithRole("trash");
        if (dest == nullptr) {
            throw BatchException("no-trash-folder", "Could not find a folder with the trash role.", false);
        }
        moveMessagesToFolder(messages, dest);
        return;
    }

    vector<shared_ptr<Message>> discarded{};
    for (auto & msg : messages) {
        auto folder = folderWithPath(msg->remoteFolderPath());
        if (folder && (folder->role() == "trash" || folder->role() == "spam")) {
            discarded.push_back(msg);
        }
    }
    if (discarded.size() > 0) {
        string destRole = (role == "inbox") ? "inbox" : "all";
        auto dest = folderWithRole(destRole);
        if (dest == nullptr) {
            throw BatchException("no-" + destRole + "-folder", "Could not find the destination folder.", false);
        }
        moveMessagesToFolder(discarded, dest);
    }
    storeLabels(messages, role == "inbox" ? IMAPStoreFlagsRequestKindAdd : IMAPStoreFlagsRequestKindRemove, {"\\Inbox"});
}

// Labels

void IMAPMailboxService::addLabelToThreads(shared_ptr<Label> label, const vector<shared_ptr<Thread>> & threads) {
    addLabelToMessages(label, _messagesOfThreads(threads));
}

void IMAPMailboxService::removeLabelFromThreads(shared_ptr<Label> label, const vector<shared_ptr<Thread>> & threads) {
    removeLabelFromMessages(label, _messagesOfThreads(threads));
}

void IMAPMailboxService::addLabelToMessages(shared_ptr<Label> label, const vector<shared_ptr<Message>> & messages) {
    requireGmail("addLabel");
    storeLabels(messages, IMAPStoreFlagsRequestKindAdd, {_xgmKeyForLabel(label)});
}

void IMAPMailboxService::removeLabelFromMessages(shared_ptr<Label> label, const vector<shared_ptr<Message>> & messages) {
    requireGmail("removeLabel");
    storeLabels(messages, IMAPStoreFlagsRequestKindRemove, {_xgmKeyForLabel(label)});
}

// Categories

void IMAPMailboxService::reassignThreadCategories(shared_ptr<Thread> thread, const vector<MailCategory> & add, const vector<MailCategory> & remove) {
    reassignCategories(thread->messages(), add, remove);
}

void IMAPMailboxService::reassignMessageCategories(shared_ptr<Message> message, const vector<MailCategory> & add, const vector<MailCategory> & remove) {
    reassignCategories({message}, add, remove);
}

void IMAPMailboxService::reassignCategories(const vector<shared_ptr<Message>> & messages, const vector<MailCategory> & add, const vector<MailCategory> & remove) {
    requireGmail("reassignCategories");

    vector<string> toAdd{};
    for (auto category : add) {
        toAdd.push_back(_xgmKeyForLabel(findOrCreateLabel(categoryLabelPath(category))));
    }
    // Category labels that were never created cannot be on the messages.
    vector<string> toRemove{};
    for (auto category : remove) {
        auto label = folderWithPath(categoryLabelPath(category));
        if (label != nullptr) {
            toRemove.push_back(_xgmKeyForLabel(label));
        }
    }

    storeLabels(messages, IMAPStoreFlagsRequestKindAdd, toAdd);
    storeLabels(messages, IMAPStoreFlagsRequestKindRemove, toRemove);
}

// Moves

void IMAPMailboxService::moveThreadsToInbox(const vector<shared_ptr<Thread>> & threads) {
    moveMessages(_messagesOfThreads(threads), "inbox");
}

void IMAPMailboxService::moveThreadsToArchive(const vector<shared_ptr<Thread>> & threads) {
    moveMessages(_messagesOfThreads(threads), "archive");
}

void IMAPMailboxService::moveThreadsToTrash(const vector<shared_ptr<Thread>> & threads) {
    moveMessages(_messagesOfThreads(threads), "trash");
}

void IMAPMailboxService::moveMessageToInbox(shared_ptr<Message> message) {
    moveMessages({message}, "inbox");
}

void IMAPMailboxService::moveMessageToArchive(shared_ptr<Message> message) {
    moveMessages({message}, "archive");
}

void IMAPMailboxService::moveMessageToTrash(shared_ptr<Message> message) {
    moveMessages({message}, "trash");
}

// Importance

void IMAPMailboxService::markThreadsImportant(const vector<shared_ptr<Thread>> & threads) {
    markMessagesImportant(_messagesOfThreads(threads));
}

void IMAPMailboxService::markThreadsUnimportant(const vector<shared_ptr<Thread>> & threads) {
    markMessagesUnimportant(_messagesOfThreads(threads));
}

void IMAPMailboxService::markMessagesImportant(const vector<shared_ptr<Message>> & messages) {
    requireGmail("markImportant");
    storeLabels(messages, IMAPStoreFlagsRequestKindAdd, {"\\Important"});
}

void IMAPMailboxService::markMessagesUnimportant(const vector<shared_ptr<Message>> & messages) {
    requireGmail("markUnimportant");
    storeLabels(messages, IMAPStoreFlagsRequestKindRemove, {"\\Important"});
}

// Read state

void IMAPMailboxService::markThreadsRead(const vector<shared_ptr<Thread>> & threads) {
    markMessagesRead(_messagesOfThreads(threads));
}

void IMAPMailboxService::markThreadsUnread(const vector<shared_ptr<Thread>> & threads) {
    markMessagesUnread(_messagesOfThreads(threads));
}

void IMAPMailboxService::markMessagesRead(const vector<shared_ptr<Message>> & messages) {
    storeFlags(messages, IMAPStoreFlagsRequestKindAdd, MessageFlagSeen);
}

void IMAPMailboxService::markMessagesUnread(const vector<shared_ptr<Message>> & messages) {
    storeFlags(messages, IMAPStoreFlagsRequestKindRemove, MessageFlagSeen);
}
