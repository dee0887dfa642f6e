#include <set>

#include "mailrules/entity_traits.hpp"

using namespace std;


// Threads

string EntityTraits<Thread>::noun() {
    return "threads";
}

void EntityTraits<Thread>::addLabel(MailboxService * service, shared_ptr<Label> label, const vector<shared_ptr<Thread>> & threads) {
    service->addLabelToThreads(label, threads);
}

void EntityTraits<Thread>::removeLabel(MailboxService * service, shared_ptr<Label> label, const vector<shared_ptr<Thread>> & threads) {
    service->removeLabelFromThreads(label, threads);
}

void EntityTraits<Thread>::reassignCategories(MailboxService * service, shared_ptr<Thread> thread, const vector<MailCategory> & add, const vector<MailCategory> & remove) {
    service->reassignThreadCategories(thread, add, remove);
}

void EntityTraits<Thread>::markImportant(MailboxService * service, const vector<shared_ptr<Thread>> & threads) {
    service->markThreadsImportant(threads);
}

void EntityTraits<Thread>::markUnimportant(MailboxService * service, const vector<shared_ptr<Thread>> & threads) {
    service->markThreadsUnimportant(threads);
}

vector<shared_ptr<Thread>> EntityTraits<Thread>::threadsOf(EntityDataset<Thread> & dataset, const vector<shared_ptr<Thread>> & threads) {
    return threads;
}

vector<shared_ptr<Message>> EntityTraits<Thread>::messagesOf(EntityDataset<Thread> & dataset, const vector<shared_ptr<Thread>> & threads) {
    vector<shared_ptr<Message>> results{};
    for (auto & thread : threads) {
        auto & messages = thread->messages();
        results.insert(results.end(), messages.begin(), messages.end());
    }
    return results;
}

// Messages

string EntityTraits<Message>::noun() {
    return "messages";
}

void EntityTraits<Message>::addLabel(MailboxService * service, shared_ptr<Label> label, const vector<shared_ptr<Message>> & messages) {
    service->addLabelToMessages(label, messages);
}

void EntityTraits<Message>::removeLabel(MailboxService * service, shared_ptr<Label> label, const vector<shared_ptr<Message>> & messages) {
    service->removeLabelFromMessages(label, messages);
}

void EntityTraits<Message>::reassignCategories(MailboxService * service, shared_ptr<Message> message, const vector<MailCategory> & add, const vector<MailCategory> & remove) {
    service->reassignMessageCategories(message, add, remove);
}

void EntityTraits<Message>::markImportant(MailboxService * service, const vector<shared_ptr<Message>> & messages) {
    service->markMessagesImportant(messages);
}

void EntityTraits<Message>::markUnimportant(MailboxService * service, const vector<shared_ptr<Message>> & messages) {
    service->markMessagesUnimportant(messages);
}

vector<shared_ptr<Thread>> EntityTraits<Message>::threadsOf(EntityDataset<Message> & dataset, const vector<shared_ptr<Message>> & messages) {
    vector<shared_ptr<Thread>> results{};
    set<string> seen{};
    for (auto & msg : messages) {
        auto thread = dataset.threadFor(msg);
        if (seen.insert(thread->id()).second) {
            results.push_back(thread);
        }
    }
    return results;
}

vector<shared_ptr<Message>> EntityTraits<Message>::messagesOf(EntityDataset<Message> & dataset, const vector<shared_ptr<Message>> & messages) {
    return messages;
}
