#include <set>

#include "mailrules/dataset_loader.hpp"
#include "mailrules/batch_exception.hpp"

using namespace std;
using namespace nlohmann;


DatasetLoader::DatasetLoader(MailStore * store, SessionContext * session) :
    store(store),
    session(session),
    logger(spdlog::get("logger"))
{
}

const json & DatasetLoader::entitiesOf(const json & batch) {
    if (!batch.is_object() || !batch.count("entities") || !batch["entities"].is_array()) {
        throw BatchException(BATCH_MALFORMED_INPUT, "A batch must be an object with an `entities` array.", false);
    }
    const json & entities = batch["entities"];
    for (const auto & item : entities) {
        if (!item.is_object() || !item.count("id") || !item["id"].is_string()) {
            throw BatchException(BATCH_MALFORMED_INPUT, "Each batch entity needs a string `id`.", false);
        }
    }
    return entities;
}

EntityDataset<Thread> DatasetLoader::loadThreads(const json & batch) {
    const json & entities = entitiesOf(batch);

    vector<string> ids{};
    for (const auto & item : entities) {
        ids.push_back(item["id"].get<string>());
    }

    // Operations on a thread reach the messages it holds, so drop the ones
    // outside the processing window up front.
    time_t oldestToProcess = session->oldestToProcess();

    map<string, shared_ptr<Thread>> threadsById{};
    for (auto & thread : store->findThreadsWithMessages(ids)) {
        if (oldestToProcess > 0) {
            thread->setMessages(thread->messagesToProcess(oldestToProcess));
        }
        threadsById[thread->id()] = thread;
    }

    EntityDataset<Thread> dataset;
    for (const auto & item : entities) {
        string id = item["id"].get<string>();
        MailAction action = item.count("action") ? MailAction(item["action"]) : MailAction();

        if (!threadsById.count(id)) {
            logger->warn("Skipping thread {}: not found in the mail store", id);
            continue;
        }
        auto thread = threadsById[id];
        dataset.addThread(thread);
        dataset.add(thread, action);
    }

    logger->info("Loaded {} of {} threads", dataset.size(), entities.size());
    return dataset;
}

EntityDataset<Message> DatasetLoader::loadMessages(const json & batch) {
    const json & entities = entitiesOf(batch);

    vector<string> ids{};
    for (const auto & item : entities) {
        ids.push_back(item["id"].get<string>());
    }

    map<string, shared_ptr<Message>> messagesById{};
    set<string> threadIdSet{};
    for (auto & msg : store->findLargeSet<Message>("id", ids)) {
        messagesById[msg->id()] = msg;
        threadIdSet.insert(msg->threadId());
    }

    // Load the parent threads with their full message lists, and point the
    // batch at the same Message instances the threads hold.
    vector<string> threadIds(threadIdSet.begin(), threadIdSet.end());
    EntityDataset<Message> dataset;
    for (auto & thread : store->findThreadsWithMessages(threadIds)) {
        dataset.addThread(thread);
        for (auto & msg : thread->messages()) {
            if (messagesById.count(msg->id())) {
                messagesById[msg->id()] = msg;
            }
        }
    }

    time_t oldestToProcess = session->oldestToProcess();

    for (const auto & item : entities) {
        string id = item["id"].get<string>();
        MailAction action = item.count("action") ? MailAction(item["action"]) : MailAction();

        if (!messagesById.count(id)) {
            logger->warn("Skipping message {}: not found in the mail store", id);
            continue;
        }
        auto msg = messagesById[id];
        if (!dataset.hasThread(msg->threadId())) {
            logger->warn("Skipping message {}: thread {} not found in the mail store", id, msg->threadId());
            continue;
        }
        auto thread = dataset.threadFor(msg);
        auto latest = thread->latestMessage();
        if (msg->date() <= oldestToProcess && latest != nullptr && latest->id() != msg->id()) {
            logger->info("Skipping message {} in thread \"{}\": older than the processing window", id, thread->firstMessageSubject());
            continue;
        }
        dataset.add(msg, action);
    }

    logger->info("Loaded {} of {} messages", dataset.size(), entities.size());
    return dataset;
}
