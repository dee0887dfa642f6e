#include <algorithm>

#include "mailrules/models/thread.hpp"
#include "mailrules/mail_utils.hpp"
#include "spdlog/spdlog.h"

using namespace std;
using namespace nlohmann;

string Thread::TABLE_NAME = "Thread";

Thread::Thread(SQLite::Statement & query) :
    MailModel(query)
{
}

Thread::Thread(json json) :
    MailModel(json)
{
}

string Thread::subject() {
    return _data.count("subject") ? _data["subject"].get<string>() : "";
}

string Thread::gThrId() {
    return _data.count("gThrId") ? _data["gThrId"].get<string>() : "";
}

time_t Thread::lastMessageTimestamp() {
    return _data.count("lmt") ? _data["lmt"].get<time_t>() : 0;
}

vector<shared_ptr<Message>> & Thread::messages() {
    return _messages;
}

void Thread::setMessages(vector<shared_ptr<Message>> messages) {
    stable_sort(messages.begin(), messages.end(), [](const shared_ptr<Message> & a, const shared_ptr<Message> & b) {
        return a->date() < b->date();
    });
    _messages = messages;
}

string Thread::firstMessageSubject() {
    if (_messages.size() > 0) {
        return _messages.front()->subject();
    }
    return subject();
}

shared_ptr<Message> Thread::latestMessage() {
    if (_messages.size() == 0) {
        return nullptr;
    }
    return _messages.back();
}

vector<shared_ptr<Message>> Thread::messagesToProcess(time_t oldestToProcess) {
    vector<shared_ptr<Message>> results{};
    for (auto & msg : _messages) {
        if (msg->date() > oldestToProcess) {
            results.push_back(msg);
        }
    }
    if (results.size() == 0 && _messages.size() > 0) {
        results.push_back(_messages.back());
    }

    size_t dropped = _messages.size() - results.size();
    if (dropped > 0) {
        spdlog::get("logger")->info("Ignoring oldest {} messages in thread \"{}\"", dropped, firstMessageSubject());
    }
    return results;
}

string Thread::tableName() {
    return Thread::TABLE_NAME;
}

vector<string> Thread::columnsForQuery() {
    return vector<string>{"id", "data", "accountId", "version", "gThrId", "subject", "lastMessageTimestamp"};
}

void Thread::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":gThrId", gThrId());
    query->bind(":subject", subject());
    query->bind(":lastMessageTimestamp", (long long)lastMessageTimestamp());
}
