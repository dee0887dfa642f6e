#include "mailrules/models/message.hpp"
#include "mailrules/mail_utils.hpp"

using namespace std;
using namespace nlohmann;

string Message::TABLE_NAME = "Message";

Message::Message(SQLite::Statement & query) :
    MailModel(query)
{
}

Message::Message(json json) :
    MailModel(json)
{
    if (!_data.count("remoteFolder")) {
        _data["remoteFolder"] = {{"id", ""}, {"path", ""}};
    }
    if (!_data.count("remoteUID")) {
        _data["remoteUID"] = 0;
    }
}

uint32_t Message::remoteUID() {
    return _data["remoteUID"].get<uint32_t>();
}

void Message::setRemoteUID(uint32_t v) {
    _data["remoteUID"] = v;
}

json Message::remoteFolder() {
    return _data["remoteFolder"];
}

string Message::remoteFolderId() {
    return _data["remoteFolder"]["id"].get<string>();
}

string Message::remoteFolderPath() {
    return _data["remoteFolder"]["path"].get<string>();
}

void Message::setRemoteFolder(json folder) {
    _data["remoteFolder"] = folder;
}

void Message::setRemoteFolder(Folder * folder) {
    _data["remoteFolder"] = folder->toJSON();
}

string Message::threadId() {
    return _data.count("threadId") ? _data["threadId"].get<string>() : "";
}

time_t Message::date() {
    return _data.count("date") ? _data["date"].get<time_t>() : 0;
}

string Message::subject() {
    return _data.count("subject") ? _data["subject"].get<string>() : "";
}

string Message::gThrId() {
    return _data.count("gThrId") ? _data["gThrId"].get<string>() : "";
}

string Message::headerMessageId() {
    return _data.count("hMsgId") ? _data["hMsgId"].get<string>() : "";
}

string Message::tableName() {
    return Message::TABLE_NAME;
}

vector<string> Message::columnsForQuery() {
    return vector<string>{"id", "data", "accountId", "version", "headerMessageId", "gThrId", "subject", "date", "remoteUID", "remoteFolderId", "threadId"};
}

void Message::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":headerMessageId", headerMessageId());
    query->bind(":gThrId", gThrId());
    query->bind(":subject", subject());
    query->bind(":date", (long long)date());
    query->bind(":remoteUID", (long long)remoteUID());
    query->bind(":remoteFolderId", remoteFolderId());
    query->bind(":threadId", threadId());
}
