#include <algorithm>

#include "mailrules/mail_store.hpp"
#include "mailrules/constants.hpp"

using namespace std;


MailStore::MailStore() :
    _db(MailUtils::getEnvUTF8("CONFIG_DIR_PATH") + FS_PATH_SEP + "edgehill.db", SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)
{
    _db.setBusyTimeout(10 * 1000);
}

MailStore::MailStore(string path) :
    _db(path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)
{
    _db.setBusyTimeout(10 * 1000);
}

void MailStore::migrate() {
    SQLite::Statement uv(_db, "PRAGMA user_version");
    uv.executeStep();
    int version = uv.getColumn(0).getInt();

    if (version == 0) {
        for (string sql : SETUP_QUERIES) {
            SQLite::Statement(_db, sql).exec();
        }
    }

    SQLite::Statement(_db, "PRAGMA user_version = 1").exec();
}

SQLite::Database & MailStore::db()
{
    return this->_db;
}

void MailStore::save(MailModel * model) {
    vector<string> cols = model->columnsForQuery();
    string colList = "";
    string valList = "";
    for (size_t ii = 0; ii < cols.size(); ii ++) {
        if (ii > 0) {
            colList += ", ";
            valList += ", ";
        }
        colList += cols[ii];
        valList += ":" + cols[ii];
    }

    SQLite::Statement query(_db, "INSERT OR REPLACE INTO " + model->tableName() + " (" + colList + ") VALUES (" + valList + ")");
    model->bindToQuery(&query);
    query.exec();
}

vector<shared_ptr<Thread>> MailStore::findThreadsWithMessages(vector<string> & threadIds) {
    auto threads = findLargeSet<Thread>("id", threadIds);
    auto messages = findLargeSet<Message>("threadId", threadIds, "date");

    map<string, vector<shared_ptr<Message>>> messagesByThread{};
    for (auto & msg : messages) {
        messagesByThread[msg->threadId()].push_back(msg);
    }
    for (auto & thread : threads) {
        thread->setMessages(messagesByThread[thread->id()]);
    }
    return threads;
}
