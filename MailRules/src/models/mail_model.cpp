#include "mailrules/models/mail_model.hpp"
#include "mailrules/batch_exception.hpp"

using namespace std;
using namespace nlohmann;

string MailModel::TABLE_NAME = "MailModel";

/* Note: If creating a brand new object, pass version = 0. */
MailModel::MailModel(string id, string accountId, int version) :
    _data({{"id", id},{"aid", accountId}, {"v", version}})
{
}

MailModel::MailModel(SQLite::Statement & query) :
    _data(json::parse(query.getColumn("data").getString()))
{
}

MailModel::MailModel(json json) :
    _data(json)
{
    if (!_data.is_object() || !_data.count("id") || !_data["id"].is_string()) {
        throw BatchException(BATCH_MALFORMED_INPUT, "Models must be JSON objects with a string `id`.", false);
    }
    if (!_data.count("aid")) {
        _data["aid"] = "";
    }
    if (!_data.count("v")) {
        _data["v"] = 0;
    }
}

string MailModel::id()
{
    return _data["id"].get<std::string>();
}

string MailModel::accountId()
{
    return _data["aid"].get<std::string>();
}

int MailModel::version()
{
    return _data["v"].get<int>();
}

string MailModel::tableName()
{
    return TABLE_NAME;
}

json MailModel::toJSON()
{
    if (!_data.count("__cls")) {
        _data["__cls"] = this->tableName();
    }
    return _data;
}

void MailModel::bindToQuery(SQLite::Statement * query) {
    query->bind(":id", id());
    query->bind(":data", this->toJSON().dump());
    query->bind(":accountId", accountId());
    query->bind(":version", version());
}
