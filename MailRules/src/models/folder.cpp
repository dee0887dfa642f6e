#include "mailrules/models/folder.hpp"
#include "mailrules/mail_utils.hpp"

std::string Folder::TABLE_NAME = "Folder";

Folder::Folder(nlohmann::json & json) :
    MailModel(json)
{
}

Folder::Folder(std::string id, std::string accountId, int version) :
    MailModel(id, accountId, version)
{
    _data["path"] = "";
    _data["role"] = "";
}

Folder::Folder(std::string accountId, mailcore::IMAPFolder * remote, std::string role) :
    MailModel(MailUtils::idForFolder(accountId, remote->path()->UTF8Characters()), accountId, 0)
{
    _data["path"] = remote->path()->UTF8Characters();
    _data["role"] = role;
}

std::string Folder::path() {
    return _data["path"].get<std::string>();
}

void Folder::setPath(std::string path) {
    _data["path"] = path;
}

std::string Folder::role() const {
    return _data["role"].get<std::string>();
}

void Folder::setRole(std::string role) {
    _data["role"] = role;
}

std::string Folder::tableName() {
    return Folder::TABLE_NAME;
}

std::vector<std::string> Folder::columnsForQuery() {
    return std::vector<std::string>{"id", "data", "accountId", "version", "path", "role"};
}

void Folder::bindToQuery(SQLite::Statement * query) {
    MailModel::bindToQuery(query);
    query->bind(":path", path());
    query->bind(":role", role());
}
