#include "mailrules/models/label.hpp"
#include "mailrules/mail_utils.hpp"


Label::Label(std::string id, std::string accountId, int version) :
    Folder(id, accountId, version)
{
}

Label::Label(std::string accountId, mailcore::IMAPFolder * remote, std::string role) :
    Folder(accountId, remote, role)
{
}

std::string Label::TABLE_NAME = "Label";

std::string Label::tableName() {
    return Label::TABLE_NAME;
}
