/** Message [MailRules]
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

#ifndef Message_hpp
#define Message_hpp

#include <stdio.h>
#include <vector>
#include <string>
#include "SQLiteCpp/SQLiteCpp.h"

#include "mailrules/models/mail_model.hpp"
#include "mailrules/models/folder.hpp"

#include "nlohmann/json.hpp"


class Message : public MailModel {

public:
    static std::string TABLE_NAME;

    Message(SQLite::Statement & query);
    Message(nlohmann::json json);

    // remote location. Changes when the message is moved to another folder.

    uint32_t remoteUID();
    void setRemoteUID(uint32_t v);

    nlohmann::json remoteFolder();
    std::string remoteFolderId();
    std::string remoteFolderPath();
    void setRemoteFolder(nlohmann::json folder);
    void setRemoteFolder(Folder * folder);

    // immutable attributes

    std::string threadId();
    time_t date();
    std::string subject();
    std::string gThrId();
    std::string headerMessageId();

    std::string tableName();
    std::vector<std::string> columnsForQuery();
    void bindToQuery(SQLite::Statement * query);
};

#endif /* Message_hpp */
