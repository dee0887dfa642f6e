/** Account [MailRules]
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

#ifndef Account_hpp
#define Account_hpp

#include <stdio.h>
#include <string>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailrules/models/mail_model.hpp"


class Account : public MailModel {

public:
    static std::string TABLE_NAME;

    Account(nlohmann::json json);

    std::string valid();

    std::string provider();
    std::string emailAddress();

    unsigned int IMAPPort();
    std::string IMAPHost();
    std::string IMAPUsername();
    std::string IMAPPassword();
    std::string IMAPSecurity();
    std::string IMAPOAuth2Token();
    bool IMAPAllowInsecureSSL();

    std::string tableName();

    std::vector<std::string> columnsForQuery();
};

#endif /* Account_hpp */
