/** MailStore [MailRules]
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

#ifndef MailStore_hpp
#define MailStore_hpp

#include <stdint.h>
#include <stdio.h>
#include <string>
#include <map>
#include <memory>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"
#include "nlohmann/json.hpp"

#include "mailrules/models/message.hpp"
#include "mailrules/models/thread.hpp"
#include "mailrules/query.hpp"
#include "mailrules/mail_utils.hpp"


// Read access to the threads and messages synced into the local mail
// database. Batches resolve their entity ids here before the engine runs.

class MailStore {
    SQLite::Database _db;

public:
    MailStore();
    MailStore(std::string path);

    void migrate();

    SQLite::Database & db();

    void save(MailModel * model);

    // Threads with their full, date-ordered message lists attached.
    std::vector<std::shared_ptr<Thread>> findThreadsWithMessages(std::vector<std::string> & threadIds);

    // Templated so each model class can be inflated from its own table.

    template<typename ModelClass>
    std::shared_ptr<ModelClass> find(Query & query) {
        query.limit(1);
        SQLite::Statement statement(this->_db, "SELECT data FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);
        if (statement.executeStep()) {
            return std::make_shared<ModelClass>(statement);
        }
        return nullptr;
    }

    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findAll(Query & query) {
        SQLite::Statement statement(this->_db, "SELECT data FROM " + ModelClass::TABLE_NAME + query.getSQL());
        query.bind(statement);

        std::vector<std::shared_ptr<ModelClass>> results;
        while (statement.executeStep()) {
            results.push_back(std::make_shared<ModelClass>(statement));
        }
        return results;
    }

    // Looks up `colname IN (values)` in chunks SQLite can bind. Results are
    // only ordered within a chunk.
    template<typename ModelClass>
    std::vector<std::shared_ptr<ModelClass>> findLargeSet(std::string colname, const std::vector<std::string> & values, std::string orderBy = "") {
        std::vector<std::shared_ptr<ModelClass>> all;

        for (auto & chunk : MailUtils::chunksOfVector(values, 900)) {
            Query q = Query().equal(colname, chunk);
            if (orderBy != "") {
                q.orderBy(orderBy);
            }
            auto results = this->findAll<ModelClass>(q);
            all.insert(all.end(), results.begin(), results.end());
        }
        return all;
    }
};

#endif /* MailStore_hpp */
