/** Query [MailRules]
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

#ifndef Query_hpp
#define Query_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "SQLiteCpp/SQLiteCpp.h"

#include "nlohmann/json.hpp"

// A single `col op ?` condition. `values` holds one value, or several for an
// IN clause.
struct QueryClause {
    std::string column;
    std::string op;
    nlohmann::json values;
};

/*
 Builds the WHERE / ORDER BY / LIMIT tail of a SELECT against one model
 table. Conditions are ANDed in the order they were added. An IN clause
 with no values matches nothing.
 */
class Query {
    std::vector<QueryClause> _clauses;
    std::string _orderBy;
    int _limit;

    Query & add(std::string col, std::string op, nlohmann::json values);

public:
    Query() noexcept;

    Query & equal(std::string col, std::string val);
    Query & equal(std::string col, double val);
    Query & equal(std::string col, const std::vector<std::string> & vals);

    Query & orderBy(std::string col, bool ascending = true);
    Query & limit(int l);

    std::string getSQL();

    void bind(SQLite::Statement & query);
};


#endif /* Query_hpp */
