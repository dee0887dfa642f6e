#include "mailrules/query.hpp"
#include "mailrules/mail_utils.hpp"
#include "mailrules/batch_exception.hpp"

using namespace nlohmann;
using namespace std;

// SQLite refuses statements with more than 999 bound parameters.
#define MAX_BOUND_VALUES 999

Query::Query() noexcept : _limit(0) {
}

Query & Query::add(string col, string op, json values) {
    if (col == "") {
        throw BatchException("query-builder", "Query conditions need a column name", false);
    }
    _clauses.push_back(QueryClause{col, op, values});
    return *this;
}

Query & Query::equal(string col, string val) {
    return add(col, "=", json::array({val}));
}

Query & Query::equal(string col, double val) {
    return add(col, "=", json::array({val}));
}

Query & Query::equal(string col, const vector<string> & vals) {
    if (vals.size() > MAX_BOUND_VALUES) {
        throw BatchException("query-builder", "Too many values for " + col + " IN (): " + to_string(vals.size()), false);
    }
    json values = json::array();
    for (auto & val : vals) {
        values.push_back(val);
    }
    return add(col, "IN", values);
}

Query & Query::orderBy(string col, bool ascending) {
    _orderBy = col + (ascending ? " ASC" : " DESC");
    return *this;
}

Query & Query::limit(int l) {
    _limit = l;
    return *this;
}

string Query::getSQL() {
    string result = "";

    for (size_t ii = 0; ii < _clauses.size(); ii ++) {
        QueryClause & clause = _clauses[ii];
        result += (ii == 0) ? " WHERE " : " AND ";

        if (clause.op == "IN") {
            if (clause.values.empty()) {
                result += "0 = 1";
            } else {
                result += clause.column + " IN (" + MailUtils::qmarks(clause.values.size()) + ")";
            }
        } else {
            result += clause.column + " " + clause.op + " ?";
        }
    }
    if (_orderBy != "") {
        result += " ORDER BY " + _orderBy;
    }
    if (_limit > 0) {
        result += " LIMIT " + to_string(_limit);
    }
    return result;
}

void Query::bind(SQLite::Statement & query) {
    int ii = 1;
    for (auto & clause : _clauses) {
        for (auto & value : clause.values) {
            if (value.is_number()) {
                query.bind(ii++, value.get<double>());
            } else if (value.is_string()) {
                query.bind(ii++, value.get<string>());
            } else {
                throw BatchException("query-builder", "Cannot bind " + value.dump() + " for " + clause.column, false);
            }
        }
    }
}
