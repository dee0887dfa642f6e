/** DispatchReport [MailRules]
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

#ifndef DispatchReport_hpp
#define DispatchReport_hpp

#include <stdio.h>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

struct DispatchReportEntry {
    std::string op;
    std::string key;
    size_t count;
    size_t calls;
};

// What a batch asked of the mailbox service, in the order it was asked.

class DispatchReport {
    size_t _entities;

public:
    std::vector<DispatchReportEntry> entries;

    DispatchReport();

    void setEntityCount(size_t count);
    size_t entityCount();

    void record(std::string op, std::string key, size_t count, size_t calls = 1);

    size_t callCount();
    std::vector<std::string> ops();

    nlohmann::json toJSON();
};

#endif /* DispatchReport_hpp */
