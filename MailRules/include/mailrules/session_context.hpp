/** SessionContext [MailRules]
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

#ifndef SessionContext_hpp
#define SessionContext_hpp

#include <stdio.h>
#include <time.h>
#include <map>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "mailrules/mail_action.hpp"
#include "mailrules/models/label.hpp"

class MailboxService;

class SessionConfig {
    nlohmann::json _data;

public:
    SessionConfig(nlohmann::json json);

    std::string valid();

    std::string processedLabel();
    std::string unprocessedLabel();
    int maxAgeDays();

    // Label path configured for a category, or "" to use the default.
    std::string categoryLabel(MailCategory category);
};

/*
 State shared by every batch of one run: the configuration and the labels
 resolved so far. Resolving the same name twice returns the same Label.
 */
class SessionContext {
    SessionConfig _config;
    MailboxService * _service;
    std::map<std::string, std::shared_ptr<Label>> _labels;
    time_t _startedAt;
    std::shared_ptr<spdlog::logger> logger;

public:
    SessionContext(SessionConfig config, MailboxService * service, time_t startedAt = time(0));

    SessionConfig & config();

    std::shared_ptr<Label> getOrCreateLabel(std::string name);

    // Messages dated at or before this are not acted on unless they are the
    // latest of their thread. 0 when no maximum age is configured.
    time_t oldestToProcess();
};

#endif /* SessionContext_hpp */
