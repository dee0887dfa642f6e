/** EntityDataset [MailRules]
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

#ifndef EntityDataset_hpp
#define EntityDataset_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "mailrules/batch_exception.hpp"
#include "mailrules/mail_action.hpp"
#include "mailrules/models/message.hpp"
#include "mailrules/models/thread.hpp"

// The entities of one batch with the action decided for each, in the order
// the batch listed them. Messages do not hold their thread; the dataset
// keeps an index of parent threads so thread-level operations can reach them.

template<typename Entity>
class EntityDataset {
    std::map<std::string, std::shared_ptr<Thread>> _threads;

public:
    std::vector<std::pair<std::shared_ptr<Entity>, MailAction>> entries;

    void add(std::shared_ptr<Entity> entity, MailAction action) {
        entries.push_back(std::make_pair(entity, action));
    }

    void addThread(std::shared_ptr<Thread> thread) {
        _threads[thread->id()] = thread;
    }

    bool hasThread(std::string threadId) {
        return _threads.count(threadId) > 0;
    }

    std::shared_ptr<Thread> threadFor(std::shared_ptr<Message> message) {
        auto it = _threads.find(message->threadId());
        if (it == _threads.end()) {
            throw BatchException(BATCH_MALFORMED_INPUT, "No thread loaded for message " + message->id(), false);
        }
        return it->second;
    }

    // Each entity once, in the order it first appears.
    std::vector<std::shared_ptr<Entity>> allEntities() {
        std::vector<std::shared_ptr<Entity>> results{};
        std::set<std::string> seen{};
        for (auto & entry : entries) {
            if (seen.insert(entry.first->id()).second) {
                results.push_back(entry.first);
            }
        }
        return results;
    }

    size_t size() {
        return entries.size();
    }

    bool empty() {
        return entries.empty();
    }
};

#endif /* EntityDataset_hpp */
