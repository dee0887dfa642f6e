/** ActionAggregator [MailRules]
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

#ifndef ActionAggregator_hpp
#define ActionAggregator_hpp

#include <stdio.h>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

#include "mailrules/batch_exception.hpp"
#include "mailrules/entity_dataset.hpp"
#include "mailrules/entity_traits.hpp"
#include "mailrules/mail_action.hpp"

template<typename Entity>
struct ActionGroups {
    typedef std::vector<std::shared_ptr<Entity>> EntityList;

    // label name => entities
    std::map<std::string, EntityList> labelsToAdd;
    std::map<std::string, EntityList> labelsToRemove;

    // Not grouped: every entity with a non-empty category set, with its set.
    std::vector<std::pair<std::shared_ptr<Entity>, std::set<MailCategory>>> categories;

    // One entry per enum value, Unset included.
    std::map<MoveState, EntityList> moves;
    std::map<ImportanceState, EntityList> importance;
    std::map<ReadState, EntityList> reads;

    static nlohmann::json idsOf(const EntityList & list) {
        nlohmann::json ids = nlohmann::json::array();
        for (auto & entity : list) {
            ids.push_back(entity->id());
        }
        return ids;
    }

    nlohmann::json toJSON() const {
        nlohmann::json result = {
            {"labels_to_add", nlohmann::json::object()},
            {"labels_to_remove", nlohmann::json::object()},
            {"categories", nlohmann::json::array()},
            {"move", nlohmann::json::object()},
            {"important", nlohmann::json::object()},
            {"read", nlohmann::json::object()},
        };
        for (auto & pair : labelsToAdd) {
            result["labels_to_add"][pair.first] = idsOf(pair.second);
        }
        for (auto & pair : labelsToRemove) {
            result["labels_to_remove"][pair.first] = idsOf(pair.second);
        }
        for (auto & pair : categories) {
            nlohmann::json cats = nlohmann::json::array();
            for (auto category : pair.second) {
                cats.push_back(MailActionUtils::toString(category));
            }
            result["categories"].push_back({{"id", pair.first->id()}, {"categories", cats}});
        }
        for (auto & pair : moves) {
            result["move"][MailActionUtils::toString(pair.first)] = idsOf(pair.second);
        }
        for (auto & pair : importance) {
            result["important"][MailActionUtils::toString(pair.first)] = idsOf(pair.second);
        }
        for (auto & pair : reads) {
            result["read"][MailActionUtils::toString(pair.first)] = idsOf(pair.second);
        }
        return result;
    }
};

/*
 Partitions a dataset along each dimension in one pass. Throws malformed-input
 for an empty label name, or when an entity listed more than once carries
 different move, importance, read or category values. Repeated listings
 with the same values are merged, so no group names an entity twice.
 Every message must have its thread in the dataset.
 */
template<typename Entity>
class ActionAggregator {
    typedef EntityTraits<Entity> Traits;

public:
    ActionGroups<Entity> aggregate(EntityDataset<Entity> & dataset) {
        ActionGroups<Entity> groups;
        for (auto state : ALL_MOVE_STATES) {
            groups.moves[state] = {};
        }
        for (auto state : ALL_IMPORTANCE_STATES) {
            groups.importance[state] = {};
        }
        for (auto state : ALL_READ_STATES) {
            groups.reads[state] = {};
        }

        std::map<std::string, const MailAction *> firstActions{};
        std::set<std::pair<std::string, std::string>> added{};
        std::set<std::pair<std::string, std::string>> removed{};

        for (auto & entry : dataset.entries) {
            auto & entity = entry.first;
            const MailAction & action = entry.second;
            std::string id = entity->id();

            for (auto & name : action.labelsToAdd) {
                if (name == "") {
                    throw BatchException(BATCH_MALFORMED_INPUT, "Empty label name in labels_to_add of " + id, false);
                }
                if (added.insert(std::make_pair(name, id)).second) {
                    groups.labelsToAdd[name].push_back(entity);
                }
            }
            for (auto & name : action.labelsToRemove) {
                if (name == "") {
                    throw BatchException(BATCH_MALFORMED_INPUT, "Empty label name in labels_to_remove of " + id, false);
                }
                if (removed.insert(std::make_pair(name, id)).second) {
                    groups.labelsToRemove[name].push_back(entity);
                }
            }

            auto prior = firstActions.find(id);
            if (prior != firstActions.end()) {
                const MailAction * first = prior->second;
                if (first->moveState() != action.moveState() ||
                    first->importance() != action.importance() ||
                    first->readState() != action.readState() ||
                    first->categories != action.categories) {
                    throw BatchException(BATCH_MALFORMED_INPUT, "Inconsistent actions for " + Traits::noun() + " " + id + ": " + first->toJSON().dump() + " and " + action.toJSON().dump(), false);
                }
                continue;
            }
            firstActions[id] = &action;

            if (action.categories.size() > 0) {
                groups.categories.push_back(std::make_pair(entity, action.categories));
            }
            groups.moves[action.moveState()].push_back(entity);
            groups.importance[action.importance()].push_back(entity);
            groups.reads[action.readState()].push_back(entity);
        }

        // Throws for a message whose thread is not loaded.
        Traits::threadsOf(dataset, dataset.allEntities());

        return groups;
    }
};

#endif /* ActionAggregator_hpp */
