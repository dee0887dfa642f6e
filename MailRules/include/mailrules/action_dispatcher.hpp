/** ActionDispatcher [MailRules]
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

#ifndef ActionDispatcher_hpp
#define ActionDispatcher_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include <vector>

#include "spdlog/spdlog.h"

#include "mailrules/action_aggregator.hpp"
#include "mailrules/dispatch_report.hpp"
#include "mailrules/entity_dataset.hpp"
#include "mailrules/entity_traits.hpp"
#include "mailrules/mailbox_service.hpp"
#include "mailrules/session_context.hpp"

/*
 Turns aggregated groups into mailbox calls. The order is fixed: labels
 added, labels removed, categories, moves, importance, read state. Empty
 groups and Unset values never produce a call. The first failing call
 throws and nothing after it runs.
 */
template<typename Entity>
class ActionDispatcher {
    typedef EntityTraits<Entity> Traits;
    typedef std::vector<std::shared_ptr<Entity>> EntityList;

    MailboxService * _service;
    SessionContext * _session;
    std::shared_ptr<spdlog::logger> logger;

public:
    ActionDispatcher(MailboxService * service, SessionContext * session) :
        _service(service),
        _session(session),
        logger(spdlog::get("logger"))
    {
    }

    void dispatch(ActionGroups<Entity> & groups, EntityDataset<Entity> & dataset, DispatchReport & report) {
        applyLabels(groups, report);
        applyCategories(groups, report);
        applyMoves(groups, dataset, report);
        applyImportance(groups, report);
        applyReadStates(groups, dataset, report);
    }

    void applyLabels(ActionGroups<Entity> & groups, DispatchReport & report) {
        for (auto & pair : groups.labelsToAdd) {
            if (pair.second.empty()) continue;
            auto label = _session->getOrCreateLabel(pair.first);
            logger->info("add label {} to {} {}", pair.first, pair.second.size(), Traits::noun());
            Traits::addLabel(_service, label, pair.second);
            report.record("add_label", pair.first, pair.second.size());
        }
        for (auto & pair : groups.labelsToRemove) {
            if (pair.second.empty()) continue;
            auto label = _session->getOrCreateLabel(pair.first);
            logger->info("remove label {} from {} {}", pair.first, pair.second.size(), Traits::noun());
            Traits::removeLabel(_service, label, pair.second);
            report.record("remove_label", pair.first, pair.second.size());
        }
        logger->info("Updated labels");
    }

    void applyCategories(ActionGroups<Entity> & groups, DispatchReport & report) {
        for (auto & pair : groups.categories) {
            std::vector<MailCategory> add(pair.second.begin(), pair.second.end());
            std::vector<MailCategory> remove = MailActionUtils::complementOf(pair.second);

            std::string key = "";
            for (auto category : add) {
                key += (key == "" ? "" : ",") + MailActionUtils::toString(category);
            }
            Traits::reassignCategories(_service, pair.first, add, remove);
            report.record("reassign_categories", key, 1);
        }
        if (groups.categories.size() > 0) {
            logger->info("Updated categories of {} {}", groups.categories.size(), Traits::noun());
        }
    }

    void applyMoves(ActionGroups<Entity> & groups, EntityDataset<Entity> & dataset, DispatchReport & report) {
        for (auto state : ALL_MOVE_STATES) {
            EntityList & group = groups.moves[state];
            if (state == MoveState::Unset || group.empty()) {
                continue;
            }
            std::string key = MailActionUtils::toString(state);

            if (MailActionUtils::isRecordLevel(state)) {
                auto messages = Traits::messagesOf(dataset, group);
                if (messages.empty()) continue;
                logger->info("move {} messages to {}", messages.size(), key);
                for (auto & msg : messages) {
                    if (state == MoveState::RecordToInbox) {
                        _service->moveMessageToInbox(msg);
                    } else if (state == MoveState::RecordToArchive) {
                        _service->moveMessageToArchive(msg);
                    } else {
                        _service->moveMessageToTrash(msg);
                    }
                }
                report.record("move_messages", key, messages.size(), messages.size());
            } else {
                auto threads = Traits::threadsOf(dataset, group);
                logger->info("move {} threads to {}", threads.size(), key);
                if (state == MoveState::ToInbox) {
                    _service->moveThreadsToInbox(threads);
                } else if (state == MoveState::ToArchive) {
                    _service->moveThreadsToArchive(threads);
                } else {
                    _service->moveThreadsToTrash(threads);
                }
                report.record("move_threads", key, threads.size());
            }
        }
    }

    void applyImportance(ActionGroups<Entity> & groups, DispatchReport & report) {
        for (auto state : ALL_IMPORTANCE_STATES) {
            EntityList & group = groups.importance[state];
            if (state == ImportanceState::Unset || group.empty()) {
                continue;
            }
            std::string key = MailActionUtils::toString(state);
            logger->info("mark {} {} as {}", group.size(), Traits::noun(), key);
            if (state == ImportanceState::MarkImportant) {
                Traits::markImportant(_service, group);
            } else {
                Traits::markUnimportant(_service, group);
            }
            report.record("mark_importance", key, group.size());
        }
    }

    void applyReadStates(ActionGroups<Entity> & groups, EntityDataset<Entity> & dataset, DispatchReport & report) {
        for (auto state : ALL_READ_STATES) {
            EntityList & group = groups.reads[state];
            if (state == ReadState::Unset || group.empty()) {
                continue;
            }
            std::string key = MailActionUtils::toString(state);

            if (MailActionUtils::isRecordLevel(state)) {
                auto messages = Traits::messagesOf(dataset, group);
                if (messages.empty()) continue;
                logger->info("mark {} messages as {}", messages.size(), key);
                if (state == ReadState::RecordRead) {
                    _service->markMessagesRead(messages);
                } else {
                    _service->markMessagesUnread(messages);
                }
                report.record("mark_messages", key, messages.size());
            } else {
                auto threads = Traits::threadsOf(dataset, group);
                logger->info("mark {} threads as {}", threads.size(), key);
                if (state == ReadState::ThreadRead) {
                    _service->markThreadsRead(threads);
                } else {
                    _service->markThreadsUnread(threads);
                }
                report.record("mark_threads", key, threads.size());
            }
        }
        logger->info("Updated {} status", Traits::noun());
    }
};

#endif /* ActionDispatcher_hpp */
