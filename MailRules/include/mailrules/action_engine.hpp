/** ActionEngine [MailRules]
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

#ifndef ActionEngine_hpp
#define ActionEngine_hpp

#include <stdio.h>
#include <chrono>
#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "mailrules/action_aggregator.hpp"
#include "mailrules/action_dispatcher.hpp"
#include "mailrules/batch_exception.hpp"
#include "mailrules/dispatch_report.hpp"
#include "mailrules/entity_dataset.hpp"
#include "mailrules/entity_traits.hpp"
#include "mailrules/mailbox_service.hpp"
#include "mailrules/session_context.hpp"

/*
 Applies the actions of one batch. Instantiated for Thread and Message.

 Once every grouped call has succeeded, every entity in the batch gets the
 processed label (when one is configured) and loses the unprocessed label.
 An exception from any earlier call skips this, so a failed batch is left
 unprocessed and will be picked up again. A mailbox without labels is
 rejected before the first call.
 */
template<typename Entity>
class ActionEngine {
    typedef EntityTraits<Entity> Traits;

    MailboxService * _service;
    SessionContext * _session;
    std::shared_ptr<spdlog::logger> logger;

public:
    ActionEngine(MailboxService * service, SessionContext * session) :
        _service(service),
        _session(session),
        logger(spdlog::get("logger"))
    {
    }

    DispatchReport applyAllActions(EntityDataset<Entity> & dataset) {
        DispatchReport report;
        report.setEntityCount(dataset.allEntities().size());

        if (dataset.empty()) {
            logger->info("No {} to process", Traits::noun());
            return report;
        }

        auto start = std::chrono::steady_clock::now();

        ActionAggregator<Entity> aggregator;
        ActionGroups<Entity> groups = aggregator.aggregate(dataset);

        if (!_service->supportsLabels()) {
            throw BatchException("labels-unsupported", "The mailbox cannot hold labels, so the batch could never be marked as processed.", false);
        }

        for (auto & entry : dataset.entries) {
            logger->info("apply action {} to {} \"{}\"", entry.second.toJSON().dump(), entry.first->id(), entry.first->subject());
        }

        ActionDispatcher<Entity> dispatcher{_service, _session};
        dispatcher.dispatch(groups, dataset, report);

        markAsProcessed(dataset, report);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        logger->info("Applied batch of {} {} with {} calls in {}ms", report.entityCount(), Traits::noun(), report.callCount(), elapsed.count());
        return report;
    }

    void markAsProcessed(EntityDataset<Entity> & dataset, DispatchReport & report) {
        auto all = dataset.allEntities();
        SessionConfig & config = _session->config();

        std::string processed = config.processedLabel();
        if (processed != "") {
            Traits::addLabel(_service, _session->getOrCreateLabel(processed), all);
            report.record("add_label", processed, all.size());
        }

        std::string unprocessed = config.unprocessedLabel();
        Traits::removeLabel(_service, _session->getOrCreateLabel(unprocessed), all);
        report.record("remove_label", unprocessed, all.size());

        logger->info("Mark as processed: {} {}", all.size(), Traits::noun());
    }
};

#endif /* ActionEngine_hpp */
