#include "mailrules/session_context.hpp"
#include "mailrules/mailbox_service.hpp"
#include "mailrules/batch_exception.hpp"

using namespace std;
using namespace nlohmann;


SessionConfig::SessionConfig(json json) :
    _data(json)
{
    if (!_data.is_object()) {
        throw BatchException(BATCH_MALFORMED_INPUT, "The session configuration must be a JSON object.", false);
    }
}

string SessionConfig::valid() {
    if (!_data.count("unprocessed_label") || !_data["unprocessed_label"].is_string()) {
        return "unprocessed_label";
    }
    if (_data["unprocessed_label"].get<string>() == "") {
        return "unprocessed_label";
    }
    if (_data.count("processed_label") && !_data["processed_label"].is_string()) {
        return "processed_label";
    }
    if (_data.count("max_age_days") && !(_data["max_age_days"].is_number_integer() && _data["max_age_days"].get<int>() >= 0)) {
        return "max_age_days";
    }
    if (_data.count("category_labels")) {
        if (!_data["category_labels"].is_object()) {
            return "category_labels";
        }
        for (auto it = _data["category_labels"].begin(); it != _data["category_labels"].end(); ++it) {
            bool known = false;
            for (auto category : ALL_MAIL_CATEGORIES) {
                if (MailActionUtils::toString(category) == it.key()) known = true;
            }
            if (!known || !it.value().is_string() || it.value().get<string>() == "") {
                return "category_labels." + it.key();
            }
        }
    }
    return "";
}

string SessionConfig::processedLabel() {
    return _data.count("processed_label") ? _data["processed_label"].get<string>() : "";
}

string SessionConfig::unprocessedLabel() {
    return _data["unprocessed_label"].get<string>();
}

int SessionConfig::maxAgeDays() {
    return _data.count("max_age_days") ? _data["max_age_days"].get<int>() : 0;
}

string SessionConfig::categoryLabel(MailCategory category) {
    string key = MailActionUtils::toString(category);
    if (_data.count("category_labels") && _data["category_labels"].count(key)) {
        return _data["category_labels"][key].get<string>();
    }
    return "";
}

// SessionContext

SessionContext::SessionContext(SessionConfig config, MailboxService * service, time_t startedAt) :
    _config(config),
    _service(service),
    _startedAt(startedAt),
    logger(spdlog::get("logger"))
{
}

SessionConfig & SessionContext::config() {
    return _config;
}

shared_ptr<Label> SessionContext::getOrCreateLabel(string name) {
    if (name == "") {
        throw BatchException(BATCH_MALFORMED_INPUT, "Label names cannot be empty.", false);
    }
    auto it = _labels.find(name);
    if (it != _labels.end()) {
        return it->second;
    }
    auto label = _service->findOrCreateLabel(name);
    if (label == nullptr) {
        throw BatchException("no-label", "Could not find or create label " + name, false);
    }
    logger->info("Resolved label \"{}\" to {}", name, label->path());
    _labels[name] = label;
    return label;
}

time_t SessionContext::oldestToProcess() {
    int days = _config.maxAgeDays();
    if (days <= 0) {
        return 0;
    }
    return _startedAt - (time_t)days * 24 * 60 * 60;
}
