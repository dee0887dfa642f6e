#include "mailrules/dispatch_report.hpp"

using namespace std;
using namespace nlohmann;


DispatchReport::DispatchReport() :
    _entities(0)
{
}

void DispatchReport::setEntityCount(size_t count) {
    _entities = count;
}

size_t DispatchReport::entityCount() {
    return _entities;
}

void DispatchReport::record(string op, string key, size_t count, size_t calls) {
    entries.push_back(DispatchReportEntry{op, key, count, calls});
}

size_t DispatchReport::callCount() {
    size_t total = 0;
    for (auto & entry : entries) {
        total += entry.calls;
    }
    return total;
}

vector<string> DispatchReport::ops() {
    vector<string> results{};
    for (auto & entry : entries) {
        results.push_back(entry.op + ":" + entry.key);
    }
    return results;
}

json DispatchReport::toJSON() {
    json operations = json::array();
    for (auto & entry : entries) {
        operations.push_back({
            {"op", entry.op},
            {"key", entry.key},
            {"count", entry.count},
            {"calls", entry.calls},
        });
    }
    return {
        {"entities", _entities},
        {"calls", callCount()},
        {"operations", operations},
    };
}
