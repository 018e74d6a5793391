/**
 * Intent.cpp - Operation vocabulary
 */

#include "dp/Intent.hpp"

#include <utility>

namespace dp {

namespace {

const std::vector<std::pair<Operation, std::string>>& operationNames() {
    static const std::vector<std::pair<Operation, std::string>> names = {
        {Operation::CREATE_POST,   "create-post"},
        {Operation::EDIT_NODE,     "edit-node"},
        {Operation::DELETE_NODE,   "delete-node"},
        {Operation::UPLOAD_MEDIA,  "upload-media"},
        {Operation::RUN_DRUSH,     "run-drush"},
        {Operation::QUERY_LATEST,  "query-latest"},
        {Operation::QUERY_SEARCH,  "query-search"},
        {Operation::QUERY_BY_TYPE, "query-by-type"},
        {Operation::QUERY_TAGGED,  "query-tagged"},
        {Operation::QUERY_USERS,   "query-users"},
        {Operation::CREATE_SITE,   "create-site"},
        {Operation::START_SITE,    "start-site"},
        {Operation::STOP_SITE,     "stop-site"},
        {Operation::RESTART_SITE,  "restart-site"},
        {Operation::STATUS_SITE,   "status-site"},
    };
    return names;
}

} // anonymous namespace

std::string toString(Operation op) {
    for (const auto& entry : operationNames()) {
        if (entry.first == op) {
            return entry.second;
        }
    }
    return "unknown";
}

Operation operationFromString(const std::string& name) {
    for (const auto& entry : operationNames()) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    return Operation::UNKNOWN;
}

const std::vector<Operation>& allOperations() {
    static const std::vector<Operation> ops = [] {
        std::vector<Operation> out;
        for (const auto& entry : operationNames()) {
            out.push_back(entry.first);
        }
        return out;
    }();
    return ops;
}

std::string toString(IntentSource source) {
    switch (source) {
        case IntentSource::RULE_MATCHED: return "rule-matched";
        case IntentSource::AI_INFERRED:  return "ai-inferred";
        case IntentSource::UNRESOLVED:   return "unresolved";
    }
    return "unresolved";
}

} // namespace dp
