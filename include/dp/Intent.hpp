/**
 * Intent.hpp - Resolved operation plus typed parameters
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dp {

enum class Operation {
    CREATE_POST,
    EDIT_NODE,
    DELETE_NODE,
    UPLOAD_MEDIA,
    RUN_DRUSH,
    QUERY_LATEST,
    QUERY_SEARCH,
    QUERY_BY_TYPE,
    QUERY_TAGGED,
    QUERY_USERS,
    CREATE_SITE,
    START_SITE,
    STOP_SITE,
    RESTART_SITE,
    STATUS_SITE,
    UNKNOWN
};

// "create-post", "status-site", ...
std::string toString(Operation op);

// Returns Operation::UNKNOWN for anything not in the vocabulary
Operation operationFromString(const std::string& name);

// Every operation except UNKNOWN, in declaration order
const std::vector<Operation>& allOperations();

enum class IntentSource {
    RULE_MATCHED,
    AI_INFERRED,
    UNRESOLVED
};

std::string toString(IntentSource source);

struct Intent {
    Operation operation = Operation::UNKNOWN;
    nlohmann::json parameters = nlohmann::json::object();
    IntentSource source = IntentSource::UNRESOLVED;
    std::string raw_text;
    int rule_index = -1;    // index into the pattern table, -1 when no rule fired

    bool resolved() const { return operation != Operation::UNKNOWN; }
};

} // namespace dp
