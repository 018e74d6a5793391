/**
 * QueryCommand.cpp - query-latest, query-search, query-by-type, query-tagged, query-users
 */

#include "dp/commands/QueryCommand.hpp"
#include "dp/commands/ContentCommands.hpp"
#include "dp/DrupalClient.hpp"
#include "dp/Log.hpp"
#include "dp/ParameterExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace dp {

std::string nodeTypeName(const std::string& content_type) {
    std::string name = "Node";
    bool upper = true;
    for (char c : content_type) {
        if (c == '_' || c == '-' || c == ' ') {
            upper = true;
            continue;
        }
        name += upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        upper = false;
    }
    return name;
}

std::string graphqlString(const std::string& value) {
    return dumpJson(json(value));
}

QueryParams QueryParams::fromJson(Operation operation, const json& params) {
    ParamReader reader(params, toString(operation));
    QueryParams p;
    p.operation = operation;

    switch (operation) {
        case Operation::QUERY_LATEST: {
            auto count = reader.integer("count", false);
            p.count = clampLimit(count ? *count : 10);
            p.content_type = reader.text("content_type", false, "article");
            break;
        }
        case Operation::QUERY_SEARCH:
            p.search_term = reader.text("search_term", true);
            p.content_type = reader.text("content_type", false, "article");
            break;
        case Operation::QUERY_BY_TYPE:
            p.content_type = reader.text("content_type", true);
            break;
        case Operation::QUERY_TAGGED:
            p.tags = reader.list("tags");
            reader.requireOneOf("tags", !p.tags.empty());
            p.content_type = reader.text("content_type", false, "article");
            break;
        case Operation::QUERY_USERS:
            p.role = reader.text("role", true);
            std::transform(p.role.begin(), p.role.end(), p.role.begin(), ::tolower);
            break;
        default:
            throw Error(ErrorKind::UNKNOWN_OPERATION,
                        toString(operation) + " is not a query operation");
    }

    // "limit" is accepted for every query kind
    if (operation != Operation::QUERY_LATEST) {
        auto limit = reader.integer("limit", false);
        if (limit) p.count = clampLimit(*limit);
    }

    reader.finish();
    std::transform(p.content_type.begin(), p.content_type.end(), p.content_type.begin(), ::tolower);
    return p;
}

QueryCommand::QueryCommand(QueryParams params, CommandContext& context)
    : params_(std::move(params)), context_(context) {}

std::vector<std::string> QueryCommand::problems() const {
    std::vector<std::string> found;

    if (params_.operation != Operation::QUERY_USERS && !isMachineName(params_.content_type)) {
        found.push_back("content type '" + params_.content_type + "' is not a machine name (e.g. article, page)");
    }
    if (params_.operation == Operation::QUERY_USERS && !isMachineName(params_.role)) {
        found.push_back("role '" + params_.role + "' is not a machine name (e.g. administrator, editor)");
    }
    if (params_.operation == Operation::QUERY_SEARCH && params_.search_term.size() < 2) {
        found.push_back("search term must be at least two characters");
    }
    return found;
}

std::string QueryCommand::buildQuery() const {
    std::ostringstream q;
    const std::string type = graphqlString(params_.content_type);
    const std::string fragment = nodeTypeName(params_.content_type);

    switch (params_.operation) {
        case Operation::QUERY_USERS:
            q << "query {\n"
              << "  userQuery(filter: {conditions: [\n"
              << "    {field: \"roles\", value: " << graphqlString(params_.role) << "}\n"
              << "  ]}, limit: " << params_.count << ") {\n"
              << "    count\n"
              << "    entities { ... on User { name mail uid created } }\n"
              << "  }\n"
              << "}";
            return q.str();

        case Operation::QUERY_SEARCH:
            q << "query {\n"
              << "  nodeQuery(filter: {conditions: [\n"
              << "    {field: \"type\", value: " << type << "},\n"
              << "    {field: \"title\", value: " << graphqlString("%" + params_.search_term + "%") << ", operator: LIKE},\n"
              << "    {field: \"status\", value: \"1\"}\n"
              << "  ]}, limit: " << params_.count << ") {\n"
              << "    count\n"
              << "    entities { ... on " << fragment << " { nid title created body { value } } }\n"
              << "  }\n"
              << "}";
            return q.str();

        case Operation::QUERY_TAGGED: {
            std::string tags;
            for (const auto& tag : params_.tags) {
                if (!tags.empty()) tags += ", ";
                tags += graphqlString(tag);
            }
            q << "query {\n"
              << "  nodeQuery(filter: {conditions: [\n"
              << "    {field: \"type\", value: " << type << "},\n"
              << "    {field: \"field_tags.entity.name\", value: [" << tags << "], operator: IN},\n"
              << "    {field: \"status\", value: \"1\"}\n"
              << "  ]}, limit: " << params_.count << ") {\n"
              << "    count\n"
              << "    entities { ... on " << fragment << " { nid title created fieldTags { entity { entityLabel } } } }\n"
              << "  }\n"
              << "}";
            return q.str();
        }

        case Operation::QUERY_BY_TYPE:
        case Operation::QUERY_LATEST:
        default:
            q << "query {\n"
              << "  nodeQuery(filter: {conditions: [\n"
              << "    {field: \"type\", value: " << type << "},\n"
              << "    {field: \"status\", value: \"1\"}\n"
              << "  ]}, sort: [{field: \"created\", direction: DESC}], limit: " << params_.count << ") {\n"
              << "    count\n"
              << "    entities { ... on " << fragment << " { nid title created } }\n"
              << "  }\n"
              << "}";
            return q.str();
    }
}

Result QueryCommand::execute() {
    std::string query = buildQuery();

    log::debug("query", query);
    json data = context_.backend.query(query);

    const char* root = params_.operation == Operation::QUERY_USERS ? "userQuery" : "nodeQuery";
    json items = json::array();
    if (data.contains(root) && data[root].is_object() &&
        data[root].contains("entities") && data[root]["entities"].is_array()) {
        for (const auto& entity : data[root]["entities"]) {
            // Entities of another bundle come back as null or {}
            if (entity.is_object() && !entity.empty()) {
                items.push_back(entity);
            }
        }
    }

    json result = {
        {"query_type", toString(params_.operation)},
        {"items", items},
        {"count", items.size()}
    };
    if (params_.operation == Operation::QUERY_USERS) {
        result["role"] = params_.role;
    } else {
        result["content_type"] = params_.content_type;
    }
    if (params_.operation == Operation::QUERY_SEARCH) result["search_term"] = params_.search_term;
    if (params_.operation == Operation::QUERY_TAGGED) result["tags"] = params_.tags;

    std::string what = params_.operation == Operation::QUERY_USERS ? "user" : params_.content_type;
    return Result::ok("Found " + std::to_string(items.size()) + " " + what +
                          (items.size() == 1 ? "" : "s"),
                      result);
}

} // namespace dp
