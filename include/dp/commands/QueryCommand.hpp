/**
 * QueryCommand.hpp - query-latest, query-search, query-by-type, query-tagged, query-users
 */

#pragma once

#include <string>
#include <vector>

#include "dp/Command.hpp"
#include "dp/Intent.hpp"

namespace dp {

struct QueryParams {
    Operation operation = Operation::QUERY_LATEST;
    int count = 10;
    std::string content_type = "article";
    std::string search_term;
    std::vector<std::string> tags;
    std::string role;

    static QueryParams fromJson(Operation operation, const nlohmann::json& params);
};

class QueryCommand : public Command {
public:
    QueryCommand(QueryParams params, CommandContext& context);

    std::string name() const override { return toString(params_.operation); }
    std::vector<std::string> problems() const override;
    Result execute() override;

    // GraphQL document for the parameters; user values are JSON-escaped
    std::string buildQuery() const;

private:
    QueryParams params_;
    CommandContext& context_;
};

// "article" -> "NodeArticle", "landing_page" -> "NodeLandingPage"
std::string nodeTypeName(const std::string& content_type);

// JSON string literal, quotes included
std::string graphqlString(const std::string& value);

} // namespace dp
