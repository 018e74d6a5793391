/**
 * PatternTable.cpp - Ordered rules mapping text shapes to operations
 */

#include "dp/PatternTable.hpp"

#include <utility>

namespace dp {

namespace {

const std::vector<std::string> AI_PROVIDERS = {"openai", "anthropic", "gemini", "ollama"};
const std::vector<std::string> PLATFORMS = {"ddev", "lando"};
const std::vector<std::string> CONTENT_TYPES = {"article", "page"};

const std::string NAME = R"(([a-zA-Z0-9][a-zA-Z0-9_-]*))";

ParamRole role(const std::string& name, RoleKind kind, int group) {
    ParamRole r;
    r.name = name;
    r.kind = kind;
    r.group = group;
    return r;
}

ParamRole optionalRole(const std::string& name, RoleKind kind, int group,
                       nlohmann::json fallback = nullptr) {
    ParamRole r = role(name, kind, group);
    r.mandatory = false;
    r.fallback = std::move(fallback);
    return r;
}

ParamRole vocabularyRole(const std::string& name, int group,
                         const std::vector<std::string>& vocabulary,
                         bool mandatory, nlohmann::json fallback = nullptr) {
    ParamRole r = role(name, RoleKind::ENUMERATED, group);
    r.vocabulary = vocabulary;
    r.mandatory = mandatory;
    r.fallback = std::move(fallback);
    return r;
}

ParamRole bounded(ParamRole r, size_t min_length, size_t max_length) {
    r.min_length = min_length;
    r.max_length = max_length;
    return r;
}

// Node titles are limited to 255 characters, machine names to 32
const size_t TITLE_LIMIT = 255;
const size_t MACHINE_NAME_LIMIT = 32;

// Extensions the media upload accepts
const std::string IMAGE_FILE = R"((["']?[^"']+?\.(?:png|jpe?g|gif|webp)["']?))";

ParamRole contentTypeRole() {
    return vocabularyRole("content_type", 0, CONTENT_TYPES, false, "article");
}

ParamRole projectRole(int group = 1) {
    return bounded(role("project_name", RoleKind::IDENTIFIER, group), 1, 64);
}

} // anonymous namespace

PatternTable::PatternTable(std::vector<PatternRule> rules) : rules_(std::move(rules)) {}

PatternRule PatternTable::rule(const std::string& pattern, Operation op,
                               std::vector<ParamRole> roles, nlohmann::json fixed) {
    PatternRule r;
    r.pattern = pattern;
    r.matcher = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    r.operation = op;
    r.roles = std::move(roles);
    r.fixed = fixed.is_object() ? std::move(fixed) : nlohmann::json::object();
    return r;
}

std::set<Operation> PatternTable::operations() const {
    std::set<Operation> ops;
    for (const auto& r : rules_) {
        ops.insert(r.operation);
    }
    return ops;
}

PatternTable PatternTable::standard() {
    std::vector<PatternRule> rules;

    // --- Content creation ---------------------------------------------------
    rules.push_back(rule(
        R"(generate.*(?:content|article|post|page).*(?:using|with)\s+(openai|anthropic|gemini|ollama)\b.*about\s+(.+))",
        Operation::CREATE_POST,
        {vocabularyRole("ai_provider", 1, AI_PROVIDERS, true),
         bounded(role("topic", RoleKind::FREE_TEXT, 2), 1, TITLE_LIMIT),
         contentTypeRole()}));

    rules.push_back(rule(
        R"((?:create|write|add).*(?:post|article|blog|page).*titled?\s+(["'].+?["'])(?:.*about\s+(.+))?)",
        Operation::CREATE_POST,
        {bounded(role("title", RoleKind::QUOTED_TEXT, 1), 1, TITLE_LIMIT),
         optionalRole("topic", RoleKind::FREE_TEXT, 2),
         vocabularyRole("ai_provider", 0, AI_PROVIDERS, false),
         contentTypeRole()}));

    rules.push_back(rule(
        R"((?:create|write|generate|draft).*(?:post|article|blog|page|content).*about\s+(.+))",
        Operation::CREATE_POST,
        {bounded(role("topic", RoleKind::FREE_TEXT, 1), 1, TITLE_LIMIT),
         vocabularyRole("ai_provider", 0, AI_PROVIDERS, false),
         contentTypeRole()}));

    // --- Node edits ---------------------------------------------------------
    rules.push_back(rule(
        R"((?:update|change|set).*node\s+#?([1-9]\d*).*?body\s+(?:to\s+)?(.+))",
        Operation::EDIT_NODE,
        {role("node_id", RoleKind::INTEGER, 1),
         role("body", RoleKind::QUOTED_TEXT, 2),
         contentTypeRole()}));

    rules.push_back(rule(
        R"((?:edit|update|change|rename).*(?:title|node)\s+(?:of\s+)?(?:node\s+)?#?([1-9]\d*).*?\bto\s+(.+))",
        Operation::EDIT_NODE,
        {role("node_id", RoleKind::INTEGER, 1),
         bounded(role("title", RoleKind::QUOTED_TEXT, 2), 1, TITLE_LIMIT),
         contentTypeRole()}));

    rules.push_back(rule(
        R"((?:delete|remove)\s+(?:the\s+)?(?:\w+\s+)?node\s+#?([1-9]\d*)\b)",
        Operation::DELETE_NODE,
        {role("node_id", RoleKind::INTEGER, 1),
         contentTypeRole()}));

    // --- Media --------------------------------------------------------------
    rules.push_back(rule(
        R"(upload\s+)" + IMAGE_FILE + R"(\s+(?:with\s+)?alt(?:\s+text)?\s+(.+))",
        Operation::UPLOAD_MEDIA,
        {role("file_path", RoleKind::PATH, 1),
         role("alt_text", RoleKind::QUOTED_TEXT, 2)}));

    rules.push_back(rule(
        R"(upload\s+)" + IMAGE_FILE + R"(\s*$)",
        Operation::UPLOAD_MEDIA,
        {role("file_path", RoleKind::PATH, 1)}));

    // --- Drush maintenance --------------------------------------------------
    rules.push_back(rule(
        R"(^drush\s+(.+))",
        Operation::RUN_DRUSH,
        {role("command", RoleKind::RAW, 1)}));

    rules.push_back(rule(R"((?:clear|flush).*cache)", Operation::RUN_DRUSH, {},
                         {{"command", "cache:rebuild"}}));

    rules.push_back(rule(R"(rebuild.*cache)", Operation::RUN_DRUSH, {},
                         {{"command", "cache:rebuild"}}));

    rules.push_back(rule(R"(run\s+(?:the\s+)?cron)", Operation::RUN_DRUSH, {},
                         {{"command", "cron:run"}}));

    rules.push_back(rule(R"((?:run\s+)?(?:database|db)\s+updates?|updatedb)", Operation::RUN_DRUSH, {},
                         {{"command", "updatedb"}}));

    rules.push_back(rule(R"(import\s+(?:the\s+)?config(?:uration)?)", Operation::RUN_DRUSH, {},
                         {{"command", "config:import"}}));

    rules.push_back(rule(R"(export\s+(?:the\s+)?config(?:uration)?)", Operation::RUN_DRUSH, {},
                         {{"command", "config:export"}}));

    rules.push_back(rule(
        R"(\b(?:enable|install)\s.*module\s+([a-zA-Z0-9_]+))",
        Operation::RUN_DRUSH,
        {role("module", RoleKind::IDENTIFIER, 1)},
        {{"command", "pm:enable"}}));

    rules.push_back(rule(
        R"(\b(?:disable|uninstall)\s.*module\s+([a-zA-Z0-9_]+))",
        Operation::RUN_DRUSH,
        {role("module", RoleKind::IDENTIFIER, 1)},
        {{"command", "pm:uninstall"}}));

    // --- Queries ------------------------------------------------------------
    rules.push_back(rule(
        R"((?:show|list|get|fetch|find).*(?:latest|recent|newest)\s+(?:(\d+)\s+)?(?:blog\s+)?(?:posts?|articles?|pages?))",
        Operation::QUERY_LATEST,
        {optionalRole("count", RoleKind::INTEGER, 1, 10),
         contentTypeRole()}));

    rules.push_back(rule(
        R"(fetch.*(?:articles?|nodes?|posts?).*containing.*word\s+(.+))",
        Operation::QUERY_SEARCH,
        {bounded(role("search_term", RoleKind::IDENTIFIER, 1), 2, 0),
         contentTypeRole()}));

    rules.push_back(rule(
        R"((?:find|search|look\s+for).*(?:posts?|articles?|nodes?|content|pages?).*(?:about|mentioning)\s+(.+))",
        Operation::QUERY_SEARCH,
        {bounded(role("search_term", RoleKind::FREE_TEXT, 1), 2, 0),
         contentTypeRole()}));

    rules.push_back(rule(
        R"((?:query|list|show|get).*nodes?.*(?:type|content[_ ]type)\s+["']?([a-zA-Z0-9_]+))",
        Operation::QUERY_BY_TYPE,
        {bounded(role("content_type", RoleKind::IDENTIFIER, 1), 1, MACHINE_NAME_LIMIT)}));

    rules.push_back(rule(
        R"((?:get|list|show|find).*(?:nodes?|posts?|articles?|content).*tagged\s+(?:with\s+)?(.+))",
        Operation::QUERY_TAGGED,
        {role("tags", RoleKind::LIST, 1),
         contentTypeRole()}));

    rules.push_back(rule(
        R"((?:get|show|list|find).*users?.*(?:with|having)\s+(?:the\s+)?role\s+["']?([a-zA-Z0-9_]+))",
        Operation::QUERY_USERS,
        {bounded(role("role", RoleKind::IDENTIFIER, 1), 1, MACHINE_NAME_LIMIT)}));

    // --- Site creation (before lifecycle so "create site ..." never reads as a site name) ---
    rules.push_back(rule(
        R"(create.*(?:site|project).*(?:named?|called)\s+["']?)" + NAME,
        Operation::CREATE_SITE,
        {projectRole(),
         vocabularyRole("platform", 0, PLATFORMS, false, "ddev")}));

    rules.push_back(rule(
        R"((?:set\s*up|install)\s+(?:a\s+)?(?:new\s+)?(?:ddev|lando)?\s*(?:drupal\s+)?(?:site|project)\s+(?:named?\s+|called\s+)?)" + NAME,
        Operation::CREATE_SITE,
        {projectRole(),
         vocabularyRole("platform", 0, PLATFORMS, false, "ddev")}));

    rules.push_back(rule(
        R"(create\s+(?:a\s+)?(?:new\s+)?(?:(?:ddev|lando)\s+)?(?:drupal\s+)?(?:site|project)\s+)" + NAME,
        Operation::CREATE_SITE,
        {projectRole(),
         vocabularyRole("platform", 0, PLATFORMS, false, "ddev")}));

    // --- Lifecycle (restart before start: "restart x" also contains "start x") ---
    rules.push_back(rule(R"(restart\s+(?:the\s+)?(?:site\s+|project\s+)?)" + NAME,
                         Operation::RESTART_SITE, {projectRole()}));
    rules.push_back(rule(R"(restart.*(?:site|project)\s+)" + NAME,
                         Operation::RESTART_SITE, {projectRole()}));

    rules.push_back(rule(R"(start\s+(?:up\s+)?(?:the\s+)?(?:site\s+|project\s+)?)" + NAME,
                         Operation::START_SITE, {projectRole()}));
    rules.push_back(rule(R"(start.*(?:site|project)\s+)" + NAME,
                         Operation::START_SITE, {projectRole()}));

    rules.push_back(rule(R"(stop\s+(?:the\s+)?(?:site\s+|project\s+)?)" + NAME,
                         Operation::STOP_SITE, {projectRole()}));
    rules.push_back(rule(R"(stop.*(?:site|project)\s+)" + NAME,
                         Operation::STOP_SITE, {projectRole()}));

    rules.push_back(rule(R"(status\s+(?:of\s+|for\s+)?(?:the\s+)?(?:site\s+|project\s+)?)" + NAME,
                         Operation::STATUS_SITE, {projectRole()}));
    rules.push_back(rule(R"(status.*(?:of|for)\s+(?:site\s+)?)" + NAME,
                         Operation::STATUS_SITE, {projectRole()}));
    rules.push_back(rule(R"((?:is\s+)?)" + NAME + R"(\s+(?:site\s+)?(?:status|running)\s*\??$)",
                         Operation::STATUS_SITE, {projectRole()}));

    return PatternTable(std::move(rules));
}

} // namespace dp
