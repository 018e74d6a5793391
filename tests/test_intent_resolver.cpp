/**
 * test_intent_resolver.cpp - Unit tests for PatternTable priorities and IntentResolver
 */

#include "dp/IntentResolver.hpp"
#include "dp/Log.hpp"
#include "dp/PatternTable.hpp"
#include "Fakes.hpp"

#include <cassert>
#include <iostream>
#include <regex>

namespace {

// First rule for `op` whose regex alone matches `text`, -1 if none
int firstRuleMatching(const dp::PatternTable& table, dp::Operation op, const std::string& text) {
    const auto& rules = table.rules();
    for (size_t i = 0; i < rules.size(); ++i) {
        if (rules[i].operation == op && std::regex_search(text, rules[i].matcher)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // anonymous namespace

void test_latest_articles_with_count() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto intent = resolver.resolve("get the latest 5 articles");

    assert(intent.operation == dp::Operation::QUERY_LATEST);
    assert(intent.source == dp::IntentSource::RULE_MATCHED);
    assert(intent.parameters["count"] == 5);
    assert(intent.parameters["content_type"] == "article");

    std::cout << "[PASS] test_latest_articles_with_count\n";
}

void test_latest_default_count() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto intent = resolver.resolve("show the latest posts");

    assert(intent.operation == dp::Operation::QUERY_LATEST);
    assert(intent.parameters["count"] == 10);
    assert(intent.parameters["content_type"] == "article");

    std::cout << "[PASS] test_latest_default_count\n";
}

void test_restart_wins_over_start() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    // The start rule also matches inside "restart"
    int start_rule = firstRuleMatching(table, dp::Operation::START_SITE, "restart my-blog");
    assert(start_rule >= 0);

    auto intent = resolver.resolve("restart my-blog");
    assert(intent.operation == dp::Operation::RESTART_SITE);
    assert(intent.rule_index < start_rule);
    assert(intent.parameters["project_name"] == "my-blog");

    std::cout << "[PASS] test_restart_wins_over_start\n";
}

void test_status_of_site_wins_over_trailing_status() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto intent = resolver.resolve("status of site my-blog");
    assert(intent.operation == dp::Operation::STATUS_SITE);
    assert(intent.parameters["project_name"] == "my-blog");

    // The looser trailing form resolves through a later rule
    auto loose = resolver.resolve("is my-blog running?");
    assert(loose.operation == dp::Operation::STATUS_SITE);
    assert(loose.parameters["project_name"] == "my-blog");
    assert(loose.rule_index > intent.rule_index);

    std::cout << "[PASS] test_status_of_site_wins_over_trailing_status\n";
}

void test_create_site_is_not_a_lifecycle_command() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto intent = resolver.resolve("create lando site named shop");
    assert(intent.operation == dp::Operation::CREATE_SITE);
    assert(intent.parameters["project_name"] == "shop");
    assert(intent.parameters["platform"] == "lando");

    auto plain = resolver.resolve("create site named my-blog");
    assert(plain.operation == dp::Operation::CREATE_SITE);
    assert(plain.parameters["platform"] == "ddev");

    std::cout << "[PASS] test_create_site_is_not_a_lifecycle_command\n";
}

void test_content_rules() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto post = resolver.resolve("Create a blog post about AI in Drupal");
    assert(post.operation == dp::Operation::CREATE_POST);
    assert(post.parameters["topic"] == "AI in Drupal");
    assert(post.parameters["content_type"] == "article");
    assert(!post.parameters.contains("ai_provider"));

    auto generated = resolver.resolve("generate an article using gemini about static sites");
    assert(generated.operation == dp::Operation::CREATE_POST);
    assert(generated.parameters["ai_provider"] == "gemini");
    assert(generated.parameters["topic"] == "static sites");

    auto edit = resolver.resolve("update node 12 title to 'Hello World'");
    assert(edit.operation == dp::Operation::EDIT_NODE);
    assert(edit.parameters["node_id"] == 12);
    assert(edit.parameters["title"] == "Hello World");

    auto del = resolver.resolve("delete node #42");
    assert(del.operation == dp::Operation::DELETE_NODE);
    assert(del.parameters["node_id"] == 42);

    auto upload = resolver.resolve("upload ./images/hero.jpg with alt text 'Hero banner'");
    assert(upload.operation == dp::Operation::UPLOAD_MEDIA);
    assert(upload.parameters["file_path"] == "./images/hero.jpg");
    assert(upload.parameters["alt_text"] == "Hero banner");

    std::cout << "[PASS] test_content_rules\n";
}

void test_drush_rules() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto cache = resolver.resolve("clear cache");
    assert(cache.operation == dp::Operation::RUN_DRUSH);
    assert(cache.parameters["command"] == "cache:rebuild");

    auto enable = resolver.resolve("enable module pathauto");
    assert(enable.operation == dp::Operation::RUN_DRUSH);
    assert(enable.parameters["command"] == "pm:enable");
    assert(enable.parameters["module"] == "pathauto");

    auto raw = resolver.resolve("drush   user:login");
    assert(raw.operation == dp::Operation::RUN_DRUSH);
    assert(raw.parameters["command"] == "user:login");

    std::cout << "[PASS] test_drush_rules\n";
}

void test_query_rules() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto search = resolver.resolve("find articles about drupal security");
    assert(search.operation == dp::Operation::QUERY_SEARCH);
    assert(search.parameters["search_term"] == "drupal security");

    auto tagged = resolver.resolve("get articles tagged drupal, php");
    assert(tagged.operation == dp::Operation::QUERY_TAGGED);
    assert(tagged.parameters["tags"].size() == 2);
    assert(tagged.parameters["tags"][1] == "php");

    auto users = resolver.resolve("list users with role editor");
    assert(users.operation == dp::Operation::QUERY_USERS);
    assert(users.parameters["role"] == "editor");

    auto by_type = resolver.resolve("list nodes of type page");
    assert(by_type.operation == dp::Operation::QUERY_BY_TYPE);
    assert(by_type.parameters["content_type"] == "page");

    std::cout << "[PASS] test_query_rules\n";
}

void test_unknown_without_ai() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto intent = resolver.resolve("frobnicate the whatsit");

    assert(intent.operation == dp::Operation::UNKNOWN);
    assert(intent.source == dp::IntentSource::UNRESOLVED);
    assert(!intent.resolved());
    assert(intent.parameters["raw_command"] == "frobnicate the whatsit");

    std::cout << "[PASS] test_unknown_without_ai\n";
}

void test_ai_fallback_classifies() {
    auto table = dp::PatternTable::standard();
    dp_test::FakeAi ai("```json\n{\"operation\": \"start-site\", \"parameters\": {\"project_name\": \"test-blog\"}}\n```");
    dp::IntentResolver resolver(table, &ai);

    auto intent = resolver.resolve("bring test-blog up");

    assert(ai.calls == 1);
    assert(intent.operation == dp::Operation::START_SITE);
    assert(intent.source == dp::IntentSource::AI_INFERRED);
    assert(intent.parameters["project_name"] == "test-blog");
    assert(intent.raw_text == "bring test-blog up");

    std::cout << "[PASS] test_ai_fallback_classifies\n";
}

void test_ai_fallback_not_used_when_rule_matches() {
    auto table = dp::PatternTable::standard();
    dp_test::FakeAi ai("{\"operation\": \"stop-site\"}");
    dp::IntentResolver resolver(table, &ai);

    auto intent = resolver.resolve("clear cache");

    assert(ai.calls == 0);
    assert(intent.source == dp::IntentSource::RULE_MATCHED);

    std::cout << "[PASS] test_ai_fallback_not_used_when_rule_matches\n";
}

void test_ai_fallback_failures_leave_unresolved() {
    auto table = dp::PatternTable::standard();

    dp_test::FakeAi says_unknown("{\"operation\": \"unknown\"}");
    assert(!dp::IntentResolver(table, &says_unknown).resolve("frobnicate the whatsit").resolved());

    dp_test::FakeAi malformed("I think you want to start something");
    assert(!dp::IntentResolver(table, &malformed).resolve("frobnicate the whatsit").resolved());

    dp_test::FakeAi invented("{\"operation\": \"launch-rockets\"}");
    assert(!dp::IntentResolver(table, &invented).resolve("frobnicate the whatsit").resolved());

    dp_test::FakeAi timed_out;
    timed_out.reply.success = false;
    timed_out.reply.error_kind = dp::AiError::TIMEOUT;
    timed_out.reply.error = "read timeout";
    assert(!dp::IntentResolver(table, &timed_out).resolve("frobnicate the whatsit").resolved());

    dp_test::FakeAi offline("{\"operation\": \"start-site\"}");
    offline.available = false;
    assert(!dp::IntentResolver(table, &offline).resolve("frobnicate the whatsit").resolved());
    assert(offline.calls == 0);

    std::cout << "[PASS] test_ai_fallback_failures_leave_unresolved\n";
}

void test_invalid_utf8_input() {
    auto table = dp::PatternTable::standard();
    dp::IntentResolver resolver(table);

    auto post = resolver.resolve("create a blog post about caf\xe9 culture");
    assert(post.operation == dp::Operation::CREATE_POST);
    assert(post.parameters["topic"].get<std::string>().find("culture") != std::string::npos);

    dp_test::FakeAi latin1("{\"operation\": \"start-site\", \"parameters\": {\"project_name\": \"caf\xe9\"}}");
    dp::IntentResolver with_ai(table, &latin1);
    auto inferred = with_ai.resolve("frobnicate the caf\xe9");
    assert(latin1.calls == 1);
    assert(inferred.raw_text == "frobnicate the caf\xe9");
    assert(!inferred.resolved() || inferred.operation == dp::Operation::START_SITE);

    std::cout << "[PASS] test_invalid_utf8_input\n";
}

void test_overlong_input_is_not_matched() {
    auto table = dp::PatternTable::standard();
    dp_test::FakeAi ai("{\"operation\": \"create-post\"}");
    dp::IntentResolver resolver(table, &ai);

    std::string text = "create a post about " + std::string(50000, 'a');
    auto intent = resolver.resolve(text);

    assert(!intent.resolved());
    assert(ai.calls == 0);
    assert(intent.parameters["max_length"] == dp::IntentResolver::MAX_INPUT_LENGTH);
    assert(intent.parameters["input_length"] == text.size());
    assert(intent.parameters["raw_command"].get<std::string>().size() < 100);
    assert(intent.raw_text == text);

    // At the limit the rules still run
    std::string at_limit = "clear cache " + std::string(dp::IntentResolver::MAX_INPUT_LENGTH - 12, 'a');
    assert(at_limit.size() == dp::IntentResolver::MAX_INPUT_LENGTH);
    auto fits = resolver.resolve(at_limit);
    assert(fits.operation == dp::Operation::RUN_DRUSH);
    assert(!fits.parameters.contains("max_length"));

    std::cout << "[PASS] test_overlong_input_is_not_matched\n";
}

void test_normalize() {
    assert(dp::IntentResolver::normalize("  Start   My-Blog \n") == "Start My-Blog");

    std::cout << "[PASS] test_normalize\n";
}

int main() {
    std::cout << "Running IntentResolver tests...\n\n";
    dp::log::setLevel(dp::log::Level::ERROR);

    test_latest_articles_with_count();
    test_latest_default_count();
    test_restart_wins_over_start();
    test_status_of_site_wins_over_trailing_status();
    test_create_site_is_not_a_lifecycle_command();
    test_content_rules();
    test_drush_rules();
    test_query_rules();
    test_unknown_without_ai();
    test_ai_fallback_classifies();
    test_ai_fallback_not_used_when_rule_matches();
    test_ai_fallback_failures_leave_unresolved();
    test_invalid_utf8_input();
    test_overlong_input_is_not_matched();
    test_normalize();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
