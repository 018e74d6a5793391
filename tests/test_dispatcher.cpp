/**
 * test_dispatcher.cpp - End-to-end dispatch from raw text to Result Envelope
 */

#include "dp/AiClient.hpp"
#include "dp/CommandRegistry.hpp"
#include "dp/Config.hpp"
#include "dp/Dispatcher.hpp"
#include "dp/IntentResolver.hpp"
#include "dp/Log.hpp"
#include "dp/PatternTable.hpp"
#include "Fakes.hpp"

#include <cassert>
#include <iostream>

namespace {

const std::string DDEV_DESCRIBE =
    "{\"raw\":{\"name\":\"my-blog\",\"status\":\"running\","
    "\"primary_url\":\"https://my-blog.ddev.site\",\"services\":{\"web\":{\"status\":\"running\"}}}}";

// Everything a dispatch needs, wired to fakes
struct Harness {
    dp::Config config;
    dp_test::FakeRunner runner;
    dp_test::FakeBackend backend;
    dp_test::TempDir sites;
    dp::PatternTable table = dp::PatternTable::standard();
    dp::CommandRegistry registry = dp::CommandRegistry::standard();
    dp::IntentResolver resolver{table};
    dp::CommandContext context{config, runner, backend, nullptr, ""};
    dp::Dispatcher dispatcher{resolver, registry, context};

    Harness() {
        config.site_directory = sites.path();
        context.ai_factory = [this](const std::string& provider, std::string& error) {
            return dp::makeAiProvider(provider, config, error);
        };
    }

    dp::Result run(const std::string& text) { return dispatcher.handle(text).result; }
};

bool hasSuggestionContaining(const dp::Result& result, const std::string& needle) {
    if (!result.data.contains("suggestions")) return false;
    for (const auto& s : result.data["suggestions"]) {
        if (s.get<std::string>().find(needle) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

void test_status_of_existing_ddev_site() {
    Harness h;
    h.sites.write("my-blog/.ddev/config.yaml", "name: my-blog\n");
    h.runner.next.out = DDEV_DESCRIBE;

    auto dispatch = h.dispatcher.handle("status of site my-blog");

    assert(dispatch.intent.operation == dp::Operation::STATUS_SITE);
    assert(dispatch.result.success);
    assert(dispatch.result.data["platform"] == "ddev");
    assert(dispatch.result.data["status"] == "running");
    assert(dispatch.result.data["url"] == "https://my-blog.ddev.site");
    assert(dispatch.result.data["operation"] == "status-site");
    assert(dispatch.result.data["intent_source"] == "rule-matched");
    assert(h.runner.calls.back() == std::vector<std::string>({"ddev", "describe", "-j"}));

    std::cout << "[PASS] test_status_of_existing_ddev_site\n";
}

void test_start_missing_site() {
    Harness h;

    auto result = h.run("start my-blog");

    assert(!result.success);
    assert(result.error == dp::ErrorKind::NOT_FOUND);
    assert(hasSuggestionContaining(result, "create site named my-blog"));
    assert(h.runner.calls.empty());
    assert(result.toJson()["error"] == "NotFoundFailure");

    std::cout << "[PASS] test_start_missing_site\n";
}

void test_create_post_without_provider() {
    Harness h;

    auto result = h.run("Create a blog post about AI in Drupal");

    assert(!result.success);
    assert(result.error == dp::ErrorKind::PROVIDER);
    assert(result.message.find("DEFAULT_AI_PROVIDER") != std::string::npos);
    assert(h.backend.created_titles.empty());

    std::cout << "[PASS] test_create_post_without_provider\n";
}

void test_create_post_with_provider() {
    Harness h;
    std::string requested;
    h.context.ai_factory = [&requested](const std::string& provider, std::string&)
            -> std::unique_ptr<dp::AiProvider> {
        requested = provider;
        return std::make_unique<dp_test::FakeAi>("Drupal 11 ships faster.\n\nUpgrade soon.");
    };
    h.context.ai_provider_override = "ollama";

    auto result = h.run("Create a blog post about AI in Drupal");

    assert(result.success);
    assert(requested == "ollama");
    assert(result.data["title"] == "Ai In Drupal");
    assert(result.data["node_id"] == 101);
    assert(result.data["ai_provider"] == "fake");
    assert(h.backend.created_titles.size() == 1);

    std::cout << "[PASS] test_create_post_with_provider\n";
}

void test_unknown_text() {
    Harness h;

    auto dispatch = h.dispatcher.handle("frobnicate the whatsit");

    assert(dispatch.intent.operation == dp::Operation::UNKNOWN);
    assert(!dispatch.result.success);
    assert(dispatch.result.error == dp::ErrorKind::PARSE);
    assert(dispatch.result.data["suggestions"].size() == dp::Dispatcher::exampleCommands().size());
    assert(!dispatch.result.data.contains("operation"));

    std::cout << "[PASS] test_unknown_text\n";
}

void test_destructive_drush_refused() {
    Harness h;

    auto result = h.run("drush sql:drop");

    assert(!result.success);
    assert(result.error == dp::ErrorKind::VALIDATION);
    assert(result.message.find("destructive") != std::string::npos);
    assert(h.runner.calls.empty());

    std::cout << "[PASS] test_destructive_drush_refused\n";
}

void test_drush_runs_in_drupal_root() {
    Harness h;
    h.config.drupal_root = h.sites.path();
    h.runner.next.out = "[success] Cache rebuild complete.\n";

    auto result = h.run("clear cache");

    assert(result.success);
    assert(result.data["command"] == "cache:rebuild");
    assert(h.runner.calls.back()[0] == "drush");
    assert(h.runner.calls.back()[1] == "cache:rebuild");
    assert(h.runner.cwds.back() == h.sites.path());

    h.runner.installed.erase("drush");
    auto missing = h.run("clear cache");
    assert(!missing.success);
    assert(missing.error == dp::ErrorKind::PLATFORM);

    std::cout << "[PASS] test_drush_runs_in_drupal_root\n";
}

void test_node_not_found() {
    Harness h;

    auto result = h.run("delete node 999");
    assert(!result.success);
    assert(result.error == dp::ErrorKind::NOT_FOUND);

    auto deleted = h.run("delete node 42");
    assert(deleted.success);
    assert(h.backend.deleted.size() == 1);

    std::cout << "[PASS] test_node_not_found\n";
}

void test_upload_missing_file() {
    Harness h;

    auto result = h.run("upload " + h.sites.path() + "/nothing.png");
    assert(!result.success);
    assert(result.error == dp::ErrorKind::NOT_FOUND);

    h.sites.write("hero_banner.png", "not really a png");
    auto uploaded = h.run("upload " + h.sites.path() + "/hero_banner.png");
    assert(uploaded.success);

    // No rule takes a non-image path
    auto wrong_type = h.run("upload " + h.sites.path() + "/notes.txt");
    assert(!wrong_type.success);
    assert(wrong_type.error == dp::ErrorKind::PARSE);

    // An inferred intent with one is still checked
    h.sites.write("notes.txt", "plain text");
    dp::Intent inferred;
    inferred.operation = dp::Operation::UPLOAD_MEDIA;
    inferred.source = dp::IntentSource::AI_INFERRED;
    inferred.parameters = {{"file_path", h.sites.path() + "/notes.txt"}};
    assert(h.dispatcher.dispatch(inferred).error == dp::ErrorKind::VALIDATION);

    std::cout << "[PASS] test_upload_missing_file\n";
}

void test_query_results() {
    Harness h;
    h.backend.query_reply = nlohmann::json::parse(R"({
        "nodeQuery": {
            "count": 2,
            "entities": [{"nid": 1, "title": "One"}, {}, {"nid": 2, "title": "Two"}]
        }
    })");

    auto result = h.run("get the latest 5 articles");

    assert(result.success);
    assert(result.data["count"] == 2);
    assert(result.data["query_type"] == "query-latest");
    assert(h.backend.last_query.find("limit: 5") != std::string::npos);

    std::cout << "[PASS] test_query_results\n";
}

void test_malformed_backend_reply_is_provider_failure() {
    Harness h;
    h.backend.malformed_reply = true;

    auto result = h.run("get the latest 5 articles");
    assert(!result.success);
    assert(result.error == dp::ErrorKind::PROVIDER);

    std::cout << "[PASS] test_malformed_backend_reply_is_provider_failure\n";
}

void test_unregistered_operation() {
    dp::Config config;
    dp_test::FakeRunner runner;
    dp_test::FakeBackend backend;
    auto table = dp::PatternTable::standard();
    dp::CommandRegistry empty(std::map<dp::Operation, dp::CommandRegistry::Constructor>{});
    dp::IntentResolver resolver(table);
    dp::CommandContext context{config, runner, backend, nullptr, ""};
    dp::Dispatcher dispatcher(resolver, empty, context);

    auto result = dispatcher.handle("clear cache").result;
    assert(result.error == dp::ErrorKind::UNKNOWN_OPERATION);

    std::cout << "[PASS] test_unregistered_operation\n";
}

void test_invalid_utf8_request() {
    Harness h;

    auto dispatch = h.dispatcher.handle("create a blog post about caf\xe9 culture");
    assert(dispatch.intent.operation == dp::Operation::CREATE_POST);

    std::string rendered = dp::dumpJson(dispatch.result.toJson(), 2);
    assert(nlohmann::json::parse(rendered).contains("success"));

    auto garbage = h.run("\xff\xfe status of site \xc3");
    assert(nlohmann::json::parse(dp::dumpJson(garbage.toJson())).is_object());

    std::cout << "[PASS] test_invalid_utf8_request\n";
}

void test_overlong_request() {
    Harness h;

    auto result = h.run("create a post about " + std::string(50000, 'a'));

    assert(!result.success);
    assert(result.error == dp::ErrorKind::VALIDATION);
    assert(result.data["max_length"] == dp::IntentResolver::MAX_INPUT_LENGTH);
    assert(result.data["input_length"] == 50020);
    assert(result.message.find("too long") != std::string::npos);
    assert(h.backend.created_titles.empty());

    std::cout << "[PASS] test_overlong_request\n";
}

void test_start_site_by_display_name() {
    Harness h;
    h.sites.write("my-blog/.ddev/config.yaml", "name: my-blog\n");

    auto result = h.run("start My_Blog");

    assert(result.success);
    assert(result.data["project_name"] == "my-blog");
    assert(h.runner.cwds.back() == h.sites.path() + "/my-blog");

    std::cout << "[PASS] test_start_site_by_display_name\n";
}

int main() {
    std::cout << "Running Dispatcher tests...\n\n";
    dp::log::setLevel(dp::log::Level::ERROR);

    test_status_of_existing_ddev_site();
    test_start_missing_site();
    test_create_post_without_provider();
    test_create_post_with_provider();
    test_unknown_text();
    test_destructive_drush_refused();
    test_drush_runs_in_drupal_root();
    test_node_not_found();
    test_upload_missing_file();
    test_query_results();
    test_malformed_backend_reply_is_provider_failure();
    test_unregistered_operation();
    test_invalid_utf8_request();
    test_overlong_request();
    test_start_site_by_display_name();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
