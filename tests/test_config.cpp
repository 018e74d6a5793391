/**
 * test_config.cpp - Unit tests for Config precedence and .env parsing
 */

#include "dp/Config.hpp"
#include "dp/Log.hpp"
#include "Fakes.hpp"

#include <cassert>
#include <iostream>

void test_defaults() {
    dp::Config config = dp::Config::fromMaps({}, {});

    assert(config.drupal_base_url == "http://localhost:8080");
    assert(config.graphqlUrl() == "http://localhost:8080/graphql");
    assert(config.jsonapiUrl() == "http://localhost:8080/jsonapi");
    assert(config.default_ai_provider.empty());
    assert(config.ai_timeout == 120);
    assert(config.ai_fallback);
    assert(!config.allow_destructive);
    assert(config.site_directory == "./sites");

    std::cout << "[PASS] test_defaults\n";
}

void test_environment_beats_file() {
    std::map<std::string, std::string> env = {
        {"DRUPAL_BASE_URL", "https://cms.example.org/"},
        {"DEFAULT_AI_PROVIDER", "OpenAI"}
    };
    std::map<std::string, std::string> file = {
        {"DRUPAL_BASE_URL", "http://ignored"},
        {"OPENAI_API_KEY", "sk-file"},
        {"AI_FALLBACK", "no"},
        {"DP_ALLOW_DESTRUCTIVE", "true"}
    };

    dp::Config config = dp::Config::fromMaps(env, file);

    assert(config.drupal_base_url == "https://cms.example.org/");
    assert(config.graphqlUrl() == "https://cms.example.org/graphql");
    assert(config.default_ai_provider == "openai");
    assert(config.apiKeyFor("openai") == "sk-file");
    assert(config.apiKeyFor("ollama").empty());
    assert(!config.ai_fallback);
    assert(config.allow_destructive);
    assert(config.validate().empty());

    std::cout << "[PASS] test_environment_beats_file\n";
}

void test_bad_timeout_keeps_default() {
    dp::Config config = dp::Config::fromMaps({{"AI_TIMEOUT", "soon"}}, {});
    assert(config.ai_timeout == 120);

    std::cout << "[PASS] test_bad_timeout_keeps_default\n";
}

void test_validate_reports_problems() {
    dp::Config config;
    config.drupal_base_url = "localhost:8080";
    config.default_ai_provider = "anthropic";

    auto problems = config.validate();
    assert(problems.size() == 2);

    config.default_ai_provider = "ollama";
    config.drupal_base_url = "http://localhost";
    assert(config.validate().empty());

    std::cout << "[PASS] test_validate_reports_problems\n";
}

void test_parse_env_file() {
    dp_test::TempDir dir;
    dir.write(".env",
              "# comment\n"
              "\n"
              "DRUPAL_USERNAME=editor\n"
              "export DRUPAL_PASSWORD=\"s3cret # not a comment\"\n"
              "OLLAMA_MODEL=llama3.2:3b  # small model\n"
              "GRAPHQL_ENDPOINT='/api/graphql'\n"
              "not a setting\n");

    auto values = dp::Config::parseEnvFile(dir.path() + "/.env");

    assert(values.size() == 4);
    assert(values["DRUPAL_USERNAME"] == "editor");
    assert(values["DRUPAL_PASSWORD"] == "s3cret # not a comment");
    assert(values["OLLAMA_MODEL"] == "llama3.2:3b");
    assert(values["GRAPHQL_ENDPOINT"] == "/api/graphql");

    assert(dp::Config::parseEnvFile(dir.path() + "/missing.env").empty());

    std::cout << "[PASS] test_parse_env_file\n";
}

void test_template_parses_back() {
    dp_test::TempDir dir;
    dir.write(".env", dp::Config::envTemplate());

    dp::Config config = dp::Config::fromMaps({}, dp::Config::parseEnvFile(dir.path() + "/.env"));
    assert(config.default_ai_provider == "ollama");
    assert(config.validate().empty());

    std::cout << "[PASS] test_template_parses_back\n";
}

int main() {
    std::cout << "Running Config tests...\n\n";
    dp::log::setLevel(dp::log::Level::ERROR);

    test_defaults();
    test_environment_beats_file();
    test_bad_timeout_keeps_default();
    test_validate_reports_problems();
    test_parse_env_file();
    test_template_parses_back();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
