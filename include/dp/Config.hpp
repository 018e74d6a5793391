/**
 * Config.hpp - Settings from the environment, a local .env file and defaults
 */

#pragma once

#include <map>
#include <vector>
#include <string>

namespace dp {

struct Config {
    // Drupal
    std::string drupal_base_url = "http://localhost:8080";
    std::string drupal_username = "admin";
    std::string drupal_password = "admin";
    std::string graphql_endpoint = "/graphql";
    std::string drupal_root = ".";              // where drush runs

    // AI providers
    std::string openai_api_key;
    std::string anthropic_api_key;
    std::string gemini_api_key;
    std::string ollama_base_url = "http://localhost:11434";
    std::string ollama_model = "llama3.2:3b";
    std::string default_ai_provider;            // empty = none configured
    int ai_timeout = 120;                       // seconds
    bool ai_fallback = true;                    // AI classification when no rule matches

    // Tools
    std::string drush_path = "drush";
    std::string ddev_path = "ddev";
    std::string lando_path = "lando";
    std::string composer_path = "composer";

    // Sites
    std::string site_directory = "./sites";
    std::string drupal_version = "drupal10";

    bool allow_destructive = false;

    std::string graphqlUrl() const;
    std::string jsonapiUrl() const;

    // API key for a provider name, empty if not set
    std::string apiKeyFor(const std::string& provider) const;

    // Human-readable problems; empty when the configuration is usable
    std::vector<std::string> validate() const;

    /**
     * Environment first, then `env_file` (KEY=VALUE lines), then defaults.
     * Provider keys not found there are looked up in the keyring.
     */
    static Config load(const std::string& env_file = ".env", bool use_keyring = true);

    // Same precedence, from explicit maps; used by load() and by tests
    static Config fromMaps(const std::map<std::string, std::string>& environment,
                           const std::map<std::string, std::string>& file);

    static std::map<std::string, std::string> parseEnvFile(const std::string& path);

    static std::string envTemplate();
};

} // namespace dp
