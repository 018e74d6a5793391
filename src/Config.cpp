/**
 * Config.cpp - Settings from the environment, a local .env file and defaults
 */

#include "dp/Config.hpp"
#include "dp/Keyring.hpp"
#include "dp/Log.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>


namespace dp {

namespace {

const std::vector<std::string> KNOWN_KEYS = {
    "DRUPAL_BASE_URL", "DRUPAL_USERNAME", "DRUPAL_PASSWORD", "GRAPHQL_ENDPOINT", "DRUPAL_ROOT",
    "OPENAI_API_KEY", "ANTHROPIC_API_KEY", "GEMINI_API_KEY", "OLLAMA_BASE_URL", "OLLAMA_MODEL",
    "DEFAULT_AI_PROVIDER", "AI_TIMEOUT", "AI_FALLBACK",
    "DRUSH_PATH", "DDEV_PATH", "LANDO_PATH", "COMPOSER_PATH",
    "DEFAULT_SITE_DIRECTORY", "DEFAULT_DRUPAL_VERSION", "DP_ALLOW_DESTRUCTIVE"
};

std::string trimmed(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string rstripSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

bool truthy(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

} // anonymous namespace

std::string Config::graphqlUrl() const {
    return rstripSlash(drupal_base_url) + graphql_endpoint;
}

std::string Config::jsonapiUrl() const {
    return rstripSlash(drupal_base_url) + "/jsonapi";
}

std::string Config::apiKeyFor(const std::string& provider) const {
    if (provider == "openai") return openai_api_key;
    if (provider == "anthropic") return anthropic_api_key;
    if (provider == "gemini") return gemini_api_key;
    return "";
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    if (drupal_base_url.empty()) {
        problems.push_back("DRUPAL_BASE_URL is empty");
    } else if (drupal_base_url.rfind("http://", 0) != 0 && drupal_base_url.rfind("https://", 0) != 0) {
        problems.push_back("DRUPAL_BASE_URL must start with http:// or https://");
    }

    if (default_ai_provider.empty()) {
        problems.push_back("DEFAULT_AI_PROVIDER is not set (openai|anthropic|gemini|ollama)");
    } else if (default_ai_provider != "ollama" && apiKeyFor(default_ai_provider).empty()) {
        problems.push_back("no API key for provider '" + default_ai_provider + "'");
    }

    if (ai_timeout <= 0) {
        problems.push_back("AI_TIMEOUT must be a positive number of seconds");
    }

    return problems;
}

std::map<std::string, std::string> Config::parseEnvFile(const std::string& path) {
    std::map<std::string, std::string> values;

    std::ifstream file(path);
    if (!file.good()) {
        return values;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trimmed(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trimmed(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trimmed(line.substr(0, eq));
        std::string value = trimmed(line.substr(eq + 1));

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment
            size_t hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trimmed(value.substr(0, hash));
            }
        }

        values[key] = value;
    }

    return values;
}

Config Config::fromMaps(const std::map<std::string, std::string>& environment,
                        const std::map<std::string, std::string>& file) {
    auto get = [&](const std::string& key, const std::string& fallback) -> std::string {
        auto env_it = environment.find(key);
        if (env_it != environment.end() && !env_it->second.empty()) {
            return env_it->second;
        }
        auto file_it = file.find(key);
        if (file_it != file.end() && !file_it->second.empty()) {
            return file_it->second;
        }
        return fallback;
    };

    Config config;
    config.drupal_base_url = get("DRUPAL_BASE_URL", config.drupal_base_url);
    config.drupal_username = get("DRUPAL_USERNAME", config.drupal_username);
    config.drupal_password = get("DRUPAL_PASSWORD", config.drupal_password);
    config.graphql_endpoint = get("GRAPHQL_ENDPOINT", config.graphql_endpoint);
    config.drupal_root = get("DRUPAL_ROOT", config.drupal_root);

    config.openai_api_key = get("OPENAI_API_KEY", "");
    config.anthropic_api_key = get("ANTHROPIC_API_KEY", "");
    config.gemini_api_key = get("GEMINI_API_KEY", "");
    config.ollama_base_url = get("OLLAMA_BASE_URL", config.ollama_base_url);
    config.ollama_model = get("OLLAMA_MODEL", config.ollama_model);

    std::string provider = get("DEFAULT_AI_PROVIDER", "");
    std::transform(provider.begin(), provider.end(), provider.begin(), ::tolower);
    config.default_ai_provider = provider;

    std::string timeout = get("AI_TIMEOUT", "");
    if (!timeout.empty()) {
        try {
            config.ai_timeout = std::stoi(timeout);
        } catch (const std::exception&) {
            log::warn("config", "ignoring non-numeric AI_TIMEOUT: " + timeout);
        }
    }
    config.ai_fallback = truthy(get("AI_FALLBACK", "1"));

    config.drush_path = get("DRUSH_PATH", config.drush_path);
    config.ddev_path = get("DDEV_PATH", config.ddev_path);
    config.lando_path = get("LANDO_PATH", config.lando_path);
    config.composer_path = get("COMPOSER_PATH", config.composer_path);

    config.site_directory = get("DEFAULT_SITE_DIRECTORY", config.site_directory);
    config.drupal_version = get("DEFAULT_DRUPAL_VERSION", config.drupal_version);
    config.allow_destructive = truthy(get("DP_ALLOW_DESTRUCTIVE", "0"));

    return config;
}

Config Config::load(const std::string& env_file, bool use_keyring) {
    std::map<std::string, std::string> environment;
    for (const auto& key : KNOWN_KEYS) {
        const char* value = std::getenv(key.c_str());
        if (value) {
            environment[key] = value;
        }
    }

    Config config = fromMaps(environment, parseEnvFile(env_file));

    if (use_keyring) {
        // The keyring wins over plain-text settings, as it does for `dp --auth`
        for (const char* provider : {"openai", "anthropic", "gemini"}) {
            std::string key = keyring::lookup(provider);
            if (key.empty()) continue;
            if (std::string(provider) == "openai") config.openai_api_key = key;
            else if (std::string(provider) == "anthropic") config.anthropic_api_key = key;
            else config.gemini_api_key = key;
        }
    }

    return config;
}

std::string Config::envTemplate() {
    return "# DrupalPilot configuration\n"
           "DRUPAL_BASE_URL=http://localhost:8080\n"
           "DRUPAL_USERNAME=admin\n"
           "DRUPAL_PASSWORD=admin\n"
           "DRUPAL_ROOT=.\n"
           "\n"
           "# GraphQL\n"
           "GRAPHQL_ENDPOINT=/graphql\n"
           "\n"
           "# AI providers (configure at least one; keys can also live in the keyring: dp --auth <provider>)\n"
           "DEFAULT_AI_PROVIDER=ollama\n"
           "OPENAI_API_KEY=\n"
           "ANTHROPIC_API_KEY=\n"
           "GEMINI_API_KEY=\n"
           "OLLAMA_BASE_URL=http://localhost:11434\n"
           "OLLAMA_MODEL=llama3.2:3b\n"
           "AI_TIMEOUT=120\n"
           "AI_FALLBACK=1\n"
           "\n"
           "# Local tools\n"
           "DRUSH_PATH=drush\n"
           "DDEV_PATH=ddev\n"
           "LANDO_PATH=lando\n"
           "COMPOSER_PATH=composer\n"
           "\n"
           "# Site setup\n"
           "DEFAULT_SITE_DIRECTORY=./sites\n"
           "DEFAULT_DRUPAL_VERSION=drupal10\n";
}

} // namespace dp
