/**
 * main.cpp - DrupalPilot CLI entry point
 *
 * Usage:
 *   dp "status of site my-blog"                     # Natural language request
 *   dp execute "clear cache" --output-format text   # Same, explicit form
 *   dp create-site my-blog --platform lando         # Direct site creation
 *   dp setup                                        # Write .env template, validate
 *   dp check                                        # Show configuration and tools
 *   dp --auth openai                                # Store API key securely
 */

#include "dp/AiClient.hpp"
#include "dp/CommandRegistry.hpp"
#include "dp/Config.hpp"
#include "dp/Dispatcher.hpp"
#include "dp/DrupalClient.hpp"
#include "dp/IntentResolver.hpp"
#include "dp/Keyring.hpp"
#include "dp/Log.hpp"
#include "dp/OutputFormatter.hpp"
#include "dp/PatternTable.hpp"
#include "dp/ProcessRunner.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <termios.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string YELLOW = "\033[33m";
const std::string GREEN = "\033[32m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

const int EXIT_INCONSISTENT_REGISTRY = 70;

struct Options {
    std::string ai_provider;
    std::string output_format = "json";
    std::string platform = "ddev";
    std::string directory;
    bool no_ai_fallback = false;
    bool verbose = false;
    std::vector<std::string> positional;
};

void printUsage() {
    std::cout << BOLD << "DrupalPilot" << RESET << " - Drupal sites and content from plain English\n\n"
              << BOLD << "Usage:" << RESET << "\n"
              << "  dp \"<request>\"                     Run a natural language request\n"
              << "  dp execute \"<request>\"             Same as above\n"
              << "  dp create-site <name>              Create a local Drupal site\n"
              << "  dp setup                           Write a .env template and validate it\n"
              << "  dp check                           Show configuration, AI and tool status\n"
              << "  dp --auth <provider>               Store a provider API key securely\n"
              << "  dp --help                          Show this help\n\n"
              << BOLD << "Options:" << RESET << "\n"
              << "  --ai-provider <name>               openai, anthropic, gemini or ollama\n"
              << "  --output-format <fmt>              json (default), text or table\n"
              << "  --no-ai-fallback                   Rules only, never ask the AI to classify\n"
              << "  --platform <ddev|lando>            Platform for create-site (default ddev)\n"
              << "  --directory <path>                 Target directory for create-site\n"
              << "  --verbose                          Debug logging on stderr\n\n"
              << BOLD << "Examples:" << RESET << "\n";
    for (const auto& example : dp::Dispatcher::exampleCommands()) {
        std::cout << "  dp \"" << example << "\"\n";
    }
}

bool needsValue(const std::string& flag) {
    return flag == "--ai-provider" || flag == "--output-format" ||
           flag == "--platform" || flag == "--directory";
}

// Returns false (after printing why) on an unknown flag or a missing value
bool parseOptions(int argc, char* argv[], int start, Options& options) {
    for (int i = start; i < argc; ++i) {
        std::string arg = argv[i];

        if (needsValue(arg)) {
            if (i + 1 >= argc) {
                std::cerr << RED << "Error: " << arg << " needs a value." << RESET << "\n";
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--ai-provider") options.ai_provider = value;
            else if (arg == "--output-format") options.output_format = value;
            else if (arg == "--platform") options.platform = value;
            else options.directory = value;
        }
        else if (arg == "--no-ai-fallback") {
            options.no_ai_fallback = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        }
        else if (arg.rfind("--", 0) == 0) {
            std::cerr << RED << "Error: Unknown flag '" << arg << "'" << RESET << "\n";
            std::cerr << "Valid flags: --ai-provider, --output-format, --no-ai-fallback, "
                      << "--platform, --directory, --verbose, --help\n";
            return false;
        }
        else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

void configureLogging(bool verbose) {
    const char* env_level = std::getenv("DP_LOG_LEVEL");
    dp::log::Level level = dp::log::Level::WARN;
    if (env_level && !dp::log::parseLevel(env_level, level)) {
        std::cerr << YELLOW << "Ignoring DP_LOG_LEVEL='" << env_level
                  << "' (use debug, info, warn or error)" << RESET << "\n";
    }
    if (verbose) {
        level = dp::log::Level::DEBUG;
    }
    dp::log::setLevel(level);
}

std::string joinWords(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& w : words) {
        if (!joined.empty()) joined += " ";
        joined += w;
    }
    return joined;
}

int runAuth(int argc, char* argv[]) {
    // --auth must be standalone: dp --auth <provider>
    if (argc != 3) {
        std::cerr << RED << "Error: --auth takes exactly one provider." << RESET << "\n";
        std::cerr << "Usage: dp --auth <openai|anthropic|gemini>\n";
        return 1;
    }

    std::string provider = argv[2];
    if (provider != "openai" && provider != "anthropic" && provider != "gemini") {
        std::cerr << RED << "Error: '" << provider << "' does not use an API key." << RESET << "\n";
        std::cerr << "Keys are stored for openai, anthropic and gemini.\n";
        return 1;
    }

    // Prompt for API key without echoing (like password input)
    std::cout << "Paste your " << provider << " API key (hidden input): ";
    std::cout.flush();

    struct termios old_term, new_term;
    bool is_tty = tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (is_tty) {
        new_term = old_term;
        new_term.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    std::string new_key;
    std::getline(std::cin, new_key);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    }
    std::cout << "\n";

    if (new_key.empty()) {
        std::cerr << RED << "Error: Empty API key." << RESET << "\n";
        return 1;
    }

    std::string error;
    if (!dp::keyring::store(provider, new_key, error)) {
        std::cerr << RED << "Error storing key: " << error << RESET << "\n";
        return 1;
    }

    std::cout << GREEN << "✓ " << provider << " API key stored in the keyring." << RESET << "\n";
    return 0;
}

void printCheck(const std::string& label, bool good, const std::string& detail) {
    std::cout << "  " << (good ? GREEN + "✓ " : RED + "✘ ") << RESET
              << label << (detail.empty() ? "" : ": " + detail) << "\n";
}

int runCheck(const dp::Config& config, const Options& options) {
    std::cout << BOLD << "Configuration:" << RESET << "\n"
              << "  Drupal:          " << config.drupal_base_url << "\n"
              << "  GraphQL:         " << config.graphqlUrl() << "\n"
              << "  Drupal root:     " << config.drupal_root << "\n"
              << "  Site directory:  " << config.site_directory << "\n"
              << "  Drupal version:  " << config.drupal_version << "\n"
              << "  AI provider:     "
              << (config.default_ai_provider.empty() ? "(none)" : config.default_ai_provider) << "\n"
              << "  AI fallback:     " << (config.ai_fallback ? "on" : "off") << "\n\n";

    std::cout << BOLD << "AI providers:" << RESET << "\n";
    for (const std::string provider : {"openai", "anthropic", "gemini", "ollama"}) {
        dp::AiClient client(provider, config);
        std::string reason;
        bool available = client.isAvailable(reason);
        printCheck(provider, available, available ? "available" : reason);
    }

    std::cout << "\n" << BOLD << "Tools:" << RESET << "\n";
    dp::SystemProcessRunner runner;
    const std::vector<std::pair<std::string, std::string>> tools = {
        {"drush", config.drush_path},
        {"ddev", config.ddev_path},
        {"lando", config.lando_path},
        {"composer", config.composer_path},
    };
    for (const auto& tool : tools) {
        bool found = runner.which(tool.second);
        printCheck(tool.first, found, found ? tool.second : "not found on PATH");
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        std::cout << "\n" << BOLD << "Problems:" << RESET << "\n";
        for (const auto& p : problems) {
            std::cout << "  " << YELLOW << "⚠️  " << p << RESET << "\n";
        }
    }

    if (options.verbose) {
        std::cout << "\n" << CYAN << "Config loaded from environment and .env in "
                  << fs::current_path().string() << RESET << "\n";
    }
    return problems.empty() ? 0 : 1;
}

int runSetup() {
    const std::string env_file = ".env";

    if (fs::exists(env_file)) {
        std::cout << CYAN << env_file << " already exists, leaving it untouched." << RESET << "\n";
    } else {
        std::ofstream out(env_file);
        if (!out) {
            std::cerr << RED << "Error: cannot write " << env_file << RESET << "\n";
            return 1;
        }
        out << dp::Config::envTemplate();
        std::cout << GREEN << "✓ Wrote " << env_file << " with default settings." << RESET << "\n";
    }

    dp::Config config = dp::Config::load(env_file);
    auto problems = config.validate();
    if (problems.empty()) {
        std::cout << GREEN << "✓ Configuration is valid." << RESET << "\n";
        return 0;
    }

    std::cout << YELLOW << "Configuration needs attention:" << RESET << "\n";
    for (const auto& p : problems) {
        std::cout << "  - " << p << "\n";
    }
    std::cout << "Edit " << env_file << " or store keys with: dp --auth <provider>\n";
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 0;
    }

    std::string first_arg = argv[1];

    if (first_arg == "--help" || first_arg == "-h") {
        printUsage();
        return 0;
    }

    if (first_arg == "--auth") {
        return runAuth(argc, argv);
    }

    std::string mode = "execute";
    int arg_start = 1;
    if (first_arg == "execute" || first_arg == "create-site" ||
        first_arg == "setup" || first_arg == "check") {
        mode = first_arg;
        arg_start = 2;
    }

    Options options;
    if (!parseOptions(argc, argv, arg_start, options)) {
        return 1;
    }
    configureLogging(options.verbose);

    if (mode == "setup") {
        return runSetup();
    }

    dp::Config config = dp::Config::load();

    if (mode == "check") {
        return runCheck(config, options);
    }

    dp::OutputFormat format;
    if (!dp::parseOutputFormat(options.output_format, format)) {
        std::cerr << RED << "Error: Unknown output format '" << options.output_format << "'"
                  << RESET << "\n";
        std::cerr << "Valid formats: json, text, table\n";
        return 1;
    }

    if (!options.ai_provider.empty() && !dp::AiClient::isKnownProvider(options.ai_provider)) {
        std::cerr << RED << "Error: Unknown AI provider '" << options.ai_provider << "'" << RESET << "\n";
        std::cerr << "Valid providers: openai, anthropic, gemini, ollama\n";
        return 1;
    }

    for (const auto& problem : config.validate()) {
        dp::log::debug("config", problem);
    }

    // Start-up consistency between the rule table and the command table
    const dp::PatternTable table = dp::PatternTable::standard();
    const dp::CommandRegistry registry = dp::CommandRegistry::standard();
    auto inconsistencies = registry.verifyAgainst(table);
    if (!inconsistencies.empty()) {
        for (const auto& problem : inconsistencies) {
            dp::log::error("registry", problem);
        }
        return EXIT_INCONSISTENT_REGISTRY;
    }

    // The classifier only exists when fallback is on and a provider is named
    std::unique_ptr<dp::AiProvider> classifier;
    bool fallback_enabled = config.ai_fallback && !options.no_ai_fallback;
    std::string classifier_name =
        options.ai_provider.empty() ? config.default_ai_provider : options.ai_provider;
    if (fallback_enabled && !classifier_name.empty()) {
        std::string error;
        classifier = dp::makeAiProvider(classifier_name, config, error);
        if (!classifier) {
            dp::log::warn("resolver", "AI fallback disabled: " + error);
        }
    }

    dp::SystemProcessRunner runner;
    dp::DrupalClient drupal(config);
    dp::CommandContext context{
        config,
        runner,
        drupal,
        [&config](const std::string& provider, std::string& error) {
            return dp::makeAiProvider(provider, config, error);
        },
        options.ai_provider,
    };

    dp::IntentResolver resolver(table, classifier.get());
    dp::Dispatcher dispatcher(resolver, registry, context);

    dp::Result result;
    if (mode == "create-site") {
        if (options.positional.size() != 1) {
            std::cerr << RED << "Usage: dp create-site <name> [--platform ddev|lando] [--directory D]"
                      << RESET << "\n";
            return 1;
        }
        dp::Intent intent;
        intent.operation = dp::Operation::CREATE_SITE;
        intent.source = dp::IntentSource::RULE_MATCHED;
        intent.raw_text = "create-site " + options.positional.front();
        intent.parameters = {
            {"project_name", options.positional.front()},
            {"platform", options.platform},
        };
        if (!options.directory.empty()) {
            intent.parameters["directory"] = options.directory;
        }
        result = dispatcher.dispatch(intent);
    } else {
        std::string request = joinWords(options.positional);
        if (request.empty()) {
            std::cerr << RED << "Error: No request provided." << RESET << "\n";
            printUsage();
            return 1;
        }
        result = dispatcher.handle(request).result;
    }

    bool color = format != dp::OutputFormat::JSON && isatty(STDOUT_FILENO);
    dp::OutputFormatter formatter(color);
    std::cout << formatter.render(result, format) << "\n";

    return result.success ? 0 : 1;
}
