/**
 * MaintenanceCommand.cpp - run-drush: one Drush command in the Drupal root
 */

#include "dp/commands/MaintenanceCommand.hpp"
#include "dp/Config.hpp"
#include "dp/Log.hpp"
#include "dp/ProcessRunner.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace dp {

static const int DRUSH_TIMEOUT = 300;

namespace {

// Commands that drop data or run arbitrary code, with their aliases
const std::vector<std::string> DESTRUCTIVE_COMMANDS = {
    "sql:drop", "sql-drop",
    "site:install", "site-install", "si",
    "php:eval", "php-eval", "ev",
    "php:script", "scr",
    "user:cancel", "ucan",
    "entity:delete", "edel",
    "sql:cli", "sqlc",
    "sql:query", "sqlq"
};

// Drush asks for confirmation on these unless --yes is given
const std::vector<std::string> CONFIRMING_PREFIXES = {
    "pm:", "config:", "updatedb", "updb", "en", "pmu", "cim", "cex", "deploy"
};

const std::vector<std::string> MODULE_COMMANDS = {
    "pm:enable", "pm:install", "pm:uninstall", "en", "pmu"
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

bool hasYes(const std::vector<std::string>& args) {
    return std::find(args.begin(), args.end(), "--yes") != args.end() ||
           std::find(args.begin(), args.end(), "-y") != args.end();
}

} // anonymous namespace

RunDrushParams RunDrushParams::fromJson(const json& params) {
    ParamReader reader(params, "run-drush");
    RunDrushParams p;
    p.command = reader.text("command", true);
    p.module = reader.text("module", false);
    p.args = reader.list("args");
    reader.finish();

    // "drush cr" typed verbatim
    if (p.command.rfind("drush ", 0) == 0) {
        p.command = p.command.substr(6);
    }
    return p;
}

RunDrushCommand::RunDrushCommand(RunDrushParams params, CommandContext& context)
    : params_(std::move(params)), context_(context), tokens_(splitWords(params_.command)) {}

bool RunDrushCommand::isDestructive(const std::string& drush_command) {
    std::string lower = toLower(drush_command);
    return std::find(DESTRUCTIVE_COMMANDS.begin(), DESTRUCTIVE_COMMANDS.end(), lower) !=
           DESTRUCTIVE_COMMANDS.end();
}

bool RunDrushCommand::needsModule(const std::string& drush_command) {
    std::string lower = toLower(drush_command);
    return std::find(MODULE_COMMANDS.begin(), MODULE_COMMANDS.end(), lower) != MODULE_COMMANDS.end();
}

json RunDrushCommand::installGuidance() {
    return {
        {"message", "Drush is required for maintenance commands."},
        {"url", "https://www.drush.org/latest/install/"},
        {"commands", {
            {"composer", "composer require drush/drush"}
        }}
    };
}

size_t RunDrushCommand::verbIndex() const {
    // Site aliases (@self, @prod) precede the command
    size_t i = 0;
    while (i < tokens_.size() && tokens_[i][0] == '@') {
        ++i;
    }
    return i;
}

std::vector<std::string> RunDrushCommand::problems() const {
    std::vector<std::string> found;

    size_t index = verbIndex();
    if (index >= tokens_.size()) {
        found.push_back("no Drush command given");
        return found;
    }

    const std::string& verb = tokens_[index];
    if (verb[0] == '-') {
        found.push_back("Drush command must come before options: " + params_.command);
    }

    if (!context_.config.allow_destructive) {
        // Checked on every word, not only the verb
        std::vector<std::string> words = tokens_;
        words.insert(words.end(), params_.args.begin(), params_.args.end());
        for (const auto& word : words) {
            if (isDestructive(word)) {
                found.push_back("refusing destructive Drush command '" + word +
                                "' (set DP_ALLOW_DESTRUCTIVE=1 to allow it)");
                break;
            }
        }
    }

    if (needsModule(verb) && params_.module.empty() && tokens_.size() <= index + 1 && params_.args.empty()) {
        found.push_back(verb + " needs a module name");
    }

    if (!params_.module.empty()) {
        bool valid = std::all_of(params_.module.begin(), params_.module.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ',';
        });
        if (!valid) {
            found.push_back("module name '" + params_.module + "' is not a machine name");
        }
    }

    return found;
}

std::vector<std::string> RunDrushCommand::drushArguments() const {
    std::vector<std::string> args = tokens_;
    if (!params_.module.empty()) {
        args.push_back(params_.module);
    }
    args.insert(args.end(), params_.args.begin(), params_.args.end());

    size_t index = verbIndex();
    if (index < args.size()) {
        std::string verb = toLower(args[index]);
        bool confirms = std::any_of(CONFIRMING_PREFIXES.begin(), CONFIRMING_PREFIXES.end(),
                                    [&](const std::string& prefix) {
                                        // Short aliases match whole, namespaces by prefix
                                        return prefix.back() == ':' ? verb.rfind(prefix, 0) == 0
                                                                    : verb == prefix;
                                    });
        bool destructive = std::any_of(args.begin(), args.end(), [](const std::string& word) {
            return isDestructive(word);
        });
        if ((confirms || destructive) && !hasYes(args)) {
            args.push_back("--yes");
        }
    }
    return args;
}

Result RunDrushCommand::execute() {
    const Config& config = context_.config;

    if (!context_.runner.which(config.drush_path)) {
        throw Error(ErrorKind::PLATFORM, "Drush is not installed or not on PATH",
                    {"install Drush: composer require drush/drush",
                     "or set DRUSH_PATH (e.g. vendor/bin/drush, or \"ddev drush\" via a wrapper script)"},
                    {{"install", installGuidance()}});
    }

    std::vector<std::string> argv = {config.drush_path};
    std::vector<std::string> args = drushArguments();
    argv.insert(argv.end(), args.begin(), args.end());

    std::string display;
    for (const auto& a : args) {
        if (!display.empty()) display += " ";
        display += a;
    }

    log::info("drush", "drush " + display + " (in " + config.drupal_root + ")");
    ProcessResult proc = context_.runner.run(argv, config.drupal_root, DRUSH_TIMEOUT);

    json data = {
        {"command", display},
        {"exit_code", proc.exit_code},
        {"output", proc.out}
    };

    if (proc.not_found) {
        data["install"] = installGuidance();
        throw Error(ErrorKind::PLATFORM, "Drush is not installed or not on PATH",
                    {"install Drush: composer require drush/drush"}, data);
    }
    if (proc.timed_out || proc.cancelled) {
        throw Error(ErrorKind::PLATFORM,
                    "drush " + display + (proc.cancelled ? " was cancelled" : " timed out"),
                    {"run it directly to see progress: drush " + display}, data);
    }
    if (proc.exit_code != 0) {
        data["error_output"] = proc.diagnostic();
        throw Error(ErrorKind::PLATFORM,
                    "drush " + display + " failed (exit " + std::to_string(proc.exit_code) + ")",
                    {"check DRUPAL_ROOT (currently " + config.drupal_root + ") points at the Drupal project",
                     "run `drush status` there to check the bootstrap"},
                    data);
    }

    return Result::ok("drush " + display + " completed", data);
}

} // namespace dp
