/**
 * SiteScaffolder.cpp - New Drupal site: composer project, platform config, install
 */

#include "dp/SiteScaffolder.hpp"
#include "dp/Config.hpp"
#include "dp/Log.hpp"
#include "dp/ParameterExtractor.hpp"
#include "dp/ProcessRunner.hpp"

#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace dp {

static const int COMPOSER_TIMEOUT = 600;
static const int CONFIG_TIMEOUT = 60;
static const int INSTALL_TIMEOUT = 300;

SiteScaffolder::SiteScaffolder(ProcessRunner& runner, const Config& config)
    : runner_(runner),
      config_(config),
      ddev_(config.ddev_path),
      lando_(config.lando_path) {}

std::string SiteScaffolder::landoConfig(const std::string& project_name, const std::string& recipe) {
    return "name: " + project_name + "\n"
           "recipe: " + recipe + "\n"
           "config:\n"
           "  webroot: web\n"
           "  database: mariadb:10.6\n"
           "  php: '8.3'\n"
           "proxy:\n"
           "  appserver:\n"
           "    - " + project_name + ".lndo.site\n"
           "tooling:\n"
           "  drush:\n"
           "    service: appserver\n"
           "    cmd: /app/vendor/bin/drush\n";
}

json SiteScaffolder::composerGuidance() {
    return {
        {"message", "Composer is required to download Drupal."},
        {"url", "https://getcomposer.org/download/"},
        {"commands", {
            {"macos", "brew install composer"},
            {"linux", "sudo apt install composer"}
        }}
    };
}

void SiteScaffolder::step(const std::vector<std::string>& argv, const std::string& cwd, int timeout,
                          const std::string& what, json& data) const {
    log::info("scaffold", what + "...");
    ProcessResult proc = runner_.run(argv, cwd, timeout);
    if (proc.ok()) {
        return;
    }

    std::string why;
    if (proc.not_found) why = argv[0] + " not found";
    else if (proc.cancelled) why = "cancelled";
    else if (proc.timed_out) why = "timed out after " + std::to_string(timeout) + "s";
    else why = "exit " + std::to_string(proc.exit_code);

    data["failed_step"] = what;
    data["output"] = proc.diagnostic();
    throw Error(ErrorKind::PLATFORM, what + " failed (" + why + ")",
                {"remove " + cwd + " before retrying, the directory is partially set up"},
                data);
}

Result SiteScaffolder::create(const std::string& project_name, Platform platform,
                              const std::string& directory) const {
    std::string name = cleanProjectName(project_name);
    if (name.empty()) {
        throw Error(ErrorKind::VALIDATION, "Invalid project name: '" + project_name + "'",
                    {"use letters, digits and dashes, e.g. my-blog"});
    }

    const PlatformBackend* backend = nullptr;
    if (platform == Platform::DDEV) backend = &ddev_;
    else if (platform == Platform::LANDO) backend = &lando_;
    if (!backend) {
        throw Error(ErrorKind::VALIDATION, "Unsupported platform: " + toString(platform),
                    {"choose ddev or lando"});
    }

    std::string root = directory.empty() ? config_.site_directory : directory;
    fs::path target = (fs::path(root) / name).lexically_normal();

    json data = {
        {"project_name", name},
        {"platform", toString(platform)},
        {"directory", target.string()}
    };

    std::error_code ec;
    if (fs::exists(target, ec) && !fs::is_empty(target, ec)) {
        throw Error(ErrorKind::VALIDATION, "Site directory already exists: " + target.string(),
                    {"pick another name, or start the existing site: dp \"start " + name + "\""},
                    data);
    }

    if (!runner_.which(backend->executable())) {
        data["install"] = backend->installGuidance();
        throw Error(ErrorKind::PLATFORM, backend->displayName() + " is not installed or not on PATH",
                    {"install " + backend->displayName() + ": " + data["install"]["url"].get<std::string>()},
                    data);
    }
    if (!runner_.which(config_.composer_path)) {
        data["install"] = composerGuidance();
        throw Error(ErrorKind::PLATFORM, "Composer is not installed or not on PATH",
                    {"install Composer: https://getcomposer.org/download/"}, data);
    }

    fs::create_directories(target, ec);
    if (ec) {
        throw Error(ErrorKind::PLATFORM, "Cannot create " + target.string() + ": " + ec.message(),
                    {"check permissions on " + root}, data);
    }
    std::string cwd = target.string();

    log::info("scaffold", "creating " + backend->displayName() + " site " + name + " in " + cwd);

    step({config_.composer_path, "create-project", "drupal/recommended-project", ".",
          "--no-interaction", "--prefer-dist"},
         cwd, COMPOSER_TIMEOUT, "Composer create-project", data);

    if (platform == Platform::DDEV) {
        step({backend->executable(), "config",
              "--project-type=" + config_.drupal_version,
              "--project-name=" + name,
              "--docroot=web"},
             cwd, CONFIG_TIMEOUT, "DDEV config", data);
    } else {
        std::ofstream file(target / ".lando.yml");
        file << landoConfig(name, config_.drupal_version);
        if (!file.good()) {
            throw Error(ErrorKind::PLATFORM, "Cannot write " + (target / ".lando.yml").string(),
                        {"check permissions on " + cwd}, data);
        }
    }

    step(backend->command(LifecycleAction::START), cwd,
         PlatformBackend::timeoutSeconds(LifecycleAction::START),
         backend->displayName() + " start", data);

    // A failed install leaves a running but empty site; report it, do not fail
    ProcessResult install = runner_.run(
        {backend->executable(), "drush", "site:install", "standard", "--yes",
         "--site-name=" + name,
         "--account-name=" + config_.drupal_username,
         "--account-pass=" + config_.drupal_password},
        cwd, INSTALL_TIMEOUT);

    json warnings = json::array();
    if (!install.ok()) {
        log::warn("scaffold", "Drupal installation had issues: " + install.diagnostic(200));
        warnings.push_back("drush site:install did not complete; run `" + backend->executable() +
                           " drush site:install` in " + cwd);
    }

    data["status"] = toString(SiteState::RUNNING);
    data["url"] = backend->defaultUrl(name);
    data["admin_user"] = config_.drupal_username;
    data["next_steps"] = {
        "cd " + cwd,
        "open " + backend->defaultUrl(name),
        "dp \"status of site " + name + "\""
    };
    if (!warnings.empty()) {
        data["warnings"] = warnings;
    }

    return Result::ok(backend->displayName() + " site '" + name + "' created successfully", data);
}

} // namespace dp
