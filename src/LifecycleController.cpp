/**
 * LifecycleController.cpp - start / stop / restart / status for one local site
 */

#include "dp/LifecycleController.hpp"
#include "dp/Config.hpp"
#include "dp/Log.hpp"
#include "dp/ParameterExtractor.hpp"
#include "dp/ProcessRunner.hpp"

using json = nlohmann::json;

namespace dp {

namespace {

std::string pastTense(LifecycleAction action) {
    switch (action) {
        case LifecycleAction::START: return "started";
        case LifecycleAction::STOP: return "stopped";
        case LifecycleAction::RESTART: return "restarted";
        case LifecycleAction::STATUS: return "status retrieved";
    }
    return "done";
}

std::string joined(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += " ";
        out += arg;
    }
    return out;
}

std::string lastLine(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return "";
    }
    size_t start = text.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return text.substr(start, end - start + 1);
}

} // anonymous namespace

SiteState LifecycleController::stateAfter(LifecycleAction action, const ProcessResult& proc) {
    SiteState expected = action == LifecycleAction::STOP ? SiteState::STOPPED : SiteState::RUNNING;

    // Tools print progress on stderr and sometimes nothing on stdout
    std::string line = lastLine(proc.out);
    if (line.empty()) {
        line = lastLine(proc.err);
    }
    SiteState reported = guessStateFromText(line);
    return reported == SiteState::ERROR ? expected : reported;
}

LifecycleController::LifecycleController(ProcessRunner& runner, const Config& config)
    : runner_(runner),
      sites_root_(config.site_directory),
      ddev_(config.ddev_path),
      lando_(config.lando_path) {}

const PlatformBackend* LifecycleController::backendFor(Platform platform) const {
    switch (platform) {
        case Platform::DDEV: return &ddev_;
        case Platform::LANDO: return &lando_;
        case Platform::UNKNOWN: return nullptr;
    }
    return nullptr;
}

Result LifecycleController::run(LifecycleAction action, const std::string& site_name) const {
    SiteDescriptor site = PlatformDetector::describe(site_name, sites_root_);

    // create-site stores the cleaned name on disk ("My_Blog" -> "my-blog")
    std::string cleaned = cleanProjectName(site_name);
    if (!site.exists && !cleaned.empty() && cleaned != site_name) {
        SiteDescriptor alternate = PlatformDetector::describe(cleaned, sites_root_);
        if (alternate.exists) {
            log::debug("lifecycle", "using directory " + alternate.directory + " for '" + site_name + "'");
            site = alternate;
        }
    }

    json data = {
        {"project_name", site.name},
        {"directory", site.directory}
    };

    if (!site.exists) {
        std::string suggested = cleaned.empty() ? site.name : cleaned;
        if (!cleaned.empty() && cleaned != site_name) {
            data["cleaned_name"] = cleaned;
        }
        throw Error(ErrorKind::NOT_FOUND,
                    "Site directory not found: " + site.directory,
                    {"create it first: dp \"create site named " + suggested + "\"",
                     "or point DEFAULT_SITE_DIRECTORY at the folder that holds your sites"},
                    data);
    }

    const PlatformBackend* backend = backendFor(site.platform);
    data["platform"] = toString(site.platform);

    if (!backend) {
        throw Error(ErrorKind::PLATFORM,
                    "Cannot determine platform for " + site.directory,
                    {"no .ddev/config.yaml or .lando.yml found; run `ddev config` or add a .lando.yml"},
                    data);
    }

    if (!runner_.which(backend->executable())) {
        data["install"] = backend->installGuidance();
        throw Error(ErrorKind::PLATFORM,
                    backend->displayName() + " is not installed or not on PATH",
                    {"install " + backend->displayName() + ": " +
                     data["install"]["url"].get<std::string>()},
                    data);
    }

    log::info("lifecycle", toString(action) + " " + site.name + " via " + backend->displayName());
    ProcessResult proc = runner_.run(backend->command(action), site.directory,
                                     PlatformBackend::timeoutSeconds(action));

    if (proc.not_found) {
        data["install"] = backend->installGuidance();
        throw Error(ErrorKind::PLATFORM,
                    backend->displayName() + " is not installed or not on PATH",
                    {"install " + backend->displayName()}, data);
    }

    if (proc.timed_out || proc.cancelled) {
        data["status"] = toString(SiteState::ERROR);
        std::string why = proc.cancelled
                              ? "was cancelled"
                              : "timed out after " + std::to_string(PlatformBackend::timeoutSeconds(action)) + "s";
        throw Error(ErrorKind::PLATFORM,
                    backend->displayName() + " " + toString(action) + " " + why,
                    {"check the container engine (docker ps) and retry"},
                    data);
    }

    if (proc.exit_code != 0) {
        data["status"] = toString(SiteState::ERROR);
        data["exit_code"] = proc.exit_code;
        data["output"] = proc.diagnostic();
        throw Error(ErrorKind::PLATFORM,
                    backend->displayName() + " " + toString(action) + " failed (exit " +
                        std::to_string(proc.exit_code) + ")",
                    {"run `" + joined(backend->command(action)) + "` in " + site.directory +
                     " to see the full output"},
                    data);
    }

    if (action == LifecycleAction::STATUS) {
        StatusSummary summary = backend->parseStatus(proc.out, site.name);
        data["status"] = toString(summary.state);
        data["url"] = summary.url;
        data["services"] = summary.services;
    } else {
        data["status"] = toString(stateAfter(action, proc));
        data["url"] = backend->defaultUrl(site.name);
    }

    return Result::ok(backend->displayName() + " site '" + site.name + "' " + pastTense(action), data);
}

} // namespace dp
