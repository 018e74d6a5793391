/**
 * Platform.cpp - DDEV / Lando detection and per-platform command sets
 */

#include "dp/Platform.hpp"
#include "dp/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace dp {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

SiteState stateFromWord(const std::string& word) {
    std::string lower = toLower(word);
    if (lower.find("running") != std::string::npos || lower == "ok" || lower == "healthy") {
        return SiteState::RUNNING;
    }
    if (lower.find("stop") != std::string::npos || lower.find("paus") != std::string::npos ||
        lower.find("exited") != std::string::npos) {
        return SiteState::STOPPED;
    }
    return SiteState::ERROR;
}

// Reads one `ddev describe` payload; false when it is not one
bool readDdevDescribe(const json& payload, StatusSummary& summary) {
    const json& raw = payload.contains("raw") ? payload["raw"] : payload;
    if (!raw.is_object() || !raw.contains("status") || !raw["status"].is_string()) {
        return false;
    }

    summary.state = stateFromWord(raw["status"].get<std::string>());

    for (const char* key : {"primary_url", "httpsurl", "httpurl"}) {
        if (raw.contains(key) && raw[key].is_string() && !raw[key].get<std::string>().empty()) {
            summary.url = raw[key].get<std::string>();
            break;
        }
    }

    if (raw.contains("services") && raw["services"].is_object()) {
        for (auto it = raw["services"].begin(); it != raw["services"].end(); ++it) {
            std::string state = "unknown";
            if (it.value().is_object() && it.value().contains("status") && it.value()["status"].is_string()) {
                state = it.value()["status"].get<std::string>();
            }
            summary.services[it.key()] = state;
        }
    }
    return true;
}

} // anonymous namespace

std::string toString(Platform platform) {
    switch (platform) {
        case Platform::DDEV: return "ddev";
        case Platform::LANDO: return "lando";
        case Platform::UNKNOWN: return "unknown";
    }
    return "unknown";
}

Platform platformFromString(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "ddev") return Platform::DDEV;
    if (lower == "lando") return Platform::LANDO;
    return Platform::UNKNOWN;
}

std::string toString(SiteState state) {
    switch (state) {
        case SiteState::RUNNING: return "running";
        case SiteState::STOPPED: return "stopped";
        case SiteState::ERROR: return "error";
    }
    return "error";
}

std::string toString(LifecycleAction action) {
    switch (action) {
        case LifecycleAction::START: return "start";
        case LifecycleAction::STOP: return "stop";
        case LifecycleAction::RESTART: return "restart";
        case LifecycleAction::STATUS: return "status";
    }
    return "status";
}

Platform PlatformDetector::detect(const std::string& directory) {
    std::error_code ec;
    fs::path dir(directory);

    if (fs::exists(dir / ".ddev" / "config.yaml", ec)) {
        return Platform::DDEV;
    }
    if (fs::exists(dir / ".lando.yml", ec)) {
        return Platform::LANDO;
    }
    return Platform::UNKNOWN;
}

SiteDescriptor PlatformDetector::describe(const std::string& name, const std::string& sites_root) {
    SiteDescriptor site;
    site.name = name;
    site.directory = (fs::path(sites_root) / name).lexically_normal().string();

    std::error_code ec;
    site.exists = fs::is_directory(site.directory, ec);
    site.platform = site.exists ? detect(site.directory) : Platform::UNKNOWN;

    log::debug("platform", name + " -> " + site.directory + " (" + toString(site.platform) + ")");
    return site;
}

int PlatformBackend::timeoutSeconds(LifecycleAction action) {
    switch (action) {
        case LifecycleAction::START:
        case LifecycleAction::RESTART:
            return 300;
        case LifecycleAction::STOP:
            return 120;
        case LifecycleAction::STATUS:
            return 60;
    }
    return 60;
}

SiteState guessStateFromText(const std::string& output) {
    std::string lower = toLower(output);
    if (lower.find("not running") != std::string::npos ||
        lower.find("stopped") != std::string::npos ||
        lower.find("paused") != std::string::npos) {
        return SiteState::STOPPED;
    }
    if (lower.find("running") != std::string::npos) {
        return SiteState::RUNNING;
    }
    return SiteState::ERROR;
}

// --- DDEV -------------------------------------------------------------------

DdevBackend::DdevBackend(std::string executable)
    : executable_(std::move(executable)) {}

std::vector<std::string> DdevBackend::command(LifecycleAction action) const {
    switch (action) {
        case LifecycleAction::START: return {executable_, "start"};
        case LifecycleAction::STOP: return {executable_, "stop"};
        case LifecycleAction::RESTART: return {executable_, "restart"};
        case LifecycleAction::STATUS: return {executable_, "describe", "-j"};
    }
    return {executable_, "describe", "-j"};
}

std::string DdevBackend::defaultUrl(const std::string& site_name) const {
    return "https://" + site_name + ".ddev.site";
}

StatusSummary DdevBackend::parseStatus(const std::string& output, const std::string& site_name) const {
    StatusSummary summary;
    summary.url = defaultUrl(site_name);

    // Pretty-printed single document
    try {
        if (readDdevDescribe(json::parse(output), summary)) {
            return summary;
        }
    } catch (const json::exception&) {
        // ddev -j may also emit one JSON log record per line
    }

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        size_t brace = line.find('{');
        if (brace == std::string::npos) continue;
        try {
            if (readDdevDescribe(json::parse(line.substr(brace)), summary)) {
                return summary;
            }
        } catch (const json::exception&) {
            continue;
        }
    }

    log::debug("platform", "ddev describe output is not JSON, reading it as text");
    summary.state = guessStateFromText(output);
    return summary;
}

json DdevBackend::installGuidance() const {
    return {
        {"message", "DDEV is required to manage this site."},
        {"url", "https://ddev.com/get-started/"},
        {"commands", {
            {"macos", "brew install ddev/ddev/ddev"},
            {"linux", "curl -fsSL https://ddev.com/install.sh | bash"},
            {"windows", "https://ddev.com/get-started/#windows"}
        }}
    };
}

// --- Lando ------------------------------------------------------------------

LandoBackend::LandoBackend(std::string executable)
    : executable_(std::move(executable)) {}

std::vector<std::string> LandoBackend::command(LifecycleAction action) const {
    switch (action) {
        case LifecycleAction::START: return {executable_, "start"};
        case LifecycleAction::STOP: return {executable_, "stop"};
        case LifecycleAction::RESTART: return {executable_, "restart"};
        case LifecycleAction::STATUS: return {executable_, "info", "--format", "json"};
    }
    return {executable_, "info", "--format", "json"};
}

std::string LandoBackend::defaultUrl(const std::string& site_name) const {
    return "https://" + site_name + ".lndo.site";
}

StatusSummary LandoBackend::parseStatus(const std::string& output, const std::string& site_name) const {
    StatusSummary summary;
    summary.url = defaultUrl(site_name);

    json services;
    try {
        size_t start = output.find('[');
        services = json::parse(start == std::string::npos ? output : output.substr(start));
    } catch (const json::exception&) {
        log::debug("platform", "lando info output is not JSON, reading it as text");
        summary.state = guessStateFromText(output);
        return summary;
    }

    if (!services.is_array()) {
        summary.state = guessStateFromText(output);
        return summary;
    }

    // lando info lists containers; a service answering on a URL is up
    bool any_up = false;
    std::string first_url;
    for (const auto& service : services) {
        if (!service.is_object()) continue;

        std::string name = service.value("service", "service");
        bool up = false;
        if (service.contains("urls") && service["urls"].is_array()) {
            for (const auto& url : service["urls"]) {
                if (!url.is_string()) continue;
                up = true;
                std::string value = url.get<std::string>();
                if (first_url.empty() || (value.rfind("https://", 0) == 0 && first_url.rfind("https://", 0) != 0)) {
                    first_url = value;
                }
            }
        }
        if (service.contains("healthy") && service["healthy"].is_boolean()) {
            up = up || service["healthy"].get<bool>();
        }

        summary.services[name] = up ? "running" : "stopped";
        any_up = any_up || up;
    }

    summary.state = any_up ? SiteState::RUNNING : SiteState::STOPPED;
    if (!first_url.empty()) {
        summary.url = first_url;
    }
    return summary;
}

json LandoBackend::installGuidance() const {
    return {
        {"message", "Lando is required to manage this site."},
        {"url", "https://docs.lando.dev/basics/installation.html"},
        {"commands", {
            {"macos", "brew install lando"},
            {"linux", "/bin/bash -c \"$(curl -fsSL https://get.lando.dev/setup-lando.sh)\""},
            {"windows", "https://docs.lando.dev/basics/installation.html#windows"}
        }}
    };
}

} // namespace dp
