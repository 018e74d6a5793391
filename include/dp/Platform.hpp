/**
 * Platform.hpp - DDEV / Lando detection and per-platform command sets
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dp {

enum class Platform {
    DDEV,
    LANDO,
    UNKNOWN
};

std::string toString(Platform platform);
Platform platformFromString(const std::string& name);

enum class SiteState {
    RUNNING,
    STOPPED,
    ERROR
};

std::string toString(SiteState state);

enum class LifecycleAction {
    START,
    STOP,
    RESTART,
    STATUS
};

std::string toString(LifecycleAction action);

// Facts derived from a site directory on each call; never cached
struct SiteDescriptor {
    std::string name;
    std::string directory;
    bool exists = false;
    Platform platform = Platform::UNKNOWN;
};

struct StatusSummary {
    SiteState state = SiteState::ERROR;
    std::string url;
    nlohmann::json services = nlohmann::json::object();   // service name -> state
};

class PlatformDetector {
public:
    // .ddev/config.yaml -> DDEV, else .lando.yml -> LANDO, else UNKNOWN
    static Platform detect(const std::string& directory);

    // Site `name` under sites_root
    static SiteDescriptor describe(const std::string& name, const std::string& sites_root);
};

class PlatformBackend {
public:
    virtual ~PlatformBackend() = default;

    virtual Platform platform() const = 0;
    virtual std::string displayName() const = 0;
    virtual const std::string& executable() const = 0;

    virtual std::vector<std::string> command(LifecycleAction action) const = 0;

    virtual std::string defaultUrl(const std::string& site_name) const = 0;

    // JSON output first, text heuristics when it is not JSON
    virtual StatusSummary parseStatus(const std::string& output, const std::string& site_name) const = 0;

    // {"message": ..., "url": ..., "commands": {...}} shown when the binary is missing
    virtual nlohmann::json installGuidance() const = 0;

    // start/restart 300 s, stop 120 s, status 60 s
    static int timeoutSeconds(LifecycleAction action);
};

class DdevBackend : public PlatformBackend {
public:
    explicit DdevBackend(std::string executable = "ddev");

    Platform platform() const override { return Platform::DDEV; }
    std::string displayName() const override { return "DDEV"; }
    const std::string& executable() const override { return executable_; }

    std::vector<std::string> command(LifecycleAction action) const override;
    std::string defaultUrl(const std::string& site_name) const override;
    StatusSummary parseStatus(const std::string& output, const std::string& site_name) const override;
    nlohmann::json installGuidance() const override;

private:
    std::string executable_;
};

class LandoBackend : public PlatformBackend {
public:
    explicit LandoBackend(std::string executable = "lando");

    Platform platform() const override { return Platform::LANDO; }
    std::string displayName() const override { return "Lando"; }
    const std::string& executable() const override { return executable_; }

    std::vector<std::string> command(LifecycleAction action) const override;
    std::string defaultUrl(const std::string& site_name) const override;
    StatusSummary parseStatus(const std::string& output, const std::string& site_name) const override;
    nlohmann::json installGuidance() const override;

private:
    std::string executable_;
};

// Text fallback shared by both backends
SiteState guessStateFromText(const std::string& output);

} // namespace dp
