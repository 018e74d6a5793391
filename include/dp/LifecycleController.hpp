/**
 * LifecycleController.hpp - start / stop / restart / status for one local site
 */

#pragma once

#include <string>

#include "dp/Platform.hpp"
#include "dp/Result.hpp"

namespace dp {

struct Config;
struct ProcessResult;
class ProcessRunner;

/**
 * Drives one lifecycle action against a site under the sites root.
 *
 * Checks run in a fixed order and throw dp::Error at the first failure:
 * missing directory (NOT_FOUND), undetectable platform (PLATFORM),
 * platform binary not on PATH (PLATFORM, data.install), then the tool's
 * own exit status, timeout or cancellation (PLATFORM, data.status "error").
 * A name with no directory of its own falls back to its cleaned form,
 * the name create-site writes to disk.
 */
class LifecycleController {
public:
    LifecycleController(ProcessRunner& runner, const Config& config);

    Result run(LifecycleAction action, const std::string& site_name) const;

    // Null for Platform::UNKNOWN
    const PlatformBackend* backendFor(Platform platform) const;

    const std::string& sitesRoot() const { return sites_root_; }

    // State after a successful start/stop/restart: the tool's last output
    // line when it names one, otherwise what the action implies
    static SiteState stateAfter(LifecycleAction action, const ProcessResult& proc);

private:
    ProcessRunner& runner_;
    std::string sites_root_;
    DdevBackend ddev_;
    LandoBackend lando_;
};

} // namespace dp
