/**
 * SiteScaffolder.hpp - New Drupal site: composer project, platform config, install
 */

#pragma once

#include <string>

#include "dp/Platform.hpp"
#include "dp/Result.hpp"

namespace dp {

struct Config;
class ProcessRunner;

class SiteScaffolder {
public:
    SiteScaffolder(ProcessRunner& runner, const Config& config);

    // directory empty = DEFAULT_SITE_DIRECTORY; throws dp::Error on failure
    Result create(const std::string& project_name, Platform platform,
                  const std::string& directory = "") const;

    static std::string landoConfig(const std::string& project_name, const std::string& recipe);

    static nlohmann::json composerGuidance();

private:
    ProcessRunner& runner_;
    const Config& config_;
    DdevBackend ddev_;
    LandoBackend lando_;

    void step(const std::vector<std::string>& argv, const std::string& cwd, int timeout,
              const std::string& what, nlohmann::json& data) const;
};

} // namespace dp
