/**
 * SiteCommands.cpp - create-site and the lifecycle operations
 */

#include "dp/commands/SiteCommands.hpp"
#include "dp/Config.hpp"
#include "dp/LifecycleController.hpp"
#include "dp/ParameterExtractor.hpp"
#include "dp/SiteScaffolder.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace dp {

namespace {

bool isSiteName(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    });
}

} // anonymous namespace

CreateSiteParams CreateSiteParams::fromJson(const json& params) {
    ParamReader reader(params, "create-site");
    CreateSiteParams p;
    p.project_name = reader.text("project_name", true);
    p.platform = reader.text("platform", false, "ddev");
    p.directory = reader.text("directory", false);
    reader.finish();

    std::transform(p.platform.begin(), p.platform.end(), p.platform.begin(), ::tolower);
    return p;
}

CreateSiteCommand::CreateSiteCommand(CreateSiteParams params, CommandContext& context)
    : params_(std::move(params)), context_(context) {}

std::vector<std::string> CreateSiteCommand::problems() const {
    std::vector<std::string> found;
    if (cleanProjectName(params_.project_name).empty()) {
        found.push_back("project name '" + params_.project_name + "' has no usable characters");
    }
    if (platformFromString(params_.platform) == Platform::UNKNOWN) {
        found.push_back("platform must be ddev or lando, not '" + params_.platform + "'");
    }
    return found;
}

Result CreateSiteCommand::execute() {
    SiteScaffolder scaffolder(context_.runner, context_.config);
    return scaffolder.create(params_.project_name, platformFromString(params_.platform),
                             params_.directory);
}

SiteParams SiteParams::fromJson(const std::string& operation, const json& params) {
    ParamReader reader(params, operation);
    SiteParams p;
    p.project_name = reader.text("project_name", true);
    reader.finish();
    return p;
}

LifecycleCommand::LifecycleCommand(LifecycleAction action, SiteParams params, CommandContext& context)
    : action_(action), params_(std::move(params)), context_(context) {}

std::vector<std::string> LifecycleCommand::problems() const {
    std::vector<std::string> found;
    if (!isSiteName(params_.project_name)) {
        found.push_back("site name '" + params_.project_name +
                        "' may only contain letters, digits, dashes and underscores");
    }
    return found;
}

Result LifecycleCommand::execute() {
    LifecycleController controller(context_.runner, context_.config);
    return controller.run(action_, params_.project_name);
}

} // namespace dp
