/**
 * SiteCommands.hpp - create-site and the lifecycle operations
 */

#pragma once

#include <string>
#include <vector>

#include "dp/Command.hpp"
#include "dp/Platform.hpp"

namespace dp {

struct CreateSiteParams {
    std::string project_name;
    std::string platform = "ddev";
    std::string directory;

    static CreateSiteParams fromJson(const nlohmann::json& params);
};

class CreateSiteCommand : public Command {
public:
    CreateSiteCommand(CreateSiteParams params, CommandContext& context);

    std::string name() const override { return "create-site"; }
    std::vector<std::string> problems() const override;
    Result execute() override;

private:
    CreateSiteParams params_;
    CommandContext& context_;
};

struct SiteParams {
    std::string project_name;

    static SiteParams fromJson(const std::string& operation, const nlohmann::json& params);
};

// start-site, stop-site, restart-site and status-site
class LifecycleCommand : public Command {
public:
    LifecycleCommand(LifecycleAction action, SiteParams params, CommandContext& context);

    std::string name() const override { return toString(action_) + "-site"; }
    std::vector<std::string> problems() const override;
    Result execute() override;

private:
    LifecycleAction action_;
    SiteParams params_;
    CommandContext& context_;
};

} // namespace dp
