/**
 * MaintenanceCommand.hpp - run-drush: one Drush command in the Drupal root
 */

#pragma once

#include <string>
#include <vector>

#include "dp/Command.hpp"

namespace dp {

struct RunDrushParams {
    std::string command;                // "cache:rebuild", or a raw "cr" / "pm:list --type=module"
    std::string module;
    std::vector<std::string> args;

    static RunDrushParams fromJson(const nlohmann::json& params);
};

class RunDrushCommand : public Command {
public:
    RunDrushCommand(RunDrushParams params, CommandContext& context);

    std::string name() const override { return "run-drush"; }
    std::vector<std::string> problems() const override;
    Result execute() override;

    // drush argv without the executable, --yes added where Drush would prompt
    std::vector<std::string> drushArguments() const;

    static bool isDestructive(const std::string& drush_command);
    static bool needsModule(const std::string& drush_command);

    static nlohmann::json installGuidance();

private:
    // First token after any @alias; tokens_.size() when there is none
    size_t verbIndex() const;

    RunDrushParams params_;
    CommandContext& context_;
    std::vector<std::string> tokens_;   // params_.command split on whitespace
};

} // namespace dp
