/**
 * CommandRegistry.cpp - Operation id -> command constructor table
 */

#include "dp/CommandRegistry.hpp"
#include "dp/PatternTable.hpp"
#include "dp/commands/ContentCommands.hpp"
#include "dp/commands/MaintenanceCommand.hpp"
#include "dp/commands/QueryCommand.hpp"
#include "dp/commands/SiteCommands.hpp"

namespace dp {

UnknownOperationError::UnknownOperationError(Operation op)
    : std::runtime_error("no command registered for operation '" + toString(op) + "'"),
      operation_(op) {}

CommandRegistry::CommandRegistry(std::map<Operation, Constructor> constructors)
    : constructors_(std::move(constructors)) {}

CommandRegistry CommandRegistry::standard() {
    std::map<Operation, Constructor> table;

    table[Operation::CREATE_POST] = [](const Intent& intent, CommandContext& ctx) {
        return std::make_unique<CreatePostCommand>(CreatePostParams::fromJson(intent.parameters), ctx);
    };
    table[Operation::EDIT_NODE] = [](const Intent& intent, CommandContext& ctx) {
        return std::make_unique<EditNodeCommand>(EditNodeParams::fromJson(intent.parameters), ctx);
    };
    table[Operation::DELETE_NODE] = [](const Intent& intent, CommandContext& ctx) {
        return std::make_unique<DeleteNodeCommand>(DeleteNodeParams::fromJson(intent.parameters), ctx);
    };
    table[Operation::UPLOAD_MEDIA] = [](const Intent& intent, CommandContext& ctx) {
        return std::make_unique<UploadMediaCommand>(UploadMediaParams::fromJson(intent.parameters), ctx);
    };
    table[Operation::RUN_DRUSH] = [](const Intent& intent, CommandContext& ctx) {
        return std::make_unique<RunDrushCommand>(RunDrushParams::fromJson(intent.parameters), ctx);
    };

    for (Operation op : {Operation::QUERY_LATEST, Operation::QUERY_SEARCH, Operation::QUERY_BY_TYPE,
                         Operation::QUERY_TAGGED, Operation::QUERY_USERS}) {
        table[op] = [op](const Intent& intent, CommandContext& ctx) {
            return std::make_unique<QueryCommand>(QueryParams::fromJson(op, intent.parameters), ctx);
        };
    }

    table[Operation::CREATE_SITE] = [](const Intent& intent, CommandContext& ctx) {
        return std::make_unique<CreateSiteCommand>(CreateSiteParams::fromJson(intent.parameters), ctx);
    };

    const std::pair<Operation, LifecycleAction> lifecycle[] = {
        {Operation::START_SITE, LifecycleAction::START},
        {Operation::STOP_SITE, LifecycleAction::STOP},
        {Operation::RESTART_SITE, LifecycleAction::RESTART},
        {Operation::STATUS_SITE, LifecycleAction::STATUS}
    };
    for (const auto& [op, action] : lifecycle) {
        LifecycleAction a = action;
        table[op] = [a](const Intent& intent, CommandContext& ctx) {
            return std::make_unique<LifecycleCommand>(
                a, SiteParams::fromJson(toString(intent.operation), intent.parameters), ctx);
        };
    }

    return CommandRegistry(std::move(table));
}

std::unique_ptr<Command> CommandRegistry::create(const Intent& intent, CommandContext& context) const {
    auto it = constructors_.find(intent.operation);
    if (it == constructors_.end()) {
        throw UnknownOperationError(intent.operation);
    }
    return it->second(intent, context);
}

bool CommandRegistry::contains(Operation op) const {
    return constructors_.count(op) > 0;
}

std::set<Operation> CommandRegistry::operations() const {
    std::set<Operation> ops;
    for (const auto& entry : constructors_) {
        ops.insert(entry.first);
    }
    return ops;
}

std::vector<std::string> CommandRegistry::verifyAgainst(const PatternTable& table) const {
    std::vector<std::string> problems;
    std::set<Operation> ruled = table.operations();

    for (const auto& entry : constructors_) {
        if (!ruled.count(entry.first)) {
            problems.push_back("operation '" + toString(entry.first) + "' is registered but no pattern rule produces it");
        }
    }
    for (Operation op : ruled) {
        if (!constructors_.count(op)) {
            problems.push_back("pattern rules produce '" + toString(op) + "' but no command is registered for it");
        }
    }
    return problems;
}

} // namespace dp
