/**
 * CommandRegistry.hpp - Operation id -> command constructor table
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "dp/Command.hpp"
#include "dp/Intent.hpp"

namespace dp {

class PatternTable;

class UnknownOperationError : public std::runtime_error {
public:
    explicit UnknownOperationError(Operation op);
    Operation operation() const { return operation_; }

private:
    Operation operation_;
};

/**
 * Built once at start-up and read-only afterwards. Constructors turn an
 * Intent's parameter object into the command's typed parameters and throw
 * a VALIDATION dp::Error when mandatory fields are missing.
 */
class CommandRegistry {
public:
    using Constructor = std::function<std::unique_ptr<Command>(const Intent&, CommandContext&)>;

    explicit CommandRegistry(std::map<Operation, Constructor> constructors);

    // Every operation of the pattern vocabulary
    static CommandRegistry standard();

    std::unique_ptr<Command> create(const Intent& intent, CommandContext& context) const;

    bool contains(Operation op) const;
    std::set<Operation> operations() const;

    // Registered without a rule, or ruled without a registration; empty when consistent
    std::vector<std::string> verifyAgainst(const PatternTable& table) const;

private:
    std::map<Operation, Constructor> constructors_;
};

} // namespace dp
