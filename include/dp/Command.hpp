/**
 * Command.hpp - Validate-then-execute unit for one resolved operation
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dp/Result.hpp"

namespace dp {

struct Config;
class AiProvider;
class ContentBackend;
class ProcessRunner;

// Null with error filled when the provider cannot be built
using AiProviderFactory =
    std::function<std::unique_ptr<AiProvider>(const std::string& provider, std::string& error)>;

// Collaborators handed to every command; all outlive the dispatch
struct CommandContext {
    const Config& config;
    ProcessRunner& runner;
    ContentBackend& backend;
    AiProviderFactory ai_factory;
    std::string ai_provider_override;   // --ai-provider
};

class Command {
public:
    virtual ~Command() = default;

    virtual std::string name() const = 0;

    // Reasons the parameters cannot be executed; empty when valid
    virtual std::vector<std::string> problems() const = 0;

    bool validate() const { return problems().empty(); }

    // Throws dp::Error when the operation cannot be completed
    virtual Result execute() = 0;
};

/**
 * Reads an Intent's parameter object into typed fields. Missing mandatory
 * fields and values of the wrong shape are collected, and finish() throws a
 * single VALIDATION error naming all of them.
 */
class ParamReader {
public:
    ParamReader(const nlohmann::json& params, std::string operation);

    std::string text(const std::string& key, bool mandatory, const std::string& fallback = "");

    // Accepts a JSON number or a numeric string ("5")
    std::optional<long> integer(const std::string& key, bool mandatory);

    // Accepts an array of strings or one comma-separated string
    std::vector<std::string> list(const std::string& key);

    // Records a missing field decided by the caller (e.g. "title or topic")
    void requireOneOf(const std::string& label, bool satisfied);

    void finish() const;

private:
    const nlohmann::json& params_;
    std::string operation_;
    std::vector<std::string> missing_;
    std::vector<std::string> invalid_;
};

} // namespace dp
