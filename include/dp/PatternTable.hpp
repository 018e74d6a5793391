/**
 * PatternTable.hpp - Ordered rules mapping text shapes to operations
 *
 * Declaration order is priority order: the first rule whose regex matches and
 * whose mandatory roles can be filled wins. More specific shapes must come
 * before looser ones that also match the same text ("restart x" before "start x").
 */

#pragma once

#include <regex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dp/Intent.hpp"
#include "dp/ParameterExtractor.hpp"

namespace dp {

struct PatternRule {
    std::string pattern;                    // raw regex, ECMAScript, matched case-insensitively
    std::regex matcher;                     // compiled pattern
    Operation operation = Operation::UNKNOWN;
    std::vector<ParamRole> roles;           // capture group -> parameter role
    nlohmann::json fixed = nlohmann::json::object();   // parameters injected verbatim
};

class PatternTable {
public:
    explicit PatternTable(std::vector<PatternRule> rules);

    // The built-in rule set, in priority order
    static PatternTable standard();

    // Compiles the pattern; throws std::regex_error on a bad pattern
    static PatternRule rule(const std::string& pattern, Operation op,
                            std::vector<ParamRole> roles = {},
                            nlohmann::json fixed = nlohmann::json::object());

    const std::vector<PatternRule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }

    // Operations reachable through at least one rule
    std::set<Operation> operations() const;

private:
    std::vector<PatternRule> rules_;
};

} // namespace dp
