/**
 * IntentResolver.hpp - Raw text to Intent: rules first, AI second, unresolved last
 */

#pragma once

#include <optional>
#include <string>

#include "dp/Intent.hpp"
#include "dp/ParameterExtractor.hpp"
#include "dp/PatternTable.hpp"

namespace dp {

class AiProvider;

class IntentResolver {
public:
    // Longer input is not matched at all: std::regex recursion grows with length
    static const size_t MAX_INPUT_LENGTH = 4096;

    // fallback may be null; the table must outlive the resolver
    explicit IntentResolver(const PatternTable& table, AiProvider* fallback = nullptr);
    ~IntentResolver();

    // Never throws; failures come back as an unresolved Intent. Over-long
    // input carries input_length and max_length in its parameters.
    Intent resolve(const std::string& raw_text) const;

    // Rule pass only, returns nullopt when no rule produced a usable Intent
    std::optional<Intent> matchRules(const std::string& text) const;

    // AI pass only, returns nullopt on timeout, malformed output or "unknown"
    std::optional<Intent> classifyWithAi(const std::string& text) const;

    // Trim and collapse whitespace; case is kept for parameter extraction
    static std::string normalize(const std::string& raw_text);

private:
    const PatternTable& table_;
    AiProvider* fallback_;
    ParameterExtractor extractor_;

    std::string buildClassificationPrompt(const std::string& text) const;
    Intent resolveNormalized(const std::string& text) const;
};

} // namespace dp
