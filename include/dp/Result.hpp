/**
 * Result.hpp - Uniform result envelope and the shared error taxonomy
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dp {

enum class ErrorKind {
    NONE,
    PARSE,              // no intent could be resolved
    VALIDATION,         // parameters present but invalid or incomplete
    NOT_FOUND,          // referenced site, node or file does not exist
    PLATFORM,           // external tool missing, unreachable or non-zero exit
    PROVIDER,           // AI or content backend unavailable / unauthorized / timed out
    UNKNOWN_OPERATION   // no command registered for a resolved operation
};

// "ParseFailure", "ValidationFailure", ...
std::string toString(ErrorKind kind);

// dump() that replaces invalid UTF-8 (user text, tool output) instead of throwing
std::string dumpJson(const nlohmann::json& value, int indent = -1);

struct Result {
    bool success = false;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
    ErrorKind error = ErrorKind::NONE;

    static Result ok(const std::string& message,
                     nlohmann::json data = nlohmann::json::object());

    static Result fail(ErrorKind kind, const std::string& message,
                       const std::vector<std::string>& suggestions = {},
                       nlohmann::json data = nlohmann::json::object());

    // Appends to data.suggestions, creating the array if needed
    Result& suggest(const std::string& hint);

    nlohmann::json toJson() const;
};

/**
 * Thrown inside commands and collaborators when work cannot continue.
 * The dispatcher converts it into a failure Result; it never reaches main().
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message,
          std::vector<std::string> suggestions = {},
          nlohmann::json data = nlohmann::json::object());

    ErrorKind kind() const { return kind_; }
    const std::vector<std::string>& suggestions() const { return suggestions_; }
    const nlohmann::json& data() const { return data_; }

    Result toResult() const;

private:
    ErrorKind kind_;
    std::vector<std::string> suggestions_;
    nlohmann::json data_;
};

} // namespace dp
