/**
 * Result.cpp - Uniform result envelope and the shared error taxonomy
 */

#include "dp/Result.hpp"

#include <utility>

namespace dp {

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:              return "";
        case ErrorKind::PARSE:             return "ParseFailure";
        case ErrorKind::VALIDATION:        return "ValidationFailure";
        case ErrorKind::NOT_FOUND:         return "NotFoundFailure";
        case ErrorKind::PLATFORM:          return "PlatformFailure";
        case ErrorKind::PROVIDER:          return "ProviderFailure";
        case ErrorKind::UNKNOWN_OPERATION: return "UnknownOperationFailure";
    }
    return "";
}

std::string dumpJson(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result Result::ok(const std::string& message, nlohmann::json data) {
    Result result;
    result.success = true;
    result.message = message;
    result.data = data.is_object() ? std::move(data) : nlohmann::json::object();
    return result;
}

Result Result::fail(ErrorKind kind, const std::string& message,
                    const std::vector<std::string>& suggestions, nlohmann::json data) {
    Result result;
    result.success = false;
    result.error = kind;
    result.message = message;
    result.data = data.is_object() ? std::move(data) : nlohmann::json::object();
    for (const auto& hint : suggestions) {
        result.suggest(hint);
    }
    return result;
}

Result& Result::suggest(const std::string& hint) {
    if (!data.contains("suggestions") || !data["suggestions"].is_array()) {
        data["suggestions"] = nlohmann::json::array();
    }
    data["suggestions"].push_back(hint);
    return *this;
}

nlohmann::json Result::toJson() const {
    nlohmann::json out = {
        {"success", success},
        {"message", message},
        {"data", data}
    };
    if (!success && error != ErrorKind::NONE) {
        out["error"] = toString(error);
    }
    return out;
}

Error::Error(ErrorKind kind, const std::string& message,
             std::vector<std::string> suggestions, nlohmann::json data)
    : std::runtime_error(message),
      kind_(kind),
      suggestions_(std::move(suggestions)),
      data_(std::move(data)) {}

Result Error::toResult() const {
    return Result::fail(kind_, what(), suggestions_, data_);
}

} // namespace dp
