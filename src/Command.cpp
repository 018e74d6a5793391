/**
 * Command.cpp - Typed parameter reading shared by the commands
 */

#include "dp/Command.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace dp {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // anonymous namespace

ParamReader::ParamReader(const json& params, std::string operation)
    : params_(params), operation_(std::move(operation)) {}

std::string ParamReader::text(const std::string& key, bool mandatory, const std::string& fallback) {
    std::string value;
    if (params_.is_object() && params_.contains(key)) {
        const json& v = params_[key];
        if (v.is_string()) {
            value = trim(v.get<std::string>());
        } else if (v.is_number_integer()) {
            value = std::to_string(v.get<long>());
        } else if (!v.is_null()) {
            invalid_.push_back(key + " must be text");
            return fallback;
        }
    }

    if (value.empty()) {
        if (mandatory) {
            missing_.push_back(key);
        }
        return fallback;
    }
    return value;
}

std::optional<long> ParamReader::integer(const std::string& key, bool mandatory) {
    if (!params_.is_object() || !params_.contains(key) || params_[key].is_null()) {
        if (mandatory) missing_.push_back(key);
        return std::nullopt;
    }

    const json& v = params_[key];
    if (v.is_number_integer()) {
        return v.get<long>();
    }
    if (v.is_string()) {
        std::string digits = trim(v.get<std::string>());
        if (!digits.empty() && digits[0] == '#') digits.erase(0, 1);
        if (!digits.empty() && digits.size() <= 12 &&
            std::all_of(digits.begin(), digits.end(), ::isdigit)) {
            return std::stol(digits);
        }
    }

    invalid_.push_back(key + " must be a whole number");
    return std::nullopt;
}

std::vector<std::string> ParamReader::list(const std::string& key) {
    std::vector<std::string> items;
    if (!params_.is_object() || !params_.contains(key)) {
        return items;
    }

    const json& v = params_[key];
    if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_string() && !trim(item.get<std::string>()).empty()) {
                items.push_back(trim(item.get<std::string>()));
            }
        }
    } else if (v.is_string()) {
        std::istringstream iss(v.get<std::string>());
        std::string item;
        while (std::getline(iss, item, ',')) {
            item = trim(item);
            if (!item.empty()) items.push_back(item);
        }
    } else if (!v.is_null()) {
        invalid_.push_back(key + " must be a list");
    }
    return items;
}

void ParamReader::requireOneOf(const std::string& label, bool satisfied) {
    if (!satisfied) {
        missing_.push_back(label);
    }
}

void ParamReader::finish() const {
    if (missing_.empty() && invalid_.empty()) {
        return;
    }

    std::string message;
    if (!missing_.empty()) {
        message = "Missing required parameters for " + operation_ + ": " + joinNames(missing_);
    }
    if (!invalid_.empty()) {
        if (!message.empty()) message += "; ";
        message += "Invalid parameters for " + operation_ + ": " + joinNames(invalid_);
    }

    json data = {{"operation", operation_}};
    if (!missing_.empty()) data["missing"] = missing_;
    if (!invalid_.empty()) data["invalid"] = invalid_;

    throw Error(ErrorKind::VALIDATION, message,
                {"rephrase the command with the missing details, e.g. dp --help for examples"},
                data);
}

} // namespace dp
