/**
 * OutputFormatter.cpp - Result Envelope as json, text or table
 */

#include "dp/OutputFormatter.hpp"

#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace dp {

namespace {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string GREEN = "\033[32m";
const std::string RED = "\033[31m";
const std::string YELLOW = "\033[33m";

const int KEY_WIDTH = 20;

bool isScalar(const json& value) {
    return value.is_string() || value.is_number() || value.is_boolean() || value.is_null();
}

} // anonymous namespace

bool parseOutputFormat(const std::string& name, OutputFormat& out) {
    if (name == "json") { out = OutputFormat::JSON; return true; }
    if (name == "text") { out = OutputFormat::TEXT; return true; }
    if (name == "table") { out = OutputFormat::TABLE; return true; }
    return false;
}

OutputFormatter::OutputFormatter(bool color) : color_(color) {}

std::string OutputFormatter::paint(const std::string& code, const std::string& text) const {
    return color_ ? code + text + RESET : text;
}

std::string OutputFormatter::formatValue(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    if (value.is_array()) {
        bool scalars = true;
        for (const auto& item : value) {
            if (!isScalar(item)) {
                scalars = false;
                break;
            }
        }
        if (scalars) {
            std::string joined;
            for (const auto& item : value) {
                if (!joined.empty()) joined += ", ";
                joined += formatValue(item);
            }
            return joined;
        }
    }
    return dumpJson(value);
}

std::string OutputFormatter::render(const Result& result, OutputFormat format) const {
    switch (format) {
        case OutputFormat::TEXT: return renderText(result);
        case OutputFormat::TABLE: return renderTable(result);
        case OutputFormat::JSON: break;
    }
    return dumpJson(result.toJson(), 2);
}

std::string OutputFormatter::renderText(const Result& result) const {
    std::ostringstream out;

    if (result.success) {
        out << paint(GREEN, "✔") << " " << result.message << "\n";
    } else {
        out << paint(RED, "✘") << " " << result.message;
        if (result.error != ErrorKind::NONE) {
            out << " " << paint(RED, "[" + toString(result.error) + "]");
        }
        out << "\n";
    }

    for (auto it = result.data.begin(); it != result.data.end(); ++it) {
        if (it.key() == "suggestions") continue;
        out << "   " << it.key() << ": " << formatValue(it.value()) << "\n";
    }

    if (result.data.contains("suggestions") && result.data["suggestions"].is_array()) {
        out << paint(YELLOW, "Suggestions:") << "\n";
        for (const auto& hint : result.data["suggestions"]) {
            out << "   - " << formatValue(hint) << "\n";
        }
    }

    std::string text = out.str();
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

std::string OutputFormatter::renderTable(const Result& result) const {
    std::ostringstream out;

    std::string status = result.success ? paint(GREEN, "SUCCESS") : paint(RED, "FAILED");
    out << std::left << std::setw(KEY_WIDTH) << "Status" << ": " << status << "\n";
    out << std::left << std::setw(KEY_WIDTH) << "Message" << ": " << result.message << "\n";
    if (!result.success && result.error != ErrorKind::NONE) {
        out << std::left << std::setw(KEY_WIDTH) << "Error" << ": " << toString(result.error) << "\n";
    }
    out << std::string(50, '-') << "\n";

    for (auto it = result.data.begin(); it != result.data.end(); ++it) {
        out << std::left << std::setw(KEY_WIDTH) << it.key() << ": " << formatValue(it.value()) << "\n";
    }

    std::string table = out.str();
    table.pop_back();
    return table;
}

} // namespace dp
