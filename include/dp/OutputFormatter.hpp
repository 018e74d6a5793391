/**
 * OutputFormatter.hpp - Result Envelope as json, text or table
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "dp/Result.hpp"

namespace dp {

enum class OutputFormat {
    JSON,
    TEXT,
    TABLE
};

// "json", "text", "table"; false for anything else
bool parseOutputFormat(const std::string& name, OutputFormat& out);

class OutputFormatter {
public:
    // color adds ANSI escapes to text and table output
    explicit OutputFormatter(bool color = false);

    std::string render(const Result& result, OutputFormat format) const;

    // Strings bare, scalar lists comma-joined, anything else as compact JSON
    static std::string formatValue(const nlohmann::json& value);

private:
    bool color_;

    std::string renderText(const Result& result) const;
    std::string renderTable(const Result& result) const;
    std::string paint(const std::string& code, const std::string& text) const;
};

} // namespace dp
