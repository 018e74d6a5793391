/**
 * ParameterExtractor.hpp - Turn matched text spans into typed parameters
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dp {

enum class RoleKind {
    IDENTIFIER,   // site, module or role name: trimmed of quotes and punctuation
    INTEGER,      // node id, count
    QUOTED_TEXT,  // first quoted substring, else the whole span
    FREE_TEXT,    // span with "about" / "using <provider>" keywords stripped
    ENUMERATED,   // case-insensitive vocabulary match, unmatched passes through
    PATH,         // file path, case preserved, wrapping quotes removed
    RAW,          // span verbatim apart from surrounding whitespace
    LIST          // comma / semicolon / pipe separated
};

struct ParamRole {
    std::string name;
    RoleKind kind = RoleKind::IDENTIFIER;
    int group = 1;                         // capture group, 0 scans the whole input
    bool mandatory = true;
    nlohmann::json fallback;               // used when the role is missing; null = none
    std::vector<std::string> vocabulary;   // ENUMERATED only
    size_t min_length = 0;                 // text values outside these bounds count as missing
    size_t max_length = 0;                 // 0 = unbounded
};

struct Extraction {
    nlohmann::json parameters = nlohmann::json::object();
    std::vector<std::string> missing;      // mandatory roles with no usable value

    bool complete() const { return missing.empty(); }
};

class ParameterExtractor {
public:
    ParameterExtractor();
    ~ParameterExtractor();

    // captures[0] is the whole match; an empty string means the group did not participate
    Extraction extract(const std::string& text,
                       const std::vector<std::string>& captures,
                       const std::vector<ParamRole>& roles) const;

    std::string extractIdentifier(const std::string& span) const;
    std::optional<long> extractInteger(const std::string& span) const;
    std::string extractQuoted(const std::string& span) const;
    std::string extractFreeText(const std::string& span) const;
    std::string matchVocabulary(const std::string& span,
                                const std::vector<std::string>& vocabulary) const;
    std::optional<std::string> findVocabularyWord(const std::string& text,
                                                  const std::vector<std::string>& vocabulary) const;
    std::vector<std::string> splitList(const std::string& span) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Normalizers shared by the commands

std::string cleanText(const std::string& text);
std::string topicToTitle(const std::string& topic);
std::string filenameToTitle(const std::string& path);
std::string cleanProjectName(const std::string& name);
std::string toHtmlParagraphs(const std::string& text);
int clampLimit(long limit);

} // namespace dp
