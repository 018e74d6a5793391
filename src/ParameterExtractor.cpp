/**
 * ParameterExtractor.cpp - Turn matched text spans into typed parameters
 */

#include "dp/ParameterExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace dp {

namespace {

const std::string TRIM_CHARS = " \t\r\n\"'`.,;:!?()[]{}<>";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

std::string trim(const std::string& s, const std::string& chars = " \t\r\n") {
    size_t start = s.find_first_not_of(chars);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(chars);
    return s.substr(start, end - start + 1);
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

} // anonymous namespace

struct ParameterExtractor::Impl {
    // Leading words that introduce a subject rather than belong to it
    std::vector<std::string> subject_prefixes = {
        "about ", "on the topic of ", "regarding ", "on "
    };

    // Trailing clauses naming the tool to use, e.g. "... using openai"
    std::regex provider_suffix{R"(\s+(?:using|with|via)\s+\S+\s*$)", std::regex::icase};

    std::string stripWrappingQuotes(const std::string& text) {
        if (text.size() >= 2) {
            char first = text.front();
            char last = text.back();
            if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
                return text.substr(1, text.size() - 2);
            }
        }
        return text;
    }

    // Same quote scan the shell tokenizer used: first opening quote to its partner
    std::optional<std::string> firstQuoted(const std::string& span) {
        for (size_t i = 0; i < span.size(); ++i) {
            char c = span[i];
            if (c != '"' && c != '\'') {
                continue;
            }
            // An apostrophe inside a word ("don't") is not an opening quote
            if (c == '\'' && i > 0 && std::isalnum(static_cast<unsigned char>(span[i - 1]))) {
                continue;
            }
            size_t close = span.find(c, i + 1);
            if (close == std::string::npos) {
                return std::nullopt;
            }
            return span.substr(i + 1, close - i - 1);
        }
        return std::nullopt;
    }
};

ParameterExtractor::ParameterExtractor() : impl_(std::make_unique<Impl>()) {}

ParameterExtractor::~ParameterExtractor() = default;

Extraction ParameterExtractor::extract(const std::string& text,
                                       const std::vector<std::string>& captures,
                                       const std::vector<ParamRole>& roles) const {
    Extraction result;

    for (const auto& role : roles) {
        std::string span;
        if (role.group > 0 && static_cast<size_t>(role.group) < captures.size()) {
            span = captures[role.group];
        }

        nlohmann::json value;

        switch (role.kind) {
            case RoleKind::IDENTIFIER: {
                std::string id = extractIdentifier(span);
                if (!id.empty()) value = id;
                break;
            }
            case RoleKind::INTEGER: {
                auto number = extractInteger(span);
                if (number) value = *number;
                break;
            }
            case RoleKind::QUOTED_TEXT: {
                std::string quoted = extractQuoted(span);
                if (!quoted.empty()) value = quoted;
                break;
            }
            case RoleKind::FREE_TEXT: {
                std::string free = extractFreeText(span);
                if (!free.empty()) value = free;
                break;
            }
            case RoleKind::ENUMERATED: {
                if (role.group == 0) {
                    auto word = findVocabularyWord(text, role.vocabulary);
                    if (word) value = *word;
                } else {
                    std::string matched = matchVocabulary(span, role.vocabulary);
                    if (!matched.empty()) value = matched;
                }
                break;
            }
            case RoleKind::PATH: {
                std::string path = impl_->stripWrappingQuotes(trim(span));
                if (!path.empty()) value = path;
                break;
            }
            case RoleKind::RAW: {
                std::string raw = trim(span);
                if (!raw.empty()) value = raw;
                break;
            }
            case RoleKind::LIST: {
                auto items = splitList(extractQuoted(span));
                if (!items.empty()) value = items;
                break;
            }
        }

        if (value.is_string()) {
            size_t length = value.get_ref<const std::string&>().size();
            if (length < role.min_length || (role.max_length > 0 && length > role.max_length)) {
                value = nullptr;
            }
        }

        if (value.is_null() && !role.fallback.is_null()) {
            value = role.fallback;
        }

        if (!value.is_null()) {
            result.parameters[role.name] = value;
        } else if (role.mandatory) {
            result.missing.push_back(role.name);
        }
    }

    return result;
}

std::string ParameterExtractor::extractIdentifier(const std::string& span) const {
    return trim(span, TRIM_CHARS);
}

std::optional<long> ParameterExtractor::extractInteger(const std::string& span) const {
    std::string digits = trim(span, TRIM_CHARS + "#");
    if (digits.empty() || digits.size() > 12) {
        return std::nullopt;
    }
    if (!std::all_of(digits.begin(), digits.end(), ::isdigit)) {
        return std::nullopt;
    }
    return std::stol(digits);
}

std::string ParameterExtractor::extractQuoted(const std::string& span) const {
    auto quoted = impl_->firstQuoted(span);
    if (quoted) {
        return cleanText(*quoted);
    }
    return cleanText(span);
}

std::string ParameterExtractor::extractFreeText(const std::string& span) const {
    std::string text = trim(span);

    std::string lower = toLower(text);
    for (const auto& prefix : impl_->subject_prefixes) {
        if (lower.rfind(prefix, 0) == 0) {
            text = text.substr(prefix.size());
            break;
        }
    }

    text = std::regex_replace(text, impl_->provider_suffix, "");

    // Remove trailing punctuation
    while (!text.empty() && (text.back() == '?' || text.back() == '.' || text.back() == '!')) {
        text.pop_back();
    }

    return cleanText(text);
}

std::string ParameterExtractor::matchVocabulary(const std::string& span,
                                                const std::vector<std::string>& vocabulary) const {
    std::string word = extractIdentifier(span);
    std::string lower = toLower(word);
    for (const auto& entry : vocabulary) {
        if (toLower(entry) == lower) {
            return entry;
        }
    }
    if (lower.size() > 1 && lower.back() == 's') {
        std::string singular = lower.substr(0, lower.size() - 1);
        for (const auto& entry : vocabulary) {
            if (toLower(entry) == singular) {
                return entry;
            }
        }
    }
    return word;
}

std::optional<std::string> ParameterExtractor::findVocabularyWord(
        const std::string& text, const std::vector<std::string>& vocabulary) const {
    std::string lower = toLower(text);
    size_t best_pos = std::string::npos;
    std::optional<std::string> best;

    for (const auto& entry : vocabulary) {
        std::string needle = toLower(entry);
        size_t pos = lower.find(needle);
        while (pos != std::string::npos) {
            bool starts = pos == 0 || !isWordChar(lower[pos - 1]);
            size_t after = pos + needle.size();
            // Tolerate a plural: "pages" matches "page"
            if (after < lower.size() && lower[after] == 's') {
                ++after;
            }
            bool ends = after >= lower.size() || !isWordChar(lower[after]);
            if (!ends) {
                after = pos + needle.size();
                ends = after >= lower.size() || !isWordChar(lower[after]);
            }
            if (starts && ends) {
                break;
            }
            pos = lower.find(needle, pos + 1);
        }
        if (pos != std::string::npos && pos < best_pos) {
            best_pos = pos;
            best = entry;
        }
    }

    return best;
}

std::vector<std::string> ParameterExtractor::splitList(const std::string& span) const {
    std::vector<std::string> items;
    std::string current;

    auto flush = [&]() {
        std::string item = trim(current, TRIM_CHARS);
        if (!item.empty()) {
            items.push_back(cleanText(item));
        }
        current.clear();
    };

    for (char c : span) {
        if (c == ',' || c == ';' || c == '|') {
            flush();
        } else {
            current += c;
        }
    }
    flush();

    return items;
}

std::string cleanText(const std::string& text) {
    // Collapse runs of whitespace
    std::istringstream iss(text);
    std::string word;
    std::string out;
    while (iss >> word) {
        if (!out.empty()) out += " ";
        out += word;
    }

    if (out.size() >= 2) {
        char first = out.front();
        char last = out.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            out = out.substr(1, out.size() - 2);
        }
    }

    return trim(out);
}

std::string topicToTitle(const std::string& topic) {
    std::istringstream iss(cleanText(topic));
    std::string word;
    std::string title;
    while (iss >> word) {
        std::string lower = toLower(word);
        lower[0] = static_cast<char>(::toupper(lower[0]));
        if (!title.empty()) title += " ";
        title += lower;
    }
    return title;
}

std::string filenameToTitle(const std::string& path) {
    std::string name = path;
    size_t slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    size_t dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        name = name.substr(0, dot);
    }
    std::replace(name.begin(), name.end(), '_', ' ');
    std::replace(name.begin(), name.end(), '-', ' ');
    return topicToTitle(name);
}

std::string cleanProjectName(const std::string& name) {
    std::string lower = toLower(cleanText(name));

    std::string out;
    for (char c : lower) {
        bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-';
        char next = keep ? c : '-';
        if (next == '-' && !out.empty() && out.back() == '-') {
            continue;
        }
        out += next;
    }

    return trim(out, "-");
}

std::string toHtmlParagraphs(const std::string& text) {
    static const std::regex tag(R"(<[^>]+>)");
    if (std::regex_search(text, tag)) {
        return text;
    }

    std::string html;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t blank = text.find("\n\n", pos);
        std::string paragraph = cleanText(text.substr(pos, blank == std::string::npos
                                                              ? std::string::npos
                                                              : blank - pos));
        if (!paragraph.empty()) {
            html += "<p>" + paragraph + "</p>";
        }
        if (blank == std::string::npos) {
            break;
        }
        pos = blank + 2;
    }
    return html;
}

int clampLimit(long limit) {
    if (limit < 1) return 1;
    if (limit > 100) return 100;
    return static_cast<int>(limit);
}

} // namespace dp
