/**
 * IntentResolver.cpp - Raw text to Intent: rules first, AI second, unresolved last
 */

#include "dp/IntentResolver.hpp"
#include "dp/AiClient.hpp"
#include "dp/Log.hpp"
#include "dp/Result.hpp"

#include <sstream>

namespace dp {

const size_t IntentResolver::MAX_INPUT_LENGTH;

IntentResolver::IntentResolver(const PatternTable& table, AiProvider* fallback)
    : table_(table), fallback_(fallback) {}

IntentResolver::~IntentResolver() = default;

std::string IntentResolver::normalize(const std::string& raw_text) {
    std::istringstream iss(raw_text);
    std::string word;
    std::string out;
    while (iss >> word) {
        if (!out.empty()) out += " ";
        out += word;
    }
    return out;
}

namespace {

Intent unresolvedIntent(const std::string& text) {
    Intent unresolved;
    unresolved.operation = Operation::UNKNOWN;
    unresolved.source = IntentSource::UNRESOLVED;
    unresolved.parameters = {{"raw_command", text}};
    return unresolved;
}

} // anonymous namespace

Intent IntentResolver::resolve(const std::string& raw_text) const {
    std::string text = normalize(raw_text);

    if (text.size() > MAX_INPUT_LENGTH) {
        log::warn("resolver", "input of " + std::to_string(text.size()) + " characters exceeds " +
                              std::to_string(MAX_INPUT_LENGTH));
        Intent too_long = unresolvedIntent(text.substr(0, 80) + "...");
        too_long.parameters["input_length"] = text.size();
        too_long.parameters["max_length"] = MAX_INPUT_LENGTH;
        too_long.raw_text = raw_text;
        return too_long;
    }

    Intent intent;
    try {
        intent = resolveNormalized(text);
    } catch (const std::exception& e) {
        log::error("resolver", std::string("resolution failed: ") + e.what());
        intent = unresolvedIntent(text);
    }
    intent.raw_text = raw_text;
    return intent;
}

Intent IntentResolver::resolveNormalized(const std::string& text) const {
    if (!text.empty()) {
        if (auto intent = matchRules(text)) {
            return *intent;
        }

        if (auto intent = classifyWithAi(text)) {
            return *intent;
        }
    }

    log::info("resolver", "no intent for: " + text);
    return unresolvedIntent(text);
}

std::optional<Intent> IntentResolver::matchRules(const std::string& text) const {
    const auto& rules = table_.rules();

    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];

        std::smatch match;
        if (!std::regex_search(text, match, rule.matcher)) {
            continue;
        }

        std::vector<std::string> captures;
        captures.reserve(match.size());
        for (size_t g = 0; g < match.size(); ++g) {
            captures.push_back(match[g].matched ? match[g].str() : std::string());
        }

        Extraction extraction = extractor_.extract(text, captures, rule.roles);
        if (!extraction.complete()) {
            // Structural match but unusable; a later rule may still fit
            std::string missing;
            for (const auto& name : extraction.missing) {
                missing += (missing.empty() ? "" : ", ") + name;
            }
            log::debug("resolver", "rule " + std::to_string(i) + " (" + toString(rule.operation) +
                                   ") matched but is missing: " + missing);
            continue;
        }

        Intent intent;
        intent.operation = rule.operation;
        intent.source = IntentSource::RULE_MATCHED;
        intent.rule_index = static_cast<int>(i);
        intent.parameters = rule.fixed;
        for (auto it = extraction.parameters.begin(); it != extraction.parameters.end(); ++it) {
            intent.parameters[it.key()] = it.value();
        }

        log::debug("resolver", "rule " + std::to_string(i) + " -> " + toString(rule.operation) +
                               " " + dumpJson(intent.parameters));
        return intent;
    }

    return std::nullopt;
}

std::string IntentResolver::buildClassificationPrompt(const std::string& text) const {
    std::ostringstream prompt;
    prompt << "Classify this Drupal site management command.\n"
           << "Command: \"" << text << "\"\n\n"
           << "Respond with ONLY a JSON object:\n"
           << "{\"operation\": \"<one of the operations below>\", \"parameters\": {...}}\n\n"
           << "Operations:";
    for (Operation op : allOperations()) {
        prompt << " " << toString(op);
    }
    prompt << " unknown\n\n"
           << "Parameter names: topic, title, body, ai_provider, content_type, node_id, "
           << "file_path, alt_text, command, module, count, search_term, tags, role, "
           << "project_name, platform.\n\n"
           << "Examples:\n"
           << "\"Create blog about AI\" -> {\"operation\":\"create-post\",\"parameters\":{\"topic\":\"AI\"}}\n"
           << "\"Clear cache\" -> {\"operation\":\"run-drush\",\"parameters\":{\"command\":\"cache:rebuild\"}}\n"
           << "\"Show latest 5 posts\" -> {\"operation\":\"query-latest\",\"parameters\":{\"count\":5,\"content_type\":\"article\"}}\n"
           << "\"Bring test-blog up\" -> {\"operation\":\"start-site\",\"parameters\":{\"project_name\":\"test-blog\"}}\n\n"
           << "CRITICAL: Return ONLY valid JSON. No markdown, no text before or after.";
    return prompt.str();
}

std::optional<Intent> IntentResolver::classifyWithAi(const std::string& text) const {
    if (!fallback_) {
        return std::nullopt;
    }

    std::string reason;
    if (!fallback_->isAvailable(reason)) {
        log::info("resolver", "AI fallback unavailable: " + reason);
        return std::nullopt;
    }

    AiRequest request;
    request.prompt = buildClassificationPrompt(text);
    request.content_type = "json";
    request.max_tokens = 300;

    AiResponse response = fallback_->complete(request);
    if (!response.success) {
        log::warn("resolver", "AI classification failed (" + toString(response.error_kind) +
                              "): " + response.error);
        return std::nullopt;
    }

    // The model may wrap the object in prose or a fenced block
    std::string content = response.content;
    size_t start = content.find('{');
    size_t end = content.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        log::warn("resolver", "AI classification returned no JSON object");
        return std::nullopt;
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(content.substr(start, end - start + 1));
    } catch (const nlohmann::json::exception& e) {
        log::warn("resolver", std::string("AI classification is not valid JSON: ") + e.what());
        return std::nullopt;
    }

    if (!parsed.is_object()) {
        return std::nullopt;
    }

    std::string name;
    if (parsed.contains("operation") && parsed["operation"].is_string()) {
        name = parsed["operation"].get<std::string>();
    } else if (parsed.contains("intent") && parsed["intent"].is_string()) {
        name = parsed["intent"].get<std::string>();
    }

    Operation op = operationFromString(name);
    if (op == Operation::UNKNOWN) {
        log::info("resolver", "AI could not classify: " + (name.empty() ? "<none>" : name));
        return std::nullopt;
    }

    Intent intent;
    intent.operation = op;
    intent.source = IntentSource::AI_INFERRED;
    for (const char* key : {"parameters", "params"}) {
        if (parsed.contains(key) && parsed[key].is_object()) {
            intent.parameters = parsed[key];
            break;
        }
    }

    log::debug("resolver", "AI -> " + name + " " + dumpJson(intent.parameters));
    return intent;
}

} // namespace dp
