/**
 * ContentComposer.cpp - AI-written node bodies and tag suggestions
 */

#include "dp/ContentComposer.hpp"
#include "dp/Log.hpp"
#include "dp/ParameterExtractor.hpp"

#include <regex>
#include <sstream>

namespace dp {

ContentComposer::ContentComposer(AiProvider& ai)
    : ai_(ai) {}

ContentComposer::~ContentComposer() = default;

std::string ContentComposer::buildBodyPrompt(const std::string& topic,
                                             const std::string& content_type) const {
    std::ostringstream prompt;

    if (content_type == "page") {
        prompt << "Write the body of a static page for a Drupal website.\n\n"
               << "Subject: " << topic << "\n\n"
               << "Keep it factual and evergreen. Two to four short sections, each under an <h2>.\n";
    } else {
        prompt << "Write a blog article for a Drupal website.\n\n"
               << "Topic: " << topic << "\n\n"
               << "Provide:\n"
               << "1. A one-paragraph introduction\n"
               << "2. Two or three sections with <h2> headings\n"
               << "3. A short conclusion\n\n"
               << "Aim for 300 to 500 words.\n";
    }

    prompt << "Use simple HTML tags only (<p>, <h2>, <ul>, <li>, <strong>). "
           << "Do not repeat the title. No markdown, no code fences, no text before or after the HTML.";
    return prompt.str();
}

AiResponse ContentComposer::composeBody(const std::string& topic, const std::string& content_type) {
    AiRequest request;
    request.system = "You create " + content_type + " content for Drupal websites. "
                     "Keep responses concise and well-formatted.";
    request.prompt = buildBodyPrompt(topic, content_type);
    request.max_tokens = 1500;

    log::info("composer", "generating " + content_type + " about: " + topic + " via " + ai_.name());
    AiResponse response = ai_.complete(request);
    if (!response.success) {
        return response;
    }

    response.content = stripCodeFence(response.content);
    if (response.content.empty()) {
        response.success = false;
        response.error_kind = AiError::MALFORMED;
        response.error = ai_.name() + " returned an empty body";
    }
    return response;
}

std::vector<std::string> ContentComposer::suggestTags(const std::string& body, size_t max_tags) {
    std::vector<std::string> tags;

    static const std::regex markup(R"(<[^>]+>)");
    std::string plain = cleanText(std::regex_replace(body, markup, " "));
    if (plain.size() > 500) {
        plain = plain.substr(0, 500) + "...";
    }

    AiRequest request;
    request.system = "Return only a comma-separated list of tags.";
    request.prompt = "Suggest " + std::to_string(max_tags) + " short taxonomy tags for this content: " + plain;
    request.max_tokens = 100;

    AiResponse response = ai_.complete(request);
    if (!response.success) {
        log::warn("composer", "tag suggestion failed (" + toString(response.error_kind) + "): " +
                              response.error);
        return tags;
    }

    std::istringstream iss(response.content);
    std::string item;
    while (std::getline(iss, item, ',') && tags.size() < max_tags) {
        item = cleanText(item);
        while (!item.empty() && (item.front() == '#' || item.front() == '-')) {
            item.erase(0, 1);
        }
        item = cleanText(item);
        // Anything this long is a sentence, not a tag
        if (!item.empty() && item.size() <= 40) {
            tags.push_back(item);
        }
    }

    return tags;
}

std::string stripCodeFence(const std::string& text) {
    std::string content = cleanText(text).empty() ? "" : text;

    size_t fence = content.find("```");
    if (fence != std::string::npos) {
        size_t body_start = content.find('\n', fence);
        size_t closing = content.rfind("```");
        if (body_start != std::string::npos && closing > body_start) {
            content = content.substr(body_start + 1, closing - body_start - 1);
        }
    }

    size_t start = content.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = content.find_last_not_of(" \t\r\n");
    return toHtmlParagraphs(content.substr(start, end - start + 1));
}

} // namespace dp
