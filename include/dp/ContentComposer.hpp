/**
 * ContentComposer.hpp - AI-written node bodies and tag suggestions
 */

#pragma once

#include <string>
#include <vector>

#include "dp/AiClient.hpp"

namespace dp {

class ContentComposer {
public:
    explicit ContentComposer(AiProvider& ai);
    ~ContentComposer();

    // HTML body for a node of content_type about topic; error fields set on failure
    AiResponse composeBody(const std::string& topic, const std::string& content_type);

    // Best effort: an empty list when the provider fails
    std::vector<std::string> suggestTags(const std::string& body, size_t max_tags = 5);

private:
    AiProvider& ai_;

    std::string buildBodyPrompt(const std::string& topic, const std::string& content_type) const;
};

// Drops a ```html fence around a reply and wraps plain text in <p> blocks
std::string stripCodeFence(const std::string& text);

} // namespace dp
