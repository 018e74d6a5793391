/**
 * AiClient.hpp - HTTP clients for the text-generation providers
 */

#pragma once

#include <memory>
#include <string>

namespace dp {

struct Config;

enum class AiError {
    NONE,
    UNAVAILABLE,    // not configured, unreachable or server-side failure
    UNAUTHORIZED,   // key rejected
    TIMEOUT,
    MALFORMED       // reply did not have the expected shape
};

// "unavailable", "unauthorized", ...
std::string toString(AiError error);

struct AiRequest {
    std::string prompt;
    std::string system;
    std::string content_type = "text";  // "json" asks the provider for a JSON object
    int max_tokens = 1500;
};

struct AiResponse {
    std::string content;
    bool success = false;
    AiError error_kind = AiError::NONE;
    std::string error;
};

class AiProvider {
public:
    virtual ~AiProvider() = default;

    virtual std::string name() const = 0;

    // Cheap check before a real request; reason is filled when false
    virtual bool isAvailable(std::string& reason) = 0;

    virtual AiResponse complete(const AiRequest& request) = 0;
};

/**
 * One client per provider: "openai", "anthropic", "gemini" or "ollama".
 * Connection and read timeouts come from Config::ai_timeout.
 */
class AiClient : public AiProvider {
public:
    AiClient(const std::string& provider, const Config& config);
    ~AiClient() override;

    std::string name() const override;
    bool isAvailable(std::string& reason) override;
    AiResponse complete(const AiRequest& request) override;

    static bool isKnownProvider(const std::string& provider);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Null (with error filled) when the name is empty or not a known provider
std::unique_ptr<AiProvider> makeAiProvider(const std::string& provider, const Config& config,
                                           std::string& error);

} // namespace dp
