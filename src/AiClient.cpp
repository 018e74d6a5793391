/**
 * AiClient.cpp - HTTP clients for the text-generation providers
 *
 * Uses cpp-httplib for every provider. Cloud providers are reached over
 * HTTPS, Ollama over whatever scheme OLLAMA_BASE_URL names.
 */

#include "dp/AiClient.hpp"
#include "dp/Config.hpp"
#include "dp/Log.hpp"
#include "dp/Result.hpp"

#include <algorithm>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace dp {

static const std::string OPENAI_API_BASE = "https://api.openai.com";
static const std::string ANTHROPIC_API_BASE = "https://api.anthropic.com";
static const std::string GEMINI_API_BASE = "https://generativelanguage.googleapis.com";

static const std::string OPENAI_MODEL = "gpt-4o-mini";
static const std::string ANTHROPIC_MODEL = "claude-3-5-haiku-latest";
static const std::string ANTHROPIC_VERSION = "2023-06-01";
static const std::string GEMINI_MODEL = "gemini-2.0-flash";

std::string toString(AiError error) {
    switch (error) {
        case AiError::NONE: return "none";
        case AiError::UNAVAILABLE: return "unavailable";
        case AiError::UNAUTHORIZED: return "unauthorized";
        case AiError::TIMEOUT: return "timeout";
        case AiError::MALFORMED: return "malformed";
    }
    return "unavailable";
}

namespace {

AiResponse failure(AiError kind, const std::string& message) {
    AiResponse response;
    response.success = false;
    response.error_kind = kind;
    response.error = message;
    return response;
}

AiError classifyStatus(int status) {
    if (status == 401 || status == 403) return AiError::UNAUTHORIZED;
    if (status == 408 || status == 504) return AiError::TIMEOUT;
    return AiError::UNAVAILABLE;
}

// Provider error bodies put the message in slightly different places
std::string errorDetail(const std::string& body) {
    try {
        json error_json = json::parse(body);
        if (error_json.contains("error")) {
            const auto& err = error_json["error"];
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                return err["message"].get<std::string>();
            }
            if (err.is_string()) {
                return err.get<std::string>();
            }
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body
    }
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

} // anonymous namespace

struct AiClient::Impl {
    std::string provider;
    std::string api_key;
    std::string base_url;
    std::string model;
    int timeout_seconds;

    // Set after the first successful isAvailable() call
    bool checked = false;
    bool available = false;
    std::string unavailable_reason;

    Impl(const std::string& name, const Config& config)
        : provider(name),
          api_key(config.apiKeyFor(name)),
          timeout_seconds(config.ai_timeout > 0 ? config.ai_timeout : 120) {

        if (provider == "openai") {
            base_url = OPENAI_API_BASE;
            model = OPENAI_MODEL;
        } else if (provider == "anthropic") {
            base_url = ANTHROPIC_API_BASE;
            model = ANTHROPIC_MODEL;
        } else if (provider == "gemini") {
            base_url = GEMINI_API_BASE;
            model = GEMINI_MODEL;
        } else if (provider == "ollama") {
            base_url = config.ollama_base_url;
            model = config.ollama_model;
        }
    }

    std::unique_ptr<httplib::Client> makeClient(int read_timeout) const {
        auto client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(std::min(timeout_seconds, 30));
        client->set_read_timeout(read_timeout);
        client->set_write_timeout(30);
        return client;
    }

    AiResponse post(const std::string& path, const httplib::Headers& headers, const json& body) {
        auto client = makeClient(timeout_seconds);

        log::debug("ai", provider + " POST " + path);
        auto res = client->Post(path, headers, dumpJson(body), "application/json");

        if (!res) {
            auto err = res.error();
            AiError kind = (err == httplib::Error::Read || err == httplib::Error::Write)
                               ? AiError::TIMEOUT
                               : AiError::UNAVAILABLE;
            return failure(kind, "Network error: " + httplib::to_string(err));
        }

        if (res->status != 200) {
            return failure(classifyStatus(res->status),
                           "API error: HTTP " + std::to_string(res->status) + " - " +
                               errorDetail(res->body));
        }

        AiResponse response;
        response.success = true;
        response.content = res->body;
        return response;
    }

    // Pull the generated text out of a provider reply body
    AiResponse unwrap(const AiResponse& raw) {
        if (!raw.success) {
            return raw;
        }

        try {
            json res_json = json::parse(raw.content);
            std::string text;

            if (provider == "openai") {
                text = res_json.at("choices").at(0).at("message").at("content").get<std::string>();
            } else if (provider == "anthropic") {
                for (const auto& block : res_json.at("content")) {
                    if (block.value("type", "") == "text") {
                        text += block.at("text").get<std::string>();
                    }
                }
            } else if (provider == "gemini") {
                text = res_json.at("candidates").at(0).at("content").at("parts").at(0)
                           .at("text").get<std::string>();
            } else {
                text = res_json.at("response").get<std::string>();
            }

            size_t start = text.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) {
                return failure(AiError::MALFORMED, "Empty response from " + provider);
            }
            size_t end = text.find_last_not_of(" \t\r\n");

            AiResponse response;
            response.success = true;
            response.content = text.substr(start, end - start + 1);
            return response;
        } catch (const json::exception& e) {
            return failure(AiError::MALFORMED, std::string("Invalid response structure: ") + e.what());
        }
    }

    AiResponse sendOpenAi(const AiRequest& request) {
        json messages = json::array();
        if (!request.system.empty()) {
            messages.push_back({{"role", "system"}, {"content", request.system}});
        }
        messages.push_back({{"role", "user"}, {"content", request.prompt}});

        json body = {
            {"model", model},
            {"messages", messages},
            {"max_tokens", request.max_tokens}
        };
        if (request.content_type == "json") {
            body["response_format"] = {{"type", "json_object"}};
        }

        httplib::Headers headers = {{"Authorization", "Bearer " + api_key}};
        return unwrap(post("/v1/chat/completions", headers, body));
    }

    AiResponse sendAnthropic(const AiRequest& request) {
        json body = {
            {"model", model},
            {"max_tokens", request.max_tokens},
            {"messages", {{{"role", "user"}, {"content", request.prompt}}}}
        };
        if (!request.system.empty()) {
            body["system"] = request.system;
        }

        httplib::Headers headers = {
            {"x-api-key", api_key},
            {"anthropic-version", ANTHROPIC_VERSION}
        };
        return unwrap(post("/v1/messages", headers, body));
    }

    AiResponse sendGemini(const AiRequest& request) {
        json body = {
            {"contents", {{{"role", "user"}, {"parts", {{{"text", request.prompt}}}}}}},
            {"generationConfig", {{"maxOutputTokens", request.max_tokens}}}
        };
        if (!request.system.empty()) {
            body["systemInstruction"] = {{"parts", {{{"text", request.system}}}}};
        }
        if (request.content_type == "json") {
            body["generationConfig"]["responseMimeType"] = "application/json";
        }

        std::string path = "/v1beta/models/" + model + ":generateContent?key=" + api_key;
        return unwrap(post(path, {}, body));
    }

    AiResponse sendOllama(const AiRequest& request) {
        std::string prompt = request.system.empty()
                                 ? request.prompt
                                 : request.system + "\n\n" + request.prompt;
        json body = {
            {"model", model},
            {"prompt", prompt},
            {"stream", false},
            {"options", {
                {"temperature", 0.7},
                {"top_k", 40},
                {"top_p", 0.9},
                {"num_predict", request.max_tokens}
            }}
        };
        if (request.content_type == "json") {
            body["format"] = "json";
        }

        return unwrap(post("/api/generate", {}, body));
    }

    bool probeOllama(std::string& reason) {
        auto client = makeClient(5);
        auto res = client->Get("/api/tags");
        if (!res) {
            reason = "cannot connect to Ollama at " + base_url + " (" + httplib::to_string(res.error()) + ")";
            return false;
        }
        if (res->status != 200) {
            reason = "Ollama server answered HTTP " + std::to_string(res->status);
            return false;
        }

        try {
            json tags = json::parse(res->body);
            bool found = false;
            for (const auto& entry : tags.value("models", json::array())) {
                if (entry.value("name", "") == model) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                log::warn("ai", "Ollama model " + model + " not found; pull it with: ollama pull " + model);
            }
        } catch (const json::exception& e) {
            log::debug("ai", std::string("unreadable Ollama tag list: ") + e.what());
        }
        return true;
    }
};

AiClient::AiClient(const std::string& provider, const Config& config)
    : impl_(std::make_unique<Impl>(provider, config)) {}

AiClient::~AiClient() = default;

std::string AiClient::name() const {
    return impl_->provider;
}

bool AiClient::isKnownProvider(const std::string& provider) {
    return provider == "openai" || provider == "anthropic" ||
           provider == "gemini" || provider == "ollama";
}

bool AiClient::isAvailable(std::string& reason) {
    if (impl_->checked) {
        reason = impl_->unavailable_reason;
        return impl_->available;
    }

    if (!isKnownProvider(impl_->provider)) {
        impl_->unavailable_reason = "unknown AI provider '" + impl_->provider + "'";
    } else if (impl_->provider == "ollama") {
        impl_->available = impl_->probeOllama(impl_->unavailable_reason);
    } else if (impl_->api_key.empty()) {
        std::string upper = impl_->provider;
        std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
        impl_->unavailable_reason = "no API key for " + impl_->provider + " (set " + upper +
                                    "_API_KEY or run: dp --auth " + impl_->provider + ")";
    } else {
        impl_->available = true;
    }

    impl_->checked = true;
    reason = impl_->unavailable_reason;
    return impl_->available;
}

AiResponse AiClient::complete(const AiRequest& request) {
    std::string reason;
    if (!isAvailable(reason)) {
        return failure(AiError::UNAVAILABLE, reason);
    }

    if (impl_->provider == "openai") return impl_->sendOpenAi(request);
    if (impl_->provider == "anthropic") return impl_->sendAnthropic(request);
    if (impl_->provider == "gemini") return impl_->sendGemini(request);
    return impl_->sendOllama(request);
}

std::unique_ptr<AiProvider> makeAiProvider(const std::string& provider, const Config& config,
                                           std::string& error) {
    if (provider.empty()) {
        error = "no AI provider configured (set DEFAULT_AI_PROVIDER or pass --ai-provider)";
        return nullptr;
    }
    if (!AiClient::isKnownProvider(provider)) {
        error = "unknown AI provider '" + provider + "' (use openai, anthropic, gemini or ollama)";
        return nullptr;
    }
    return std::make_unique<AiClient>(provider, config);
}

} // namespace dp
