/**
 * ContentCommands.cpp - create-post, edit-node, delete-node, upload-media
 */

#include "dp/commands/ContentCommands.hpp"
#include "dp/AiClient.hpp"
#include "dp/Config.hpp"
#include "dp/ContentComposer.hpp"
#include "dp/DrupalClient.hpp"
#include "dp/Log.hpp"
#include "dp/ParameterExtractor.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace dp {

namespace {

const std::vector<std::string> IMAGE_EXTENSIONS = {".png", ".jpg", ".jpeg", ".gif", ".webp"};

const size_t MAX_TITLE_LENGTH = 255;

std::string expandHome(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string contentTypeProblem(const std::string& content_type) {
    if (isMachineName(content_type)) {
        return "";
    }
    return "content type '" + content_type + "' is not a machine name (e.g. article, page)";
}

} // anonymous namespace

bool isMachineName(const std::string& name) {
    if (name.empty() || name.size() > 32) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

// --- create-post ------------------------------------------------------------

CreatePostParams CreatePostParams::fromJson(const json& params) {
    ParamReader reader(params, "create-post");
    CreatePostParams p;
    p.title = reader.text("title", false);
    p.topic = reader.text("topic", false);
    p.body = reader.text("body", false);
    p.content_type = reader.text("content_type", false, "article");
    p.ai_provider = reader.text("ai_provider", false);
    p.tags = reader.list("tags");
    reader.requireOneOf("title or topic", !p.title.empty() || !p.topic.empty());
    reader.finish();

    std::transform(p.content_type.begin(), p.content_type.end(), p.content_type.begin(), ::tolower);
    std::transform(p.ai_provider.begin(), p.ai_provider.end(), p.ai_provider.begin(), ::tolower);
    return p;
}

CreatePostCommand::CreatePostCommand(CreatePostParams params, CommandContext& context)
    : params_(std::move(params)), context_(context) {}

std::vector<std::string> CreatePostCommand::problems() const {
    std::vector<std::string> found;

    std::string type_problem = contentTypeProblem(params_.content_type);
    if (!type_problem.empty()) {
        found.push_back(type_problem);
    }

    std::string title = params_.title.empty() ? topicToTitle(params_.topic) : params_.title;
    if (title.size() > MAX_TITLE_LENGTH) {
        found.push_back("title is longer than 255 characters");
    }

    if (!params_.ai_provider.empty() && !AiClient::isKnownProvider(params_.ai_provider)) {
        found.push_back("unknown AI provider '" + params_.ai_provider +
                        "' (use openai, anthropic, gemini or ollama)");
    }
    return found;
}

std::string CreatePostCommand::chooseProvider() const {
    if (!params_.ai_provider.empty()) return params_.ai_provider;
    if (!context_.ai_provider_override.empty()) return context_.ai_provider_override;
    return context_.config.default_ai_provider;
}

Result CreatePostCommand::execute() {
    std::string title = params_.title.empty() ? topicToTitle(params_.topic) : params_.title;
    std::string topic = params_.topic.empty() ? params_.title : params_.topic;
    std::string body = params_.body;
    std::vector<std::string> tags = params_.tags;
    std::string generated_by;

    if (body.empty()) {
        std::string provider_name = chooseProvider();
        std::string error;
        std::unique_ptr<AiProvider> ai;
        if (context_.ai_factory) {
            ai = context_.ai_factory(provider_name, error);
        }
        if (!ai) {
            throw Error(ErrorKind::PROVIDER,
                        "No AI provider available to write the post: " +
                            (error.empty() ? std::string("none configured") : error),
                        {"set DEFAULT_AI_PROVIDER in .env (openai, anthropic, gemini or ollama)",
                         "or pass --ai-provider <name>",
                         "or give the body directly: create post titled 'X' with body 'Y'"},
                        {{"title", title}});
        }

        ContentComposer composer(*ai);
        AiResponse composed = composer.composeBody(topic, params_.content_type);
        if (!composed.success) {
            std::vector<std::string> hints;
            if (composed.error_kind == AiError::UNAUTHORIZED) {
                hints.push_back("check the API key: dp --auth " + ai->name());
            } else if (composed.error_kind == AiError::TIMEOUT) {
                hints.push_back("raise AI_TIMEOUT or try a smaller model");
            } else {
                hints.push_back("check that " + ai->name() + " is reachable: dp check");
            }
            throw Error(ErrorKind::PROVIDER,
                        ai->name() + " could not generate the post (" + toString(composed.error_kind) + ")",
                        hints, {{"provider", ai->name()}, {"detail", composed.error}});
        }

        body = composed.content;
        generated_by = ai->name();
        if (tags.empty()) {
            tags = composer.suggestTags(body);
        }
    } else {
        body = toHtmlParagraphs(body);
    }

    NodeRef node = context_.backend.createNode(params_.content_type, title, body, tags);

    json data = {
        {"node_id", node.node_id},
        {"uuid", node.uuid},
        {"url", node.url},
        {"title", title},
        {"content_type", params_.content_type},
        {"tags", tags}
    };
    if (!generated_by.empty()) {
        data["ai_provider"] = generated_by;
    }

    return Result::ok("Created " + params_.content_type + " '" + title + "' (node " +
                          std::to_string(node.node_id) + ")",
                      data);
}

// --- edit-node --------------------------------------------------------------

EditNodeParams EditNodeParams::fromJson(const json& params) {
    ParamReader reader(params, "edit-node");
    EditNodeParams p;
    auto id = reader.integer("node_id", true);
    p.title = reader.text("title", false);
    p.body = reader.text("body", false);
    p.content_type = reader.text("content_type", false, "article");
    reader.requireOneOf("title or body", !p.title.empty() || !p.body.empty());
    reader.finish();

    p.node_id = *id;
    std::transform(p.content_type.begin(), p.content_type.end(), p.content_type.begin(), ::tolower);
    return p;
}

EditNodeCommand::EditNodeCommand(EditNodeParams params, CommandContext& context)
    : params_(std::move(params)), context_(context) {}

std::vector<std::string> EditNodeCommand::problems() const {
    std::vector<std::string> found;
    if (params_.node_id <= 0) {
        found.push_back("node id must be positive");
    }
    std::string type_problem = contentTypeProblem(params_.content_type);
    if (!type_problem.empty()) {
        found.push_back(type_problem);
    }
    if (params_.title.size() > MAX_TITLE_LENGTH) {
        found.push_back("title is longer than 255 characters");
    }
    return found;
}

Result EditNodeCommand::execute() {
    json attributes = json::object();
    json changed = json::array();

    if (!params_.title.empty()) {
        attributes["title"] = params_.title;
        changed.push_back("title");
    }
    if (!params_.body.empty()) {
        attributes["body"] = {{"value", toHtmlParagraphs(params_.body)}, {"format", "full_html"}};
        changed.push_back("body");
    }

    NodeRef node = context_.backend.updateNode(params_.content_type, params_.node_id, attributes);

    return Result::ok("Updated node " + std::to_string(params_.node_id),
                      {{"node_id", params_.node_id},
                       {"uuid", node.uuid},
                       {"url", node.url},
                       {"title", node.title},
                       {"content_type", params_.content_type},
                       {"updated", changed}});
}

// --- delete-node ------------------------------------------------------------

DeleteNodeParams DeleteNodeParams::fromJson(const json& params) {
    ParamReader reader(params, "delete-node");
    DeleteNodeParams p;
    auto id = reader.integer("node_id", true);
    p.content_type = reader.text("content_type", false, "article");
    reader.finish();

    p.node_id = *id;
    std::transform(p.content_type.begin(), p.content_type.end(), p.content_type.begin(), ::tolower);
    return p;
}

DeleteNodeCommand::DeleteNodeCommand(DeleteNodeParams params, CommandContext& context)
    : params_(std::move(params)), context_(context) {}

std::vector<std::string> DeleteNodeCommand::problems() const {
    std::vector<std::string> found;
    if (params_.node_id <= 0) {
        found.push_back("node id must be positive");
    }
    std::string type_problem = contentTypeProblem(params_.content_type);
    if (!type_problem.empty()) {
        found.push_back(type_problem);
    }
    return found;
}

Result DeleteNodeCommand::execute() {
    NodeRef node = context_.backend.deleteNode(params_.content_type, params_.node_id);

    return Result::ok("Deleted node " + std::to_string(params_.node_id),
                      {{"node_id", params_.node_id},
                       {"uuid", node.uuid},
                       {"title", node.title},
                       {"content_type", params_.content_type}});
}

// --- upload-media -----------------------------------------------------------

UploadMediaParams UploadMediaParams::fromJson(const json& params) {
    ParamReader reader(params, "upload-media");
    UploadMediaParams p;
    p.file_path = expandHome(reader.text("file_path", true));
    p.alt_text = reader.text("alt_text", false);
    p.title = reader.text("title", false);
    reader.finish();
    return p;
}

UploadMediaCommand::UploadMediaCommand(UploadMediaParams params, CommandContext& context)
    : params_(std::move(params)), context_(context) {}

std::vector<std::string> UploadMediaCommand::problems() const {
    std::vector<std::string> found;

    std::string ext = fs::path(params_.file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    if (std::find(IMAGE_EXTENSIONS.begin(), IMAGE_EXTENSIONS.end(), ext) == IMAGE_EXTENSIONS.end()) {
        found.push_back("only image files can be uploaded (png, jpg, jpeg, gif, webp)");
    }
    return found;
}

Result UploadMediaCommand::execute() {
    std::error_code ec;
    if (!fs::is_regular_file(params_.file_path, ec)) {
        throw Error(ErrorKind::NOT_FOUND, "File not found: " + params_.file_path,
                    {"check the path; relative paths start from " + fs::current_path(ec).string()},
                    {{"file_path", params_.file_path}});
    }

    std::string filename = fs::path(params_.file_path).filename().string();
    std::string title = params_.title.empty() ? filenameToTitle(params_.file_path) : params_.title;
    std::string alt = params_.alt_text.empty() ? filename : params_.alt_text;

    MediaRef media = context_.backend.uploadMedia(params_.file_path, alt, title);

    return Result::ok("Uploaded " + filename + " as media " + std::to_string(media.media_id),
                      {{"media_id", media.media_id},
                       {"uuid", media.uuid},
                       {"filename", media.filename.empty() ? filename : media.filename},
                       {"title", title},
                       {"alt_text", alt}});
}

} // namespace dp
