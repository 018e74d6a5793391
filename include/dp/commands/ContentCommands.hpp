/**
 * ContentCommands.hpp - create-post, edit-node, delete-node, upload-media
 */

#pragma once

#include <string>
#include <vector>

#include "dp/Command.hpp"

namespace dp {

struct CreatePostParams {
    std::string title;
    std::string topic;
    std::string body;
    std::string content_type = "article";
    std::string ai_provider;
    std::vector<std::string> tags;

    static CreatePostParams fromJson(const nlohmann::json& params);
};

class CreatePostCommand : public Command {
public:
    CreatePostCommand(CreatePostParams params, CommandContext& context);

    std::string name() const override { return "create-post"; }
    std::vector<std::string> problems() const override;
    Result execute() override;

    const CreatePostParams& params() const { return params_; }

private:
    CreatePostParams params_;
    CommandContext& context_;

    std::string chooseProvider() const;
};

struct EditNodeParams {
    long node_id = 0;
    std::string title;
    std::string body;
    std::string content_type = "article";

    static EditNodeParams fromJson(const nlohmann::json& params);
};

class EditNodeCommand : public Command {
public:
    EditNodeCommand(EditNodeParams params, CommandContext& context);

    std::string name() const override { return "edit-node"; }
    std::vector<std::string> problems() const override;
    Result execute() override;

private:
    EditNodeParams params_;
    CommandContext& context_;
};

struct DeleteNodeParams {
    long node_id = 0;
    std::string content_type = "article";

    static DeleteNodeParams fromJson(const nlohmann::json& params);
};

class DeleteNodeCommand : public Command {
public:
    DeleteNodeCommand(DeleteNodeParams params, CommandContext& context);

    std::string name() const override { return "delete-node"; }
    std::vector<std::string> problems() const override;
    Result execute() override;

private:
    DeleteNodeParams params_;
    CommandContext& context_;
};

struct UploadMediaParams {
    std::string file_path;
    std::string alt_text;
    std::string title;

    static UploadMediaParams fromJson(const nlohmann::json& params);
};

class UploadMediaCommand : public Command {
public:
    UploadMediaCommand(UploadMediaParams params, CommandContext& context);

    std::string name() const override { return "upload-media"; }
    std::vector<std::string> problems() const override;
    Result execute() override;

private:
    UploadMediaParams params_;
    CommandContext& context_;
};

// Lowercase machine name: letters, digits, underscores
bool isMachineName(const std::string& name);

} // namespace dp
