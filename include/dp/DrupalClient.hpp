/**
 * DrupalClient.hpp - Drupal JSON:API and GraphQL over HTTP
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dp {

struct Config;

struct NodeRef {
    long node_id = 0;
    std::string uuid;
    std::string url;
    std::string title;
    std::string content_type;
};

struct MediaRef {
    long media_id = 0;
    std::string uuid;
    std::string file_uuid;
    std::string filename;
};

/**
 * What the content commands need from a Drupal site. Implementations throw
 * dp::Error: NOT_FOUND for a missing node, PROVIDER when the site is
 * unreachable, rejects the credentials or answers with an error.
 */
class ContentBackend {
public:
    virtual ~ContentBackend() = default;

    virtual NodeRef createNode(const std::string& content_type, const std::string& title,
                               const std::string& body_html,
                               const std::vector<std::string>& tags) = 0;

    // attributes is a JSON:API attributes object, e.g. {"title": "..."}
    virtual NodeRef updateNode(const std::string& content_type, long node_id,
                               const nlohmann::json& attributes) = 0;

    virtual NodeRef deleteNode(const std::string& content_type, long node_id) = 0;

    virtual MediaRef uploadMedia(const std::string& file_path, const std::string& alt_text,
                                 const std::string& title) = 0;

    // Returns the "data" member of the GraphQL reply
    virtual nlohmann::json query(const std::string& graphql) = 0;
};

class DrupalClient : public ContentBackend {
public:
    explicit DrupalClient(const Config& config);
    ~DrupalClient() override;

    NodeRef createNode(const std::string& content_type, const std::string& title,
                       const std::string& body_html,
                       const std::vector<std::string>& tags) override;

    NodeRef updateNode(const std::string& content_type, long node_id,
                       const nlohmann::json& attributes) override;

    NodeRef deleteNode(const std::string& content_type, long node_id) override;

    MediaRef uploadMedia(const std::string& file_path, const std::string& alt_text,
                         const std::string& title) override;

    nlohmann::json query(const std::string& graphql) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Percent-encoding for query-string values
std::string urlEncode(const std::string& value);

} // namespace dp
