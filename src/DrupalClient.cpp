/**
 * DrupalClient.cpp - Drupal JSON:API and GraphQL over HTTP
 *
 * Logs in once per process through /user/login?_format=json and reuses the
 * session cookie and CSRF token for every later request. When the login is
 * refused the client falls back to HTTP basic auth.
 */

#include "dp/DrupalClient.hpp"
#include "dp/Config.hpp"
#include "dp/Log.hpp"
#include "dp/Result.hpp"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>

#include <httplib.h>

using json = nlohmann::json;

namespace dp {

static const std::string JSONAPI_TYPE = "application/vnd.api+json";

std::string urlEncode(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

namespace {

std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string excerpt(const std::string& body) {
    return body.size() > 300 ? body.substr(0, 300) + "..." : body;
}

// JSON:API puts messages under errors[].detail or errors[].title
std::string jsonApiError(const std::string& body) {
    try {
        json parsed = json::parse(body);
        if (parsed.contains("errors") && parsed["errors"].is_array() && !parsed["errors"].empty()) {
            const auto& first = parsed["errors"][0];
            if (first.contains("detail") && first["detail"].is_string()) {
                return first["detail"].get<std::string>();
            }
            if (first.contains("title") && first["title"].is_string()) {
                return first["title"].get<std::string>();
            }
        }
        if (parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Plain text or HTML error page
    }
    return excerpt(body);
}

} // anonymous namespace

struct DrupalClient::Impl {
    std::string base_url;
    std::string username;
    std::string password;
    std::string graphql_path;
    std::unique_ptr<httplib::Client> client;

    bool logged_in = false;
    bool login_attempted = false;
    std::string cookie;
    std::string csrf_token;

    explicit Impl(const Config& config)
        : base_url(config.drupal_base_url),
          username(config.drupal_username),
          password(config.drupal_password),
          graphql_path(config.graphql_endpoint) {

        while (!base_url.empty() && base_url.back() == '/') {
            base_url.pop_back();
        }
        if (graphql_path.empty() || graphql_path[0] != '/') {
            graphql_path = "/" + graphql_path;
        }

        client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(10);
        client->set_read_timeout(30);
        client->set_write_timeout(30);
    }

    [[noreturn]] void unreachable(const std::string& what, httplib::Error err) {
        throw Error(ErrorKind::PROVIDER,
                    "Drupal site unreachable during " + what + ": " + httplib::to_string(err),
                    {"check DRUPAL_BASE_URL (currently " + base_url + ")",
                     "make sure the site is running, e.g. \"start site <name>\""});
    }

    [[noreturn]] void rejected(const std::string& what, const httplib::Response& res) {
        std::vector<std::string> hints;
        if (res.status == 401 || res.status == 403) {
            hints.push_back("check DRUPAL_USERNAME / DRUPAL_PASSWORD and the user's permissions");
        }
        if (res.status == 404 || res.status == 405) {
            hints.push_back("enable the JSON:API module (drush pm:enable jsonapi) and allow write operations");
        }
        throw Error(ErrorKind::PROVIDER,
                    what + " failed: HTTP " + std::to_string(res.status) + " - " + jsonApiError(res.body),
                    hints, {{"http_status", res.status}});
    }

    void login() {
        if (login_attempted) {
            return;
        }
        login_attempted = true;

        json credentials = {{"name", username}, {"pass", password}};
        auto res = client->Post("/user/login?_format=json", dumpJson(credentials), "application/json");
        if (!res) {
            unreachable("login", res.error());
        }

        if (res->status != 200) {
            log::warn("drupal", "login refused (HTTP " + std::to_string(res->status) +
                                "), falling back to basic auth");
            client->set_basic_auth(username, password);
            return;
        }

        size_t count = res->get_header_value_count("Set-Cookie");
        for (size_t i = 0; i < count; ++i) {
            std::string header = res->get_header_value("Set-Cookie", i);
            std::string pair = header.substr(0, header.find(';'));
            if (!cookie.empty()) cookie += "; ";
            cookie += pair;
        }

        try {
            json body = json::parse(res->body);
            csrf_token = body.value("csrf_token", "");
        } catch (const json::exception& e) {
            log::debug("drupal", std::string("login reply is not JSON: ") + e.what());
        }

        logged_in = true;
        log::info("drupal", "authenticated as " + username);
    }

    httplib::Headers headers(bool unsafe) {
        login();
        httplib::Headers h = {{"Accept", JSONAPI_TYPE}};
        if (!cookie.empty()) {
            h.emplace("Cookie", cookie);
        }
        if (unsafe && !csrf_token.empty()) {
            h.emplace("X-CSRF-Token", csrf_token);
        }
        return h;
    }

    json parseBody(const std::string& what, const std::string& body) {
        try {
            return json::parse(body);
        } catch (const json::exception& e) {
            throw Error(ErrorKind::PROVIDER, what + " returned an unreadable reply",
                        {"rerun with --verbose to see the raw response"},
                        {{"detail", e.what()}});
        }
    }

    NodeRef toNodeRef(const json& resource, const std::string& content_type) {
        NodeRef ref;
        ref.content_type = content_type;
        ref.uuid = resource.value("id", "");
        const json& attributes = resource.contains("attributes") ? resource["attributes"] : json::object();
        if (attributes.contains("drupal_internal__nid") && attributes["drupal_internal__nid"].is_number()) {
            ref.node_id = attributes["drupal_internal__nid"].get<long>();
        }
        ref.title = attributes.value("title", "");
        ref.url = base_url + "/node/" + std::to_string(ref.node_id);
        return ref;
    }

    // Internal node id -> resource; JSON:API addresses nodes by UUID only
    NodeRef findNode(const std::string& content_type, long node_id) {
        std::string path = "/jsonapi/node/" + content_type + "?" +
                           urlEncode("filter[drupal_internal__nid]") + "=" + std::to_string(node_id);

        auto res = client->Get(path, headers(false));
        if (!res) {
            unreachable("node lookup", res.error());
        }
        if (res->status == 404) {
            throw Error(ErrorKind::NOT_FOUND,
                        "No " + content_type + " content type on this site",
                        {"check the content type name, e.g. article or page"});
        }
        if (res->status != 200) {
            rejected("Node lookup", *res);
        }

        json body = parseBody("Node lookup", res->body);
        if (!body.contains("data") || !body["data"].is_array() || body["data"].empty()) {
            throw Error(ErrorKind::NOT_FOUND,
                        "Node " + std::to_string(node_id) + " not found",
                        {"check the node id; query-latest lists recent nodes",
                         "if the node is not an " + content_type + ", name its type"},
                        {{"node_id", node_id}, {"content_type", content_type}});
        }
        return toNodeRef(body["data"][0], content_type);
    }

    // Term UUIDs for tag names, creating terms that do not exist yet
    json tagRelationships(const std::vector<std::string>& tags) {
        json data = json::array();
        for (const auto& tag : tags) {
            try {
                std::string path = "/jsonapi/taxonomy_term/tags?" + urlEncode("filter[name]") + "=" + urlEncode(tag);
                auto res = client->Get(path, headers(false));
                if (res && res->status == 200) {
                    json found = json::parse(res->body);
                    if (found.contains("data") && found["data"].is_array() && !found["data"].empty()) {
                        data.push_back({{"type", "taxonomy_term--tags"}, {"id", found["data"][0]["id"]}});
                        continue;
                    }
                }

                json term = {{"data", {{"type", "taxonomy_term--tags"}, {"attributes", {{"name", tag}}}}}};
                auto created = client->Post("/jsonapi/taxonomy_term/tags", headers(true), dumpJson(term), JSONAPI_TYPE);
                if (created && created->status == 201) {
                    json body = json::parse(created->body);
                    data.push_back({{"type", "taxonomy_term--tags"}, {"id", body["data"]["id"]}});
                } else {
                    log::warn("drupal", "could not create tag '" + tag + "'");
                }
            } catch (const json::exception& e) {
                log::warn("drupal", "skipping tag '" + tag + "': " + e.what());
            }
        }
        return data;
    }
};

DrupalClient::DrupalClient(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

DrupalClient::~DrupalClient() = default;

NodeRef DrupalClient::createNode(const std::string& content_type, const std::string& title,
                                 const std::string& body_html,
                                 const std::vector<std::string>& tags) {
    json node = {
        {"data", {
            {"type", "node--" + content_type},
            {"attributes", {
                {"title", title},
                {"body", {{"value", body_html}, {"format", "full_html"}}},
                {"status", true}
            }}
        }}
    };

    if (!tags.empty()) {
        json related = impl_->tagRelationships(tags);
        if (!related.empty()) {
            node["data"]["relationships"] = {{"field_tags", {{"data", related}}}};
        }
    }

    auto res = impl_->client->Post("/jsonapi/node/" + content_type, impl_->headers(true),
                                   dumpJson(node), JSONAPI_TYPE);
    if (!res) {
        impl_->unreachable("node creation", res.error());
    }
    if (res->status != 201) {
        impl_->rejected("Node creation", *res);
    }

    json body = impl_->parseBody("Node creation", res->body);
    NodeRef ref = impl_->toNodeRef(body.value("data", json::object()), content_type);
    log::info("drupal", "created node " + std::to_string(ref.node_id));
    return ref;
}

NodeRef DrupalClient::updateNode(const std::string& content_type, long node_id,
                                 const json& attributes) {
    NodeRef existing = impl_->findNode(content_type, node_id);

    json patch = {
        {"data", {
            {"type", "node--" + content_type},
            {"id", existing.uuid},
            {"attributes", attributes}
        }}
    };

    auto res = impl_->client->Patch("/jsonapi/node/" + content_type + "/" + existing.uuid,
                                    impl_->headers(true), dumpJson(patch), JSONAPI_TYPE);
    if (!res) {
        impl_->unreachable("node update", res.error());
    }
    if (res->status != 200) {
        impl_->rejected("Node update", *res);
    }

    json body = impl_->parseBody("Node update", res->body);
    return impl_->toNodeRef(body.value("data", json::object()), content_type);
}

NodeRef DrupalClient::deleteNode(const std::string& content_type, long node_id) {
    NodeRef existing = impl_->findNode(content_type, node_id);

    auto res = impl_->client->Delete("/jsonapi/node/" + content_type + "/" + existing.uuid,
                                     impl_->headers(true));
    if (!res) {
        impl_->unreachable("node deletion", res.error());
    }
    if (res->status != 204 && res->status != 200) {
        impl_->rejected("Node deletion", *res);
    }

    log::info("drupal", "deleted node " + std::to_string(node_id));
    return existing;
}

MediaRef DrupalClient::uploadMedia(const std::string& file_path, const std::string& alt_text,
                                   const std::string& title) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.good()) {
        throw Error(ErrorKind::NOT_FOUND, "File not found: " + file_path,
                    {"check the path; relative paths start from the current directory"},
                    {{"file_path", file_path}});
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    MediaRef media;
    media.filename = baseName(file_path);

    // 1. Binary upload to the media image field
    httplib::Headers upload_headers = impl_->headers(true);
    upload_headers.emplace("Content-Disposition", "file; filename=\"" + media.filename + "\"");

    auto uploaded = impl_->client->Post("/jsonapi/media/image/field_media_image", upload_headers,
                                        content, "application/octet-stream");
    if (!uploaded) {
        impl_->unreachable("file upload", uploaded.error());
    }
    if (uploaded->status != 201 && uploaded->status != 200) {
        impl_->rejected("File upload", *uploaded);
    }
    json file_body = impl_->parseBody("File upload", uploaded->body);
    media.file_uuid = file_body.value("data", json::object()).value("id", "");

    // 2. Media entity pointing at the uploaded file
    json entity = {
        {"data", {
            {"type", "media--image"},
            {"attributes", {{"name", title}, {"status", true}}},
            {"relationships", {
                {"field_media_image", {
                    {"data", {
                        {"type", "file--file"},
                        {"id", media.file_uuid},
                        {"meta", {{"alt", alt_text}, {"title", title}}}
                    }}
                }}
            }}
        }}
    };

    auto res = impl_->client->Post("/jsonapi/media/image", impl_->headers(true),
                                   dumpJson(entity), JSONAPI_TYPE);
    if (!res) {
        impl_->unreachable("media creation", res.error());
    }
    if (res->status != 201) {
        impl_->rejected("Media creation", *res);
    }

    json body = impl_->parseBody("Media creation", res->body);
    const json data = body.value("data", json::object());
    media.uuid = data.value("id", "");
    const json attributes = data.value("attributes", json::object());
    if (attributes.contains("drupal_internal__mid") && attributes["drupal_internal__mid"].is_number()) {
        media.media_id = attributes["drupal_internal__mid"].get<long>();
    }

    log::info("drupal", "uploaded " + media.filename + " as media " + std::to_string(media.media_id));
    return media;
}

json DrupalClient::query(const std::string& graphql) {
    json payload = {{"query", graphql}, {"variables", json::object()}};

    httplib::Headers headers = impl_->headers(true);
    auto res = impl_->client->Post(impl_->graphql_path, headers, dumpJson(payload), "application/json");
    if (!res) {
        impl_->unreachable("GraphQL query", res.error());
    }
    if (res->status == 404) {
        throw Error(ErrorKind::PROVIDER, "GraphQL endpoint not found at " + impl_->graphql_path,
                    {"enable the graphql module or set GRAPHQL_ENDPOINT"});
    }
    if (res->status != 200) {
        impl_->rejected("GraphQL query", *res);
    }

    json body = impl_->parseBody("GraphQL query", res->body);

    if (body.contains("errors") && body["errors"].is_array() && !body["errors"].empty()) {
        std::string message = body["errors"][0].value("message", "unknown error");
        throw Error(ErrorKind::PROVIDER, "GraphQL error: " + message,
                    {"check that the schema exposes the queried fields"},
                    {{"errors", body["errors"]}});
    }

    return body.value("data", json::object());
}

} // namespace dp
