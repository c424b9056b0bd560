#pragma once

#include <string>
#include <vector>
#include <utility>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "sheetdrop/const/rest_enums.hpp"

namespace sheetdrop {
namespace http {

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpRequest method = HttpRequest::GET;
    std::string target;                                    // Request target as sent (may carry a query)
    std::string path;                                      // Percent-encoded path without query string
    std::unordered_map<std::string, std::string> query;    // Query parameters (?key=value)
    std::unordered_map<std::string, std::string> headers;  // Header names lowercased
    std::string rawBody;

    std::string getHeader(const std::string& key, const std::string& defaultValue = "") const {
        auto it = headers.find(key);
        return it != headers.end() ? it->second : defaultValue;
    }

    bool hasHeader(const std::string& key) const {
        return headers.find(key) != headers.end();
    }

    std::string getQuery(const std::string& key, const std::string& defaultValue = "") const {
        auto it = query.find(key);
        return it != query.end() ? it->second : defaultValue;
    }
};

/**
 * HTTP Response object
 *
 * Extra headers are emitted in insertion order after Content-Type and
 * Content-Length. The CORS origin header is added by the server, never here.
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    Response& withHeader(const std::string& name, const std::string& value) {
        headers.emplace_back(name, value);
        return *this;
    }

    // Invalid UTF-8 (e.g. analyzer output in a legacy codepage) is replaced, not thrown
    static Response json(int status, const nlohmann::json& payload) {
        return {status, "application/json",
                payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), {}};
    }

    static Response ok(const nlohmann::json& payload) {
        return json(200, payload);
    }

    static Response noContent() {
        return {204, "", "", {}};
    }

    static Response failure(int status, const std::string& message) {
        return json(status, {{"success", false}, {"message", message}});
    }

    static Response badRequest(const std::string& message) {
        return failure(400, message);
    }

    static Response notFound(const std::string& message = "Not found") {
        return failure(404, message);
    }

    static Response notImplemented(const std::string& message) {
        return failure(501, message);
    }

    static Response error(const std::string& message) {
        return failure(500, message);
    }
};

} // namespace http
} // namespace sheetdrop
