#pragma once

#include "util/result.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sysupdate {

struct HttpRequest {
    enum class Method { Get, Post };

    Method method = Method::Post;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;  // application/x-www-form-urlencoded
    std::optional<std::pair<std::string, std::string>> basic_auth;
    bool follow_redirects = false;
    long timeout_seconds = 300;

    // When set, the response body is streamed into this file instead of
    // HttpResponse::body.
    std::string output_path;
};

struct HttpResponse {
    long code = 0;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;
    std::string redirect_url;

    const std::string* Header(const std::string& name) const;
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Fails only when no HTTP exchange took place; any status code is a
    // successful transport.
    virtual Result Perform(const HttpRequest& req, HttpResponse& resp) = 0;
};

} // namespace sysupdate
