#pragma once

#include "gateway/http_transport.hpp"

namespace sysupdate {

class CurlTransport final : public IHttpTransport {
public:
    // curl_global_init/cleanup are the caller's job (see main.cpp).
    CurlTransport() = default;

    Result Perform(const HttpRequest& req, HttpResponse& resp) override;
};

} // namespace sysupdate
