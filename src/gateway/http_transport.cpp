#include "gateway/http_transport.hpp"

#include "util/path_utils.hpp"

namespace sysupdate {

const std::string* HttpResponse::Header(const std::string& name) const {
    auto it = headers.find(ToLower(name));
    if (it == headers.end()) return nullptr;
    return &it->second;
}

} // namespace sysupdate
