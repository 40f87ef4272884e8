#include "gateway/curl_transport.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <memory>

namespace sysupdate {

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const {
        if (l) curl_slist_free_all(l);
    }
};

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};

size_t WriteToString(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    try {
        out->append(static_cast<char*>(contents), total);
    } catch (const std::exception& e) {
        LogError("Error appending response data: %s", e.what());
        return 0;
    }
    return total;
}

size_t WriteToFile(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<std::FILE*>(userp)) * size;
}

size_t CollectHeader(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);

    std::string line(buffer, total);
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        // Status line of a new response: drop headers of the previous one.
        if (line.rfind("HTTP/", 0) == 0) headers->clear();
        return total;
    }

    std::string name = ToLower(line.substr(0, colon));
    std::string value = line.substr(colon + 1);
    const auto first = value.find_first_not_of(" \t");
    const auto last = value.find_last_not_of(" \t\r\n");
    value = (first == std::string::npos) ? std::string() : value.substr(first, last - first + 1);
    (*headers)[std::move(name)] = std::move(value);
    return total;
}

} // namespace

Result CurlTransport::Perform(const HttpRequest& req, HttpResponse& resp) {
    resp = HttpResponse{};

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(ErrorCode::Transport, "Failed to initialize libcurl");

    std::unique_ptr<std::FILE, FileCloser> file;
    if (!req.output_path.empty()) {
        file.reset(std::fopen(req.output_path.c_str(), "wb"));
        if (!file) {
            return Result::Fail(ErrorCode::Io, "Cannot open for writing: " + req.output_path);
        }
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteToFile);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file.get());
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, CollectHeader);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &resp.headers);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, req.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, req.timeout_seconds);

    if (req.method == HttpRequest::Method::Post) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [name, value] : req.headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) return Result::Fail(ErrorCode::Transport, "curl_slist_append failed");
        (void)header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    std::string userpwd;
    if (req.basic_auth) {
        userpwd = req.basic_auth->first + ":" + req.basic_auth->second;
        curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl.get(), CURLOPT_USERPWD, userpwd.c_str());
    }

    LogDebug("HTTP %s %s",
             req.method == HttpRequest::Method::Post ? "POST" : "GET",
             req.url.c_str());

    const CURLcode rc = curl_easy_perform(curl.get());
    file.reset();
    if (rc != CURLE_OK) {
        return Result::Fail(ErrorCode::Transport,
                            "Request to " + req.url + " failed: " + curl_easy_strerror(rc));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.code);

    char* redirect = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_REDIRECT_URL, &redirect) == CURLE_OK && redirect) {
        resp.redirect_url = redirect;
    }

    return Result::Ok();
}

} // namespace sysupdate
