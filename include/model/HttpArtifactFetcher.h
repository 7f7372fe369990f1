#pragma once

#include <curl/curl.h>
#include <mutex>
#include <string>

#include "model/IArtifactFetcher.h"

namespace stockcast {
namespace model {

// GET <base_url><file_name>, redirects followed, HTTP 200 required.
class HttpArtifactFetcher : public IArtifactFetcher {
public:
    HttpArtifactFetcher(const std::string& base_url, long timeout_seconds, long connect_timeout_seconds);
    ~HttpArtifactFetcher();

    HttpArtifactFetcher(const HttpArtifactFetcher&) = delete;
    HttpArtifactFetcher& operator=(const HttpArtifactFetcher&) = delete;

    void fetch(const std::string& file_name, const std::filesystem::path& destination) override;

    const std::string& baseUrl() const { return base_url_; }

    // base_url + file_name, each path segment percent-encoded.
    std::string urlFor(const std::string& file_name) const;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    CURL* curl_;
    std::string base_url_;
    long timeout_seconds_;
    long connect_timeout_seconds_;
    std::mutex mutex_;
};

} // namespace model
} // namespace stockcast
