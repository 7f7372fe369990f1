#include "model/HttpArtifactFetcher.h"
#include "common/Logger.h"

#include <fstream>
#include <stdexcept>

namespace stockcast {
namespace model {

HttpArtifactFetcher::HttpArtifactFetcher(const std::string& base_url,
                                         long timeout_seconds,
                                         long connect_timeout_seconds)
    : curl_(nullptr)
    , base_url_(base_url)
    , timeout_seconds_(timeout_seconds)
    , connect_timeout_seconds_(connect_timeout_seconds)
{
    if (!base_url_.empty() && base_url_.back() != '/') {
        base_url_ += '/';
    }

    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpArtifactFetcher::~HttpArtifactFetcher() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

void HttpArtifactFetcher::fetch(const std::string& file_name, const std::filesystem::path& destination) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string url = urlFor(file_name);

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open " + destination.string() + " for writing");
    }

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    LOG_INFO("Fetching artifact {}", url);
    CURLcode res = curl_easy_perform(curl_);
    out.close();

    if (res != CURLE_OK) {
        throw std::runtime_error("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw std::runtime_error("HTTP " + std::to_string(http_code) + " for " + url);
    }
    if (!out) {
        throw std::runtime_error("write failed for " + destination.string());
    }
}

std::string HttpArtifactFetcher::urlFor(const std::string& file_name) const {
    // '/' 는 경로 구분자로 남기고 각 구간만 percent-encode
    std::string url = base_url_;
    size_t start = 0;
    while (true) {
        const size_t slash = file_name.find('/', start);
        const std::string segment = file_name.substr(start, slash == std::string::npos ? std::string::npos : slash - start);

        char* escaped = curl_easy_escape(curl_, segment.c_str(), static_cast<int>(segment.size()));
        if (!escaped) {
            throw std::runtime_error("cannot URL-encode artifact name " + file_name);
        }
        url += escaped;
        curl_free(escaped);

        if (slash == std::string::npos) break;
        url += '/';
        start = slash + 1;
    }
    return url;
}

size_t HttpArtifactFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* out = static_cast<std::ofstream*>(userp);
    out->write(static_cast<const char*>(contents), static_cast<std::streamsize>(total_size));
    // total_size와 다른 값을 돌려주면 curl이 전송을 중단한다
    return out->good() ? total_size : 0;
}

} // namespace model
} // namespace stockcast
