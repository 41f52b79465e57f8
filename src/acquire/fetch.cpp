#include "binwheel/acquire.hpp"
#include "binwheel/platform.hpp"

#include <fstream>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace binwheel {

// ============================================================================
// HTTP Fetching with libcurl
// ============================================================================

namespace {

struct DownloadSink {
    std::ofstream* out;
    std::uint64_t bytes;
};

// Callback for libcurl to write received data straight to disk
size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    size_t total = size * nmemb;
    sink->out->write(ptr, static_cast<std::streamsize>(total));
    if (!*sink->out) {
        return 0;  // Makes curl abort with CURLE_WRITE_ERROR
    }
    sink->bytes += total;
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

FetchResult fetch_failure(FetchResult result, const std::string& dest_path, const std::string& message) {
    remove_file(dest_path);
    result.ok = false;
    result.error = message;
    return result;
}

} // namespace

FetchResult fetch_to_file(const std::string& url, const std::string& dest_path) {
    FetchResult result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        result.error = "failed to open " + dest_path + " for writing";
        return result;
    }

    DownloadSink sink{&out, 0};
    char error_buffer[CURL_ERROR_SIZE] = {0};
    const std::string user_agent = std::string("binwheel/") + BINWHEEL_VERSION;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    // Follow redirects (release assets are served from a CDN)
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    // Connection setup is bounded; the transfer itself is not
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());

    spdlog::debug("GET {}", url);
    CURLcode res = curl_easy_perform(curl.get());

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);
    result.bytes = sink.bytes;

    out.close();

    if (res != CURLE_OK) {
        return fetch_failure(result, dest_path,
                             std::string("download of ") + url + " failed: " +
                                 (error_buffer[0] ? error_buffer : curl_easy_strerror(res)));
    }

    // Non-HTTP schemes report no status
    if (result.http_status != 0 && (result.http_status < 200 || result.http_status >= 300)) {
        return fetch_failure(result, dest_path,
                             "download of " + url + " failed: HTTP " + std::to_string(result.http_status));
    }

    if (!out) {
        return fetch_failure(result, dest_path, "failed to write " + dest_path);
    }

    result.ok = true;
    return result;
}

} // namespace binwheel
