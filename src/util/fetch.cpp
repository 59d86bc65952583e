#include <penv/fetch.hpp>
#include <penv/log.hpp>

#include <chrono>
#include <cstdio>
#include <thread>

#include <curl/curl.h>

namespace penv {

namespace {

enum class Outcome { Done, Retry, Fatal };

struct Attempt {
    Outcome outcome;
    PenvError error;
};

size_t write_to_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, out) * size;
}

// RAII wrapper for a CURL easy handle
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

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

// Called once before any worker thread creates a handle.
void ensure_curl_init() {
    static CurlGlobalInit init;
}

// Resolve/connect failures, partial transfer, timeout, TLS handshake,
// empty reply, send/recv errors
bool is_transient(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_PARTIAL_FILE:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return true;
        default:
            return false;
    }
}

Attempt try_once(const std::string& url, const std::filesystem::path& dest, int timeout) {
    CurlHandle curl;
    if (!curl) {
        return {Outcome::Fatal, PenvError{PenvError::Network, "failed to initialize libcurl"}};
    }

    std::FILE* out = std::fopen(dest.c_str(), "wb");
    if (!out) {
        return {Outcome::Fatal, PenvError{PenvError::IO,
            "cannot write " + dest.string()}};
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "penv/0.1");

    CURLcode res = curl_easy_perform(curl.get());
    bool write_failed = std::fclose(out) != 0;

    if (res == CURLE_OK) {
        if (write_failed) {
            return {Outcome::Fatal, PenvError{PenvError::IO,
                "cannot write " + dest.string()}};
        }
        return {Outcome::Done, {}};
    }

    std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);

    if (res == CURLE_HTTP_RETURNED_ERROR) {
        long http = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http);
        if (http == 404) {
            return {Outcome::Fatal, PenvError{PenvError::NotFound,
                "no such release asset: " + url}};
        }
        Outcome o = (http >= 500 || http == 429) ? Outcome::Retry : Outcome::Fatal;
        return {o, PenvError{PenvError::Network,
            "GET " + url + " returned HTTP " + std::to_string(http)}};
    }
    if (res == CURLE_FILE_COULDNT_READ_FILE) {
        return {Outcome::Fatal, PenvError{PenvError::NotFound,
            "cannot read " + url + ": " + detail}};
    }
    if (res == CURLE_WRITE_ERROR) {
        return {Outcome::Fatal, PenvError{PenvError::IO,
            "cannot write " + dest.string() + ": " + detail}};
    }

    Outcome o = is_transient(res) ? Outcome::Retry : Outcome::Fatal;
    return {o, PenvError{PenvError::Network, "GET " + url + " failed: " + detail}};
}

} // namespace

Status CurlFetcher::fetch(const std::string& url, const std::filesystem::path& dest) {
    if (config_.offline && url.compare(0, 7, "file://") != 0) {
        return PenvError{PenvError::Network,
            "cannot download " + url + " in offline mode"};
    }

    ensure_curl_init();

    int backoff = config_.backoff_ms;
    for (int attempt = 0;; ++attempt) {
        log::debug("fetch %s (attempt %d)", url.c_str(), attempt + 1);
        Attempt a = try_once(url, dest, config_.timeout_seconds);
        if (a.outcome == Outcome::Done) return ok_status();

        std::error_code ec;
        std::filesystem::remove(dest, ec);

        if (a.outcome == Outcome::Fatal || attempt >= config_.retries) {
            if (attempt > 0) {
                a.error.hint = "gave up after " + std::to_string(attempt + 1) + " attempts";
            }
            return a.error;
        }

        log::warn("%s; retrying in %d ms", a.error.message.c_str(), backoff);
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
        backoff *= 2;
    }
}

} // namespace penv
