#pragma once

#include <penv/config.hpp>
#include <penv/result.hpp>
#include <filesystem>
#include <string>

namespace penv {

// Downloads one URL to a local file
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual Status fetch(const std::string& url, const std::filesystem::path& dest) = 0;
};

// libcurl based fetcher. Transient failures (DNS, connect, timeouts,
// HTTP 5xx/429) are retried with exponential backoff; a 404 or
// running out of retries is reported as an error. Supports file:// URLs.
class CurlFetcher : public Fetcher {
public:
    explicit CurlFetcher(NetworkConfig config) : config_(config) {}

    Status fetch(const std::string& url, const std::filesystem::path& dest) override;

private:
    NetworkConfig config_;
};

} // namespace penv
