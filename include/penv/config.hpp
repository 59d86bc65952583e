#pragma once

#include <penv/log.hpp>
#include <penv/result.hpp>
#include <filesystem>
#include <string>

namespace penv {

struct NetworkConfig {
    int retries = 3;
    int backoff_ms = 500;
    int timeout_seconds = 300;
    bool offline = false;
};

// Layered configuration: built-in defaults < <home>/config.toml < CLI flags.
// A layer only overrides the fields it explicitly sets.
struct Config {
    std::string repository = "https://github.com/penumbra-zone/penumbra";
    std::string download_base;  // empty: derived from repository
    std::string platform;       // empty: host_platform()
    NetworkConfig network;
    log::Level log_level = log::Info;

    bool repository_set = false;
    bool download_base_set = false;
    bool platform_set = false;
    bool retries_set = false;
    bool backoff_ms_set = false;
    bool timeout_seconds_set = false;
    bool offline_set = false;
    bool log_level_set = false;

    static Result<Config> parse(const std::string& toml_str);

    // A missing file yields the defaults
    static Result<Config> load(const std::filesystem::path& path);

    void merge(const Config& other);

    std::string effective_download_base() const;
    std::string effective_platform() const;
};

// Target triple this binary was built for, e.g. x86_64-unknown-linux-gnu
std::string host_platform();

} // namespace penv
