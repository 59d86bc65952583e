#include <penv/config.hpp>
#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace penv {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PenvError{PenvError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    if (auto v = doc["repository"].value<std::string>()) {
        cfg.repository = *v;
        cfg.repository_set = true;
    }
    if (auto v = doc["download_base"].value<std::string>()) {
        cfg.download_base = *v;
        cfg.download_base_set = true;
    }
    if (auto v = doc["platform"].value<std::string>()) {
        cfg.platform = *v;
        cfg.platform_set = true;
    }

    if (auto net = doc["network"].as_table()) {
        if (auto v = (*net)["retries"].value<int64_t>()) {
            if (*v < 0 || *v > 20) {
                return PenvError{PenvError::Config,
                    "network.retries must be between 0 and 20"};
            }
            cfg.network.retries = static_cast<int>(*v);
            cfg.retries_set = true;
        }
        if (auto v = (*net)["backoff_ms"].value<int64_t>()) {
            if (*v < 0) {
                return PenvError{PenvError::Config, "network.backoff_ms must not be negative"};
            }
            cfg.network.backoff_ms = static_cast<int>(*v);
            cfg.backoff_ms_set = true;
        }
        if (auto v = (*net)["timeout_seconds"].value<int64_t>()) {
            if (*v <= 0) {
                return PenvError{PenvError::Config, "network.timeout_seconds must be positive"};
            }
            cfg.network.timeout_seconds = static_cast<int>(*v);
            cfg.timeout_seconds_set = true;
        }
        if (auto v = (*net)["offline"].value<bool>()) {
            cfg.network.offline = *v;
            cfg.offline_set = true;
        }
    }

    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<Config>::ok(Config{});
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return PenvError{PenvError::IO, "cannot open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path.string();
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.repository_set) {
        repository = other.repository;
        repository_set = true;
    }
    if (other.download_base_set) {
        download_base = other.download_base;
        download_base_set = true;
    }
    if (other.platform_set) {
        platform = other.platform;
        platform_set = true;
    }
    if (other.retries_set) {
        network.retries = other.network.retries;
        retries_set = true;
    }
    if (other.backoff_ms_set) {
        network.backoff_ms = other.network.backoff_ms;
        backoff_ms_set = true;
    }
    if (other.timeout_seconds_set) {
        network.timeout_seconds = other.network.timeout_seconds;
        timeout_seconds_set = true;
    }
    if (other.offline_set) {
        network.offline = other.network.offline;
        offline_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

std::string Config::effective_download_base() const {
    if (!download_base.empty()) return download_base;
    std::string base = repository;
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (base.size() > 4 && base.compare(base.size() - 4, 4, ".git") == 0) {
        base.resize(base.size() - 4);
    }
    return base + "/releases/download";
}

std::string Config::effective_platform() const {
    return platform.empty() ? host_platform() : platform;
}

std::string host_platform() {
#if defined(__x86_64__) && defined(__linux__)
    return "x86_64-unknown-linux-gnu";
#elif defined(__aarch64__) && defined(__linux__)
    return "aarch64-unknown-linux-gnu";
#elif defined(__x86_64__) && defined(__APPLE__)
    return "x86_64-apple-darwin";
#elif defined(__aarch64__) && defined(__APPLE__)
    return "aarch64-apple-darwin";
#else
    return "unknown";
#endif
}

} // namespace penv
