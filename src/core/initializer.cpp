#include <penv/initializer.hpp>
#include <penv/log.hpp>
#include <penv/process.hpp>

#include <cctype>
#include <sstream>

namespace penv {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static bool is_word(const std::string& w) {
    if (w.empty()) return false;
    for (char c : w) {
        if (!std::isalnum(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result<std::string> parse_seed_phrase(const std::string& pcli_output) {
    const std::string banner = "YOUR PRIVATE SEED PHRASE (SpendKey):";
    auto pos = pcli_output.find(banner);
    if (pos == std::string::npos) {
        return PenvError{PenvError::InitFailed, "pcli did not print a seed phrase"};
    }

    std::istringstream rest(pcli_output.substr(pos + banner.size()));
    std::string line;
    while (std::getline(rest, line)) {
        line = trim(line);
        if (line.empty()) continue;

        std::istringstream words(line);
        std::vector<std::string> parts;
        std::string w;
        while (words >> w) {
            if (!is_word(w)) {
                return PenvError{PenvError::InitFailed, "malformed seed phrase in pcli output"};
            }
            parts.push_back(w);
        }
        if (parts.size() != 12 && parts.size() != 24) {
            return PenvError{PenvError::InitFailed,
                "expected a 12 or 24 word seed phrase, pcli printed " +
                std::to_string(parts.size()) + " words"};
        }
        return Result<std::string>::ok(line);
    }
    return PenvError{PenvError::InitFailed, "pcli did not print a seed phrase"};
}

Result<std::string> parse_address(const std::string& pcli_output) {
    std::istringstream in(pcli_output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.compare(0, 9, "penumbra1") == 0) {
            return Result<std::string>::ok(line);
        }
    }
    return PenvError{PenvError::InitFailed, "pcli did not print a penumbra1 address"};
}

Result<std::string> EnvironmentInitializer::run(const Environment& env,
                                                const BinaryPaths& executables, Binary b,
                                                std::vector<std::string> args,
                                                const std::optional<std::string>& input) {
    const char* name = binary_name(b);
    auto exe = executables.find(b);
    if (exe == executables.end()) {
        return PenvError{PenvError::InitFailed,
            std::string("no ") + name + " executable for environment '" + env.alias + "'"};
    }
    args.insert(args.begin(), exe->second.string());
    log::debug("running %s", describe_command(args).c_str());

    auto r = run_command(args, "", timeout_seconds_, input);
    if (r.is_err()) {
        auto err = std::move(r).error();
        err.code = PenvError::InitFailed;
        return err.context(std::string("initializing ") + name);
    }
    if (!r.value().success()) {
        return PenvError{PenvError::InitFailed,
            std::string(name) + " exited with status " + std::to_string(r.value().exit_code) +
            " while initializing environment '" + env.alias + "': " +
            trim(r.value().stderr_str)};
    }
    return Result<std::string>::ok(std::move(r.value().stdout_str));
}

Status EnvironmentInitializer::initialize(const Environment& env,
                                          const BinaryPaths& executables) {
    log::info("initializing pcli for '%s'", env.alias.c_str());
    auto pcli = run(env, executables, Binary::Pcli,
                    {"--home", env.pcli_home().string(), "init",
                     "--grpc-url", env.grpc_url, "soft-kms", "generate"});
    if (pcli.is_err()) return std::move(pcli).error();
    auto seed = parse_seed_phrase(pcli.value());
    if (seed.is_err()) return std::move(seed).error();

    log::info("initializing pclientd for '%s'", env.alias.c_str());
    auto pclientd = run(env, executables, Binary::Pclientd,
                        {"--home", env.pclientd_home().string(), "init",
                         "--grpc-url", env.grpc_url},
                        seed.value());
    if (pclientd.is_err()) return std::move(pclientd).error();

    if (!env.include_node) return ok_status();

    auto view = run(env, executables, Binary::Pcli,
                    {"--home", env.pcli_home().string(), "view", "address", "0"});
    if (view.is_err()) return std::move(view).error();
    auto address = parse_address(view.value());
    if (address.is_err()) return std::move(address).error();

    std::vector<std::string> pd_args = {"network", "--network-dir", env.network_dir().string()};
    if (env.generate_network) {
        log::info("generating a local network for '%s'", env.alias.c_str());
        pd_args.insert(pd_args.end(), {"generate", "--external-addresses", kExternalAddress,
                                       "--allocation-address", address.value()});
    } else {
        log::info("joining %s for '%s'", env.pd_join_url.c_str(), env.alias.c_str());
        pd_args.insert(pd_args.end(), {"join", "--moniker", env.alias,
                                       "--external-address", kExternalAddress,
                                       env.pd_join_url,
                                       "--allocation-address", address.value()});
    }
    auto pd = run(env, executables, Binary::Pd, std::move(pd_args));
    if (pd.is_err()) return std::move(pd).error();
    return ok_status();
}

} // namespace penv
