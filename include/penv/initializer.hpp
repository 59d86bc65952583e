#pragma once

#include <penv/binary.hpp>
#include <penv/environment.hpp>
#include <penv/result.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace penv {

using BinaryPaths = std::map<Binary, std::filesystem::path>;

// pd's peer address for joined and generated networks
constexpr const char* kExternalAddress = "0.0.0.0:26656";

// The 12 or 24 words pcli prints after "YOUR PRIVATE SEED PHRASE (SpendKey):"
Result<std::string> parse_seed_phrase(const std::string& pcli_output);

// First line of `pcli view address` output that starts with "penumbra1"
Result<std::string> parse_address(const std::string& pcli_output);

// Runs each binary's own initialization against a freshly laid out
// environment root:
//   pcli --home <root>/pcli init --grpc-url <grpc> soft-kms generate
//   pclientd --home <root>/pclientd init --grpc-url <grpc>   (seed on stdin)
//   pd network --network-dir <root>/network_data join|generate ...
// pd only runs for environments that include a node; it is funded with
// pcli's address 0. Any failure is InitFailed; cleaning up the root is
// the caller's job.
class EnvironmentInitializer {
public:
    explicit EnvironmentInitializer(int timeout_seconds) : timeout_seconds_(timeout_seconds) {}

    Status initialize(const Environment& env, const BinaryPaths& executables);

private:
    Result<std::string> run(const Environment& env, const BinaryPaths& executables, Binary b,
                            std::vector<std::string> args,
                            const std::optional<std::string>& input = std::nullopt);

    int timeout_seconds_;
};

} // namespace penv
