#pragma once

#include <penv/environment.hpp>
#include <penv/result.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace penv {

enum class Shell { Bash, Zsh };

Result<Shell> parse_shell(const std::string& name);
const char* shell_name(Shell s);

// Exported by the hook as "<alias>:<fingerprint>", where the fingerprint
// covers every other variable the shell was given. A recreated environment
// with the same alias but different values gets a different marker.
constexpr const char* kMarkerVariable = "PENUMBRA_PENV_ACTIVE_ENVIRONMENT";
constexpr size_t kFingerprintLength = 12;

constexpr const char* kCometbftProxyUrl = "http://127.0.0.1:26657";

// One variable of the fixed set. No value means unset.
struct EnvVar {
    std::string name;
    std::optional<std::string> value;
};

// The full variable set for an environment, or all-unset for none.
// Node variables are unset for client-only environments.
std::vector<EnvVar> environment_variables(const std::optional<Environment>& env);

// "<alias>:<first 12 hex of sha256 over name=value lines>"; the marker
// variable itself is skipped
std::string environment_fingerprint(const std::string& alias, const std::vector<EnvVar>& vars);

// What a shell that last synced to `marker` must apply to match `active`.
// Empty when the marker equals the active environment's fingerprint.
std::vector<EnvVar> sync_delta(const std::optional<std::string>& marker,
                               const std::optional<Environment>& active);

// export/unset statements, values single-quoted
std::string render_delta(Shell shell, const std::vector<EnvVar>& delta);

// Init script for `eval "$(penv hook bash)"`. `penv_command` is the
// already-quoted command line the prompt hook runs.
Result<std::string> hook_script(Shell shell, const std::string& penv_command,
                                const std::filesystem::path& bin_dir);

} // namespace penv
