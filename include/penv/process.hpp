#pragma once

#include <penv/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace penv {

struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;

    bool success() const { return exit_code == 0; }
    // stdout without the trailing newline(s)
    std::string stdout_line() const;
};

// Run an external program (no shell), capturing stdout and stderr.
// Errors only on spawn failure or timeout; a nonzero exit is a result.
// Exit code 127 means the program could not be executed.
// stdin is /dev/null unless `input` is given; it is written up front and
// must fit in a pipe buffer (short answers such as a seed phrase).
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const std::optional<std::string>& input = std::nullopt);

// "git clone --bare url" style rendering for log lines
std::string describe_command(const std::vector<std::string>& args);

// Single-quote for POSIX shells: abc -> 'abc', it's -> 'it'\''s'
std::string shell_quote(const std::string& s);

} // namespace penv
