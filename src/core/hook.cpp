#include <penv/hook.hpp>
#include <penv/process.hpp>
#include <penv/sha256.hpp>
#include <penv/template.hpp>

namespace penv {

Result<Shell> parse_shell(const std::string& name) {
    if (name == "bash") return Result<Shell>::ok(Shell::Bash);
    if (name == "zsh") return Result<Shell>::ok(Shell::Zsh);
    return PenvError{PenvError::InvalidArg, "unsupported shell '" + name + "'",
                     "supported shells: bash, zsh"};
}

const char* shell_name(Shell s) {
    switch (s) {
        case Shell::Bash: return "bash";
        case Shell::Zsh:  return "zsh";
    }
    return "unknown";
}

std::vector<EnvVar> environment_variables(const std::optional<Environment>& env) {
    std::vector<EnvVar> vars = {
        {kMarkerVariable, std::nullopt},
        {"PENUMBRA_PCLI_HOME", std::nullopt},
        {"PENUMBRA_PCLIENTD_HOME", std::nullopt},
        {"PENUMBRA_NODE_PD_URL", std::nullopt},
        {"PENUMBRA_PD_HOME", std::nullopt},
        {"COMETBFT_HOME", std::nullopt},
        {"PENUMBRA_PD_JOIN_URL", std::nullopt},
        {"PENUMBRA_PD_COMETBFT_PROXY_URL", std::nullopt},
    };
    if (!env) return vars;

    vars[1].value = env->pcli_home().string();
    vars[2].value = env->pclientd_home().string();
    vars[3].value = env->grpc_url;
    if (env->include_node) {
        vars[4].value = env->pd_home().string();
        vars[5].value = env->cometbft_home().string();
        vars[6].value = env->pd_join_url;
        vars[7].value = std::string(kCometbftProxyUrl);
    }
    vars[0].value = environment_fingerprint(env->alias, vars);
    return vars;
}

std::string environment_fingerprint(const std::string& alias, const std::vector<EnvVar>& vars) {
    std::string material;
    for (const auto& var : vars) {
        if (var.name == kMarkerVariable) continue;
        material += var.name;
        if (var.value) material += "=" + *var.value;
        material += '\n';
    }
    return alias + ":" + Sha256::hash_hex(material).substr(0, kFingerprintLength);
}

std::vector<EnvVar> sync_delta(const std::optional<std::string>& marker,
                               const std::optional<Environment>& active) {
    auto vars = environment_variables(active);
    std::optional<std::string> truth = vars[0].value;
    if (marker == truth) return {};
    return vars;
}

std::string render_delta(Shell /*shell*/, const std::vector<EnvVar>& delta) {
    // bash and zsh share the POSIX export/unset syntax
    std::string out;
    for (const auto& var : delta) {
        if (var.value) {
            out += "export " + var.name + "=" + shell_quote(*var.value) + "\n";
        } else {
            out += "unset " + var.name + "\n";
        }
    }
    return out;
}

static const char* kBashHook = R"SH(# penv shell integration for bash
_penv_bin={{ bin_dir }}
case ":${PATH}:" in
  *":${_penv_bin}:"*) ;;
  *) export PATH="${_penv_bin}:${PATH}" ;;
esac
unset _penv_bin

_penv_hook() {
  local previous_exit_status=$?
  eval "$({{ penv }} env bash)"
  return $previous_exit_status
}

case ";${PROMPT_COMMAND:-};" in
  *";_penv_hook;"*) ;;
  *) PROMPT_COMMAND="_penv_hook${PROMPT_COMMAND:+;${PROMPT_COMMAND}}" ;;
esac
)SH";

static const char* kZshHook = R"SH(# penv shell integration for zsh
_penv_bin={{ bin_dir }}
case ":${PATH}:" in
  *":${_penv_bin}:"*) ;;
  *) export PATH="${_penv_bin}:${PATH}" ;;
esac
unset _penv_bin

_penv_hook() {
  eval "$({{ penv }} env zsh)"
}

typeset -ag precmd_functions
if (( ! ${precmd_functions[(I)_penv_hook]} )); then
  precmd_functions=(_penv_hook $precmd_functions)
fi
)SH";

Result<std::string> hook_script(Shell shell, const std::string& penv_command,
                                const std::filesystem::path& bin_dir) {
    TemplateVars vars;
    vars["penv"] = penv_command;
    vars["bin_dir"] = shell_quote(bin_dir.string());
    return render_template(shell == Shell::Bash ? kBashHook : kZshHook, vars);
}

} // namespace penv
