#include <penv/home.hpp>

#include <cstdlib>

namespace penv {

static const char* non_empty_env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

Result<Home> Home::locate(const std::string& override_dir) {
    fs::path root;
    if (!override_dir.empty()) {
        root = override_dir;
    } else if (const char* env = non_empty_env("PENUMBRA_PENV_HOME")) {
        root = env;
    } else if (const char* xdg = non_empty_env("XDG_DATA_HOME")) {
        root = fs::path(xdg) / "penv";
    } else if (const char* home = non_empty_env("HOME")) {
        root = fs::path(home) / ".local" / "share" / "penv";
    } else {
        return PenvError{PenvError::Config,
            "cannot determine the penv home directory",
            "set PENUMBRA_PENV_HOME or pass --home"};
    }

    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec) {
        return PenvError{PenvError::IO,
            "cannot resolve home directory '" + root.string() + "': " + ec.message()};
    }

    Home h;
    h.root = abs.lexically_normal();
    return Result<Home>::ok(std::move(h));
}

} // namespace penv
