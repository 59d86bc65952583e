#include <penv/template.hpp>

namespace penv {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string defined_names(const TemplateVars& vars) {
    if (vars.empty()) return "no variables defined";
    std::string hint = "defined: ";
    bool first = true;
    for (const auto& kv : vars) {
        if (!first) hint += ", ";
        hint += kv.first;
        first = false;
    }
    return hint;
}

Result<std::string> render_template(const std::string& tmpl, const TemplateVars& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;

    while (i < tmpl.size()) {
        if (tmpl.compare(i, 3, "\\{{") == 0) {
            out += "{{";
            i += 3;
            continue;
        }

        if (tmpl.compare(i, 2, "{{") != 0) {
            out.push_back(tmpl[i++]);
            continue;
        }

        size_t close = tmpl.find("}}", i + 2);
        if (close == std::string::npos) {
            return PenvError(PenvError::Parse,
                "unclosed '{{' in template at offset " + std::to_string(i));
        }

        std::string name = trim(tmpl.substr(i + 2, close - i - 2));
        if (name.empty()) {
            return PenvError(PenvError::Parse,
                "empty placeholder in template at offset " + std::to_string(i));
        }

        auto it = vars.find(name);
        if (it == vars.end()) {
            return PenvError(PenvError::NotFound,
                "template references undefined variable '" + name + "'",
                defined_names(vars));
        }

        out += it->second;
        i = close + 2;
    }

    return Result<std::string>::ok(std::move(out));
}

} // namespace penv
