#include <penv/toml_io.hpp>
#include <penv/fs.hpp>

#include <sstream>

namespace penv {

Result<toml::table> load_toml_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<toml::table>::ok(toml::table{});
    }

    auto content = read_file(path);
    if (content.is_err()) return std::move(content).error();

    try {
        return Result<toml::table>::ok(toml::parse(content.value(), path.string()));
    } catch (const toml::parse_error& e) {
        const auto& where = e.source().begin;
        return PenvError{PenvError::Parse,
            std::string(e.description()), "the file may have been edited by hand",
            path.string(), static_cast<int>(where.line)};
    }
}

Status save_toml_file(const std::filesystem::path& path, const toml::table& doc) {
    std::ostringstream out;
    out << doc << "\n";
    return write_file_atomic(path, out.str());
}

Result<std::string> required_string(const toml::table& tbl, const char* key,
                                    const std::filesystem::path& file) {
    if (auto v = tbl[key].value<std::string>()) {
        return Result<std::string>::ok(*v);
    }
    return PenvError{PenvError::Parse,
        std::string("missing or non-string field '") + key + "'", "",
        file.string(), 0};
}

toml::array to_toml_array(const std::vector<std::string>& items) {
    toml::array arr;
    for (const auto& s : items) arr.push_back(s);
    return arr;
}

std::vector<std::string> from_toml_array(const toml::array* arr) {
    std::vector<std::string> out;
    if (!arr) return out;
    for (const auto& node : *arr) {
        if (auto s = node.value<std::string>()) out.push_back(*s);
    }
    return out;
}

} // namespace penv
