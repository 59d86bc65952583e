#pragma once

#include <penv/result.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace penv {

// Parse a TOML state file. A missing file is an empty table.
Result<toml::table> load_toml_file(const std::filesystem::path& path);

// Serialize and write atomically
Status save_toml_file(const std::filesystem::path& path, const toml::table& doc);

// Required string field of a table entry
Result<std::string> required_string(const toml::table& tbl, const char* key,
                                    const std::filesystem::path& file);

toml::array to_toml_array(const std::vector<std::string>& items);
std::vector<std::string> from_toml_array(const toml::array* arr);

} // namespace penv
