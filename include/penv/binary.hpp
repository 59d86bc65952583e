#pragma once

#include <penv/result.hpp>
#include <array>
#include <string>

namespace penv {

// The managed binaries of one installation
enum class Binary { Pcli, Pclientd, Pd };

constexpr std::array<Binary, 3> kAllBinaries = {Binary::Pcli, Binary::Pclientd, Binary::Pd};

const char* binary_name(Binary b);
Result<Binary> parse_binary(const std::string& name);

// pd is only linked into environments that include a node
bool is_node_binary(Binary b);

} // namespace penv
