#include <penv/binary.hpp>

namespace penv {

const char* binary_name(Binary b) {
    switch (b) {
        case Binary::Pcli:     return "pcli";
        case Binary::Pclientd: return "pclientd";
        case Binary::Pd:       return "pd";
    }
    return "unknown";
}

Result<Binary> parse_binary(const std::string& name) {
    for (Binary b : kAllBinaries) {
        if (name == binary_name(b)) return Result<Binary>::ok(b);
    }
    return PenvError{PenvError::Parse, "unknown binary '" + name + "'"};
}

bool is_node_binary(Binary b) {
    return b == Binary::Pd;
}

} // namespace penv
