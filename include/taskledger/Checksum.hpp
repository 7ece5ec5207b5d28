#pragma once

#include <string>
#include <string_view>

namespace taskledger {

// Lowercase hex SHA-256 of the given bytes.
std::string sha256Hex(std::string_view data);

} // namespace taskledger
