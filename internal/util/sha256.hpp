#pragma once

#include <string>
#include <string_view>

namespace fleet::util {

// Lowercase hex SHA-256 digest of the input bytes.
std::string Sha256Hex(std::string_view data);

} // namespace fleet::util
