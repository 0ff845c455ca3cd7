#pragma once

#include <cstddef>
#include <string>

namespace fleet::util {

// Random RFC 4122 version 4 UUID in canonical 36-character form. Used for
// instance, volume, history and command ids.
std::string NewId();

// `bytes` bytes from the OpenSSL CSPRNG, lowercase hex encoded. Throws
// std::runtime_error when the generator cannot deliver.
std::string RandomHex(std::size_t bytes);

} // namespace fleet::util
