#include "uuid.hpp"

#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace fleet::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

void Fill(std::uint8_t* out, std::size_t size) {
  if (RAND_bytes(out, static_cast<int>(size)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
}

void AppendHex(std::string& out, std::uint8_t byte) {
  out.push_back(kHexDigits[byte >> 4]);
  out.push_back(kHexDigits[byte & 0x0F]);
}

} // namespace

std::string NewId() {
  std::array<std::uint8_t, 16> raw{};
  Fill(raw.data(), raw.size());
  raw[6] = static_cast<std::uint8_t>((raw[6] & 0x0F) | 0x40);
  raw[8] = static_cast<std::uint8_t>((raw[8] & 0x3F) | 0x80);

  std::string id;
  id.reserve(36);
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) id.push_back('-');
    AppendHex(id, raw[i]);
  }
  return id;
}

std::string RandomHex(std::size_t bytes) {
  std::vector<std::uint8_t> raw(bytes);
  Fill(raw.data(), raw.size());

  std::string out;
  out.reserve(bytes * 2);
  for (auto byte : raw) AppendHex(out, byte);
  return out;
}

} // namespace fleet::util
