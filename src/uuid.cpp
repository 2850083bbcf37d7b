#include "dtchat/uuid.hpp"

#include <cstdint>
#include <random>

namespace dtchat {

// One generator per thread, seeded from the OS entropy source.
static std::mt19937_64& rng() {
  thread_local std::mt19937_64 gen = [] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }();
  return gen;
}

std::string generate_uuid() {
  static const char* HEX = "0123456789abcdef";

  uint8_t b[16];
  const uint64_t hi = rng()();
  const uint64_t lo = rng()();
  for (int i = 0; i < 8; ++i) {
    b[i]     = static_cast<uint8_t>(hi >> (56 - 8 * i));
    b[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
  }
  b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);   // version 4
  b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);   // RFC 4122 variant

  std::string s;
  s.reserve(36);
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) s.push_back('-');
    s.push_back(HEX[b[i] >> 4]);
    s.push_back(HEX[b[i] & 0x0F]);
  }
  return s;
}

std::string short_id(const std::string& uuid) {
  return uuid.size() > 8 ? uuid.substr(0, 8) : uuid;
}

bool looks_like_uuid(const std::string& s) {
  if (s.size() != 36) return false;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') return false;
      continue;
    }
    const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    if (!hex) return false;
  }
  return true;
}

} // namespace dtchat
