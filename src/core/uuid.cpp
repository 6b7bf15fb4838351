#include "core/uuid.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace tether {

namespace {

std::mt19937_64 &generator() {
  thread_local std::mt19937_64 gen{std::random_device{}()};
  return gen;
}

}  // namespace

std::string UUID::generate() {
  static constexpr char hex[] = "0123456789abcdef";

  std::array<uint8_t, 16> bytes{};
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto &b : bytes) {
    b = static_cast<uint8_t>(dist(generator()));
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(hex[bytes[i] >> 4]);
    out.push_back(hex[bytes[i] & 0x0F]);
  }
  return out;
}

std::string UUID::short_id(size_t length) {
  static constexpr char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dist(generator())];
  }
  return result;
}

}  // namespace tether
