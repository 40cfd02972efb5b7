#include "judgebox/hash.hpp"

// BLAKE3 is the sole hash primitive. The domain prefixes ("src:", "out:",
// "unit:") keep digests from different contexts from ever comparing equal.

#include <unistd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>

extern "C" {
#include <blake3.h>
}

namespace judgebox {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::atomic<std::uint64_t> g_unit_nonce{0};

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string source_digest(std::string_view code) {
  return hash_domain("src:", code);
}

std::string output_digest(std::string_view captured) {
  return hash_domain("out:", captured);
}

std::string unique_unit_token() {
  static const std::uint64_t process_entropy = [] {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
  }();
  const std::uint64_t nonce = g_unit_nonce.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();

  std::string seed;
  seed.reserve(64);
  seed += std::to_string(static_cast<long>(::getpid()));
  seed += ':';
  seed += std::to_string(nonce);
  seed += ':';
  seed += std::to_string(static_cast<long long>(now));
  seed += ':';
  seed += std::to_string(process_entropy);
  return hash_domain("unit:", seed).substr(0, 16);
}

}  // namespace judgebox
