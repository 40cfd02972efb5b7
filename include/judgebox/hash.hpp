#pragma once

#include <string>
#include <string_view>

namespace judgebox {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. The prefixes are part of the event schema:
//   "src:" submitted source code
//   "out:" captured program output
//   "unit:" execution unit name derivation
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string source_digest(std::string_view code);
std::string output_digest(std::string_view captured);

// Fresh 16-hex-char token for naming one execution unit: a 64-bit prefix of
// BLAKE3 over (pid, per-process nonce, monotonic clock, process entropy).
std::string unique_unit_token();

}  // namespace judgebox
