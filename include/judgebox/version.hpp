#pragma once

// judgebox/version.hpp: Version manifest for every externally visible format.
//
// INVARIANT:
//   All version constants are compile-time. A consumer that parses one of
//   these formats must check the matching constant; a bump means a field was
//   added, removed or changed meaning.

#include <cstdint>
#include <string>

namespace judgebox {
namespace version {

// ---------------------------------------------------------------------------
// JUDGE_RESULT_FORMAT_VERSION
// Version 1 = {task_id, passed, visible_tests[{input, expected, stdout,
// stderr, passed, elapsed_ms}], hidden_tests_passed, metrics{max_elapsed_ms}}.
// ---------------------------------------------------------------------------
constexpr std::uint32_t JUDGE_RESULT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// TASK_FORMAT_VERSION
// Version 1 = {"tests":{"visible":[{input, output}], "hidden":[...]}}.
// ---------------------------------------------------------------------------
constexpr std::uint32_t TASK_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// Version 1 = one JSON object per line, "type" is "run" or "evaluate".
// ---------------------------------------------------------------------------
constexpr std::uint32_t EVENT_LOG_VERSION = 1;

// Version 1 = BLAKE3, 32-byte digest, lowercase hex.
constexpr std::uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  std::uint32_t judge_result_format{JUDGE_RESULT_FORMAT_VERSION};
  std::uint32_t task_format{TASK_FORMAT_VERSION};
  std::uint32_t event_log{EVENT_LOG_VERSION};
  std::uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string semver;           // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // __DATE__ "T" __TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace judgebox
