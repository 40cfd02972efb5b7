#pragma once

// judgebox/config.hpp: Process-wide judge configuration.
//
// Sources (in priority order):
//   1. Explicit init_config(cfg) call.
//   2. Environment: JUDGEBOX_* variables (see JudgeConfig::from_env).
//   3. Compiled defaults below.
//
// Invariant: global_config() is read-only after the first call. Components
// that need different limits (tests, the CLI) take a JudgeConfig by value.

#include <cstdint>
#include <string>
#include <vector>

namespace judgebox {

struct JudgeConfig {
  std::string docker_bin{"docker"};                // JUDGEBOX_DOCKER_BIN
  std::uint64_t memory_limit_bytes{512ull << 20};  // JUDGEBOX_MEMORY_LIMIT_BYTES
  std::uint32_t pids_limit{256};                   // JUDGEBOX_PIDS_LIMIT
  std::uint64_t wall_timeout_ms{10000};            // JUDGEBOX_WALL_TIMEOUT_MS
  std::size_t max_output_bytes{8u << 20};          // JUDGEBOX_MAX_OUTPUT_BYTES
  std::string tasks_dir{"tasks"};                  // JUDGEBOX_TASKS_DIR
  std::string scratch_dir;                         // JUDGEBOX_SCRATCH_DIR; empty = system temp
  std::uint32_t workers{0};                        // JUDGEBOX_WORKERS; 0 = hardware concurrency
  std::string unit_prefix{"judgebox"};             // JUDGEBOX_UNIT_PREFIX

  // Timeout for platform bookkeeping commands (create, cp, logs, rm, ...).
  std::uint64_t control_timeout_ms{30000};

  static JudgeConfig from_env();

  // Resolved pool size: workers, or hardware concurrency, never below 1.
  std::uint32_t effective_workers() const;
  // Resolved staging root: scratch_dir, or the system temp directory.
  std::string effective_scratch_dir() const;
};

const JudgeConfig& init_config(const JudgeConfig& cfg);
const JudgeConfig& global_config();

std::string config_to_json(const JudgeConfig& cfg);

// Validates a config document such as
//   {"docker_bin":"docker","memory_limit_bytes":536870912,"wall_timeout_ms":10000}
// Unknown keys are warnings; wrong types and out-of-range values are errors.
struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};
ConfigValidationResult validate_config(const std::string& config_json);

}  // namespace judgebox
