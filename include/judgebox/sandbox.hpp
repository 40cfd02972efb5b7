#pragma once

// judgebox/sandbox.hpp: Host process supervision.
//
// run_process() is the only place judgebox forks. The container runner uses
// it to drive the container platform CLI (create, cp, start, wait, logs, rm),
// so every platform call inherits the same guarantees:
//   - stdout/stderr captured through pipes, each bounded by max_output_bytes.
//   - a wall-clock deadline; on expiry the whole process group is SIGKILLed
//     and reaped before returning (no zombies, no orphaned CLI clients).
//   - exec failure is reported as ErrorCode::spawn_failed rather than being
//     confused with a child that exited 127.
//   - stdin is /dev/null.
//
// The environment of the child is exactly ProcessSpec::env. Nothing is
// inherited implicitly.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "judgebox/types.hpp"

namespace judgebox {

struct ProcessSpec {
  std::string command;  // absolute path, or a bare name resolved via PATH in env
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{5000};  // 0 = no deadline
  std::size_t max_output_bytes{1 << 20};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
};

/// @brief Run a host process to completion under a deadline.
///
/// Exit code decoding: normal exit -> WEXITSTATUS, signal -> 128 + signo,
/// deadline -> 124 with timed_out=true.
ProcessResult run_process(const ProcessSpec& spec);

/// Resolve `name` against the colon-separated `path_env`. Names containing a
/// '/' are returned unchanged. Returns "" when nothing executable is found.
std::string resolve_executable(const std::string& name, const std::string& path_env);

}  // namespace judgebox
