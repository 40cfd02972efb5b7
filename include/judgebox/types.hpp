#pragma once

// judgebox/types.hpp: Core data structures for the judging subsystem.
//
// OWNERSHIP:
//   - All string members are value-owned. No borrowed references.
//   - ISandboxRunner::run() and SubmissionJudge::evaluate() return their
//     results by value. Caller owns them.
//   - ExecutionRequest is created per test-case invocation and never shared
//     between concurrent calls.
//
// ERROR REPORTING:
//   Failures are reported through ErrorCode values stored in result structs
//   (error_code + error_detail), never thrown across the public API.
//   A candidate program exiting non-zero or printing the wrong answer is NOT
//   an error: it is ordinary result data (exit_code, stdout_text).
//
// JUDGE RESULT INVARIANTS:
//   - passed == (every visible test passed && every hidden test passed).
//   - hidden_tests_passed <= hidden_tests_total.
//   - metrics.max_elapsed_ms is the running maximum over every
//     ExecutionResult.elapsed_ms observed during one evaluate() call.

#include <cstdint>
#include <string>
#include <vector>

#include "judgebox/language.hpp"

namespace judgebox {

enum class ErrorCode {
  none,
  json_parse_error,
  unsupported_language,
  task_not_found,
  task_invalid,
  execution_infrastructure,
  judge_infrastructure,
  spawn_failed,
  timeout,
  config_invalid,
};

std::string to_string(ErrorCode code);

struct ExecutionRequest {
  std::string code;
  Language language{Language::python};
  std::string stdin_data;
};

struct ExecutionResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code{0};
  double elapsed_ms{0.0};
  // Reserved: peak memory is not measured; always 0.
  std::uint64_t memory_bytes{0};

  bool timed_out{false};   // wall-clock limit hit, unit killed by the runner
  bool oom_killed{false};  // platform killed the unit for exceeding memory
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string unit_name;

  // Set only for infrastructure failure. exit_code is meaningless then.
  ErrorCode error_code{ErrorCode::none};
  std::string error_detail;

  bool infrastructure_failed() const { return error_code != ErrorCode::none; }
};

struct TestCase {
  std::string input;
  std::string expected_output;
};

struct TaskTestSuite {
  std::string task_id;
  std::vector<TestCase> visible;
  std::vector<TestCase> hidden;
};

struct VisibleTestOutcome {
  std::string input;
  std::string expected;
  std::string stdout_text;
  std::string stderr_text;
  bool passed{false};
  double elapsed_ms{0.0};
};

struct JudgeMetrics {
  double max_elapsed_ms{0.0};
};

struct JudgeResult {
  std::string task_id;
  bool passed{false};
  std::vector<VisibleTestOutcome> visible_tests;
  std::uint32_t hidden_tests_passed{0};
  JudgeMetrics metrics;

  // Not part of the wire contract.
  std::uint32_t hidden_tests_total{0};
  std::uint32_t infrastructure_failures{0};
  ErrorCode error_code{ErrorCode::none};
  std::string error_detail;

  bool ok() const { return error_code == ErrorCode::none; }
};

// Trim leading/trailing ASCII whitespace (" \t\n\r\v\f") only. Unicode
// whitespace such as U+00A0 or U+2028 is kept, so "0 1\u00a0" does not match
// "0 1". Byte-level: no locale or decoding involved.
std::string trim_copy(const std::string& s);

// Verdict for one test case: trimmed stdout equals trimmed expected output
// and the program exited with status 0. Infrastructure failure never passes.
bool output_matches(const ExecutionResult& result, const std::string& expected_output);

}  // namespace judgebox
