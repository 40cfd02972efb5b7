#include "judgebox/types.hpp"

namespace judgebox {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::unsupported_language: return "unsupported_language";
    case ErrorCode::task_not_found: return "task_not_found";
    case ErrorCode::task_invalid: return "task_invalid";
    case ErrorCode::execution_infrastructure: return "execution_infrastructure";
    case ErrorCode::judge_infrastructure: return "judge_infrastructure";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

namespace {
inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}
}  // namespace

std::string trim_copy(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

bool output_matches(const ExecutionResult& result, const std::string& expected_output) {
  if (result.infrastructure_failed()) return false;
  if (result.exit_code != 0) return false;
  return trim_copy(result.stdout_text) == trim_copy(expected_output);
}

}  // namespace judgebox
