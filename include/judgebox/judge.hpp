#pragma once

// judgebox/judge.hpp: one verdict per (code, language, task).
//
// PER-CALL STATE MACHINE:
//   LoadingTask -> RunningVisible -> RunningHidden -> Aggregated
//
//   Rejections before any execution (error_code set, no unit created):
//     - language outside the catalog    -> unsupported_language (checked first)
//     - unknown task id                 -> task_not_found
//     - malformed task file             -> task_invalid
//     - platform unreachable            -> judge_infrastructure (only probed
//                                          when the suite has test cases)
//
//   A per-test infrastructure error fails that test and evaluation goes on.
//   When every executed test hit one, the verdict is replaced by
//   judge_infrastructure: an all-failed verdict would blame the candidate for
//   a platform outage.
//
// Test cases within one call run strictly in order, one at a time. Separate
// evaluate() calls may run concurrently; the judge holds no per-call state.

#include <future>
#include <string>

#include "judgebox/language.hpp"
#include "judgebox/runner.hpp"
#include "judgebox/task_store.hpp"
#include "judgebox/types.hpp"
#include "judgebox/worker_pool.hpp"

namespace judgebox {

class SubmissionJudge {
 public:
  // Both collaborators must outlive the judge.
  SubmissionJudge(ISandboxRunner& runner, ITaskStore& tasks);

  JudgeResult evaluate(const std::string& code, Language language, const std::string& task_id);

  // Wire-level entry: language by identifier ("python", "cpp", ...).
  JudgeResult evaluate(const std::string& code, const std::string& language,
                       const std::string& task_id);

  std::future<JudgeResult> evaluate_async(WorkerPool& pool, std::string code,
                                          std::string language, std::string task_id);

 private:
  JudgeResult evaluate_suite(const std::string& code, Language language,
                             const std::string& task_id);

  ISandboxRunner& runner_;
  ITaskStore& tasks_;
};

// Process exit statuses used by the judgebox CLI.
inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;     // usage, unsupported language, unknown or bad task
inline constexpr int kExitNegative = 2;  // failed verdict, or execution platform down

int judge_exit_status(const JudgeResult& result);

// {"task_id","passed","visible_tests":[...],"hidden_tests_passed","metrics":{"max_elapsed_ms"}}
// or, when error_code is set, {"error":{"code","detail"},"task_id"}.
std::string judge_result_to_json(const JudgeResult& result);

}  // namespace judgebox
