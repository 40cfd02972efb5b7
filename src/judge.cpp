#include "judgebox/judge.hpp"

#include <algorithm>

#include "judgebox/hash.hpp"
#include "judgebox/jsonlite.hpp"
#include "judgebox/observability.hpp"

namespace judgebox {

namespace {

JudgeResult rejected(JudgeResult result, ErrorCode code, std::string detail) {
  result.error_code = code;
  result.error_detail = std::move(detail);
  result.passed = false;
  return result;
}

}  // namespace

SubmissionJudge::SubmissionJudge(ISandboxRunner& runner, ITaskStore& tasks)
    : runner_(runner), tasks_(tasks) {}

JudgeResult SubmissionJudge::evaluate(const std::string& code, const std::string& language,
                                      const std::string& task_id) {
  const auto parsed = parse_language(language);
  if (!parsed) {
    JudgeResult result;
    result.task_id = task_id;
    result = rejected(std::move(result), ErrorCode::unsupported_language,
                      "unsupported language: " + language);
    JudgeEvent ev;
    ev.task_id = task_id;
    ev.language = language;
    ev.source_digest = source_digest(code);
    ev.error_code = to_string(result.error_code);
    emit_judge_event(ev);
    return result;
  }
  return evaluate(code, *parsed, task_id);
}

JudgeResult SubmissionJudge::evaluate(const std::string& code, Language language,
                                      const std::string& task_id) {
  JudgeResult result;
  std::uint64_t duration_ns = 0;
  {
    ScopeTimer timer(duration_ns);
    result = evaluate_suite(code, language, task_id);
  }

  JudgeEvent ev;
  ev.task_id = task_id;
  ev.language = to_string(language);
  ev.source_digest = source_digest(code);
  ev.duration_ns = duration_ns;
  ev.visible_total = static_cast<std::uint32_t>(result.visible_tests.size());
  ev.visible_passed = static_cast<std::uint32_t>(
      std::count_if(result.visible_tests.begin(), result.visible_tests.end(),
                    [](const VisibleTestOutcome& t) { return t.passed; }));
  ev.hidden_total = result.hidden_tests_total;
  ev.hidden_passed = result.hidden_tests_passed;
  ev.infrastructure_failures = result.infrastructure_failures;
  ev.max_elapsed_ms = result.metrics.max_elapsed_ms;
  ev.passed = result.passed;
  ev.error_code = to_string(result.error_code);
  emit_judge_event(ev);
  return result;
}

JudgeResult SubmissionJudge::evaluate_suite(const std::string& code, Language language,
                                            const std::string& task_id) {
  JudgeResult result;
  result.task_id = task_id;

  // Phase: LoadingTask
  if (!lookup_language(language)) {
    return rejected(std::move(result), ErrorCode::unsupported_language,
                    "unsupported language");
  }
  TaskLoadResult loaded = tasks_.fetch(task_id);
  if (!loaded.ok()) {
    const ErrorCode code_or_missing =
        loaded.error_code == ErrorCode::none ? ErrorCode::task_not_found : loaded.error_code;
    return rejected(std::move(result), code_or_missing, loaded.error_detail);
  }
  const TaskTestSuite& suite = *loaded.suite;
  result.hidden_tests_total = static_cast<std::uint32_t>(suite.hidden.size());

  const std::size_t total = suite.visible.size() + suite.hidden.size();
  if (total > 0 && !runner_.available()) {
    return rejected(std::move(result), ErrorCode::judge_infrastructure,
                    "execution platform unreachable (" + runner_.backend_id() + ")");
  }

  bool all_passed = true;
  std::string last_infra_detail;
  auto execute = [&](const TestCase& test) {
    ExecutionRequest request;
    request.code = code;
    request.language = language;
    request.stdin_data = test.input;
    ExecutionResult run = runner_.run(request);
    if (run.infrastructure_failed()) {
      ++result.infrastructure_failures;
      last_infra_detail = run.error_detail;
    }
    result.metrics.max_elapsed_ms = std::max(result.metrics.max_elapsed_ms, run.elapsed_ms);
    const bool passed = output_matches(run, test.expected_output);
    all_passed = all_passed && passed;
    return std::make_pair(passed, std::move(run));
  };

  // Phase: RunningVisible
  result.visible_tests.reserve(suite.visible.size());
  for (const TestCase& test : suite.visible) {
    auto [passed, run] = execute(test);
    VisibleTestOutcome outcome;
    outcome.input = test.input;
    outcome.expected = test.expected_output;
    outcome.stdout_text = std::move(run.stdout_text);
    outcome.stderr_text = std::move(run.stderr_text);
    outcome.passed = passed;
    outcome.elapsed_ms = run.elapsed_ms;
    result.visible_tests.push_back(std::move(outcome));
  }

  // Phase: RunningHidden. Only the count leaves this loop.
  for (const TestCase& test : suite.hidden) {
    if (execute(test).first) ++result.hidden_tests_passed;
  }

  // Phase: Aggregated
  if (total > 0 && result.infrastructure_failures == total) {
    JudgeResult failed;
    failed.task_id = task_id;
    failed.hidden_tests_total = result.hidden_tests_total;
    failed.infrastructure_failures = result.infrastructure_failures;
    return rejected(std::move(failed), ErrorCode::judge_infrastructure,
                    "every test case failed on the execution platform: " + last_infra_detail);
  }
  result.passed = all_passed;
  return result;
}

std::future<JudgeResult> SubmissionJudge::evaluate_async(WorkerPool& pool, std::string code,
                                                         std::string language,
                                                         std::string task_id) {
  return pool.submit([this, code = std::move(code), language = std::move(language),
                      task_id = std::move(task_id)] {
    return evaluate(code, language, task_id);
  });
}

int judge_exit_status(const JudgeResult& result) {
  if (result.ok()) return result.passed ? kExitOk : kExitNegative;
  return result.error_code == ErrorCode::judge_infrastructure ? kExitNegative : kExitError;
}

std::string judge_result_to_json(const JudgeResult& result) {
  jsonlite::Object o;
  o["task_id"] = result.task_id;
  if (!result.ok()) {
    jsonlite::Object err;
    err["code"] = to_string(result.error_code);
    err["detail"] = result.error_detail;
    o["error"] = std::move(err);
    return jsonlite::to_json(jsonlite::Value{std::move(o)});
  }

  jsonlite::Array visible;
  visible.reserve(result.visible_tests.size());
  for (const auto& t : result.visible_tests) {
    jsonlite::Object v;
    v["input"] = t.input;
    v["expected"] = t.expected;
    v["stdout"] = t.stdout_text;
    v["stderr"] = t.stderr_text;
    v["passed"] = t.passed;
    v["elapsed_ms"] = t.elapsed_ms;
    visible.push_back(jsonlite::Value{std::move(v)});
  }

  jsonlite::Object metrics;
  metrics["max_elapsed_ms"] = result.metrics.max_elapsed_ms;

  o["passed"] = result.passed;
  o["visible_tests"] = std::move(visible);
  o["hidden_tests_passed"] = static_cast<std::uint64_t>(result.hidden_tests_passed);
  o["metrics"] = std::move(metrics);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace judgebox
