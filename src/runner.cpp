#include "judgebox/runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

#include "judgebox/hash.hpp"
#include "judgebox/jsonlite.hpp"
#include "judgebox/language.hpp"
#include "judgebox/observability.hpp"

namespace judgebox {

namespace fs = std::filesystem;

namespace {

// Variables the platform CLI needs to find its daemon. Nothing else from the
// judge's environment reaches the child.
constexpr const char* kPlatformEnvPassthrough[] = {
    "PATH",           "HOME",          "DOCKER_HOST",       "DOCKER_CONFIG",
    "DOCKER_CONTEXT", "DOCKER_CERT_PATH", "DOCKER_TLS_VERIFY",
};

constexpr std::size_t kControlOutputBytes = 64 * 1024;
constexpr std::size_t kMaxDetailBytes = 512;
constexpr int kKilledExitCode = 137;

bool platform_ok(const ProcessResult& pr) {
  return pr.error_code == ErrorCode::none && pr.exit_code == 0;
}

std::string describe(const std::string& step, const ProcessResult& pr) {
  std::string detail = step + ": ";
  if (pr.error_code != ErrorCode::none) {
    detail += to_string(pr.error_code) + " " + pr.error_message;
  } else {
    detail += "exit " + std::to_string(pr.exit_code);
    std::string err = trim_copy(pr.stderr_text);
    if (!err.empty()) detail += " " + err;
  }
  if (detail.size() > kMaxDetailBytes) detail.resize(kMaxDetailBytes);
  return detail;
}

std::optional<int> parse_exit_code(const ProcessResult& pr) {
  if (!platform_ok(pr)) return std::nullopt;
  const std::string text = trim_copy(pr.stdout_text);
  if (text.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') return std::nullopt;
  return static_cast<int>(v);
}

bool write_file(const fs::path& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(ofs);
}

// Host staging directory holding Main<ext> and input.txt. Removed on scope
// exit whatever happened in between.
class ScratchDir {
 public:
  ScratchDir(fs::path path, bool* teardown_ok)
      : path_(std::move(path)), teardown_ok_(teardown_ok) {}
  ~ScratchDir() {
    if (!created_) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) *teardown_ok_ = false;
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  bool create(std::string* error) {
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
      *error = "staging: " + path_.string() + ": " + ec.message();
      return false;
    }
    created_ = true;
    return true;
  }

  const fs::path& path() const { return path_; }

 private:
  fs::path path_;
  bool* teardown_ok_;
  bool created_{false};
};

// Force-removes the execution unit on scope exit.
class ContainerGuard {
 public:
  ContainerGuard(const ContainerRunner& runner, std::string name, bool* teardown_ok)
      : runner_(runner), name_(std::move(name)), teardown_ok_(teardown_ok) {}
  ~ContainerGuard() {
    const ProcessResult pr = runner_.platform({"rm", "-f", name_},
                                              runner_.config().control_timeout_ms,
                                              kControlOutputBytes);
    if (platform_ok(pr)) {
      global_engine_stats().units_destroyed.fetch_add(1, std::memory_order_relaxed);
    } else {
      *teardown_ok_ = false;
    }
  }

  ContainerGuard(const ContainerGuard&) = delete;
  ContainerGuard& operator=(const ContainerGuard&) = delete;

 private:
  const ContainerRunner& runner_;
  std::string name_;
  bool* teardown_ok_;
};

ExecutionResult infrastructure_failure(ExecutionResult result, std::string detail) {
  result.error_code = ErrorCode::execution_infrastructure;
  result.error_detail = std::move(detail);
  result.exit_code = -1;
  return result;
}

}  // namespace

ContainerRunner::ContainerRunner(JudgeConfig config) : config_(std::move(config)) {
  for (const char* name : kPlatformEnvPassthrough) {
    if (const char* v = std::getenv(name)) platform_env_[name] = v;
  }
  const auto it = platform_env_.find("PATH");
  platform_path_ = resolve_executable(
      config_.docker_bin, it != platform_env_.end() ? it->second : "/usr/local/bin:/usr/bin:/bin");
}

ProcessResult ContainerRunner::platform(std::vector<std::string> args, std::uint64_t timeout_ms,
                                        std::size_t max_output_bytes) const {
  if (platform_path_.empty()) {
    ProcessResult pr;
    pr.exit_code = 127;
    pr.error_code = ErrorCode::spawn_failed;
    pr.error_message = "container CLI not found: " + config_.docker_bin;
    return pr;
  }
  ProcessSpec spec;
  spec.command = platform_path_;
  spec.argv = std::move(args);
  spec.env = platform_env_;
  spec.timeout_ms = timeout_ms;
  spec.max_output_bytes = max_output_bytes;
  return run_process(spec);
}

bool ContainerRunner::available() {
  const ProcessResult pr = platform({"version", "--format", "{{.Server.Version}}"},
                                    config_.control_timeout_ms, kControlOutputBytes);
  return platform_ok(pr);
}

ExecutionResult ContainerRunner::run(const ExecutionRequest& request) {
  ExecutionEvent ev;
  ExecutionResult result;
  std::uint64_t duration_ns = 0;
  {
    ScopeTimer timer(duration_ns);
    result = run_unit(request, &ev.teardown_ok);
  }

  ev.unit_name = result.unit_name;
  ev.language = to_string(request.language);
  ev.source_digest = source_digest(request.code);
  ev.stdout_digest = output_digest(result.stdout_text);
  ev.stderr_digest = output_digest(result.stderr_text);
  ev.duration_ns = duration_ns;
  ev.elapsed_ms = result.elapsed_ms;
  ev.exit_code = result.exit_code;
  ev.timed_out = result.timed_out;
  ev.oom_killed = result.oom_killed;
  ev.error_code = to_string(result.error_code);
  emit_execution_event(ev);
  return result;
}

ExecutionResult ContainerRunner::run_unit(const ExecutionRequest& request,
                                          bool* teardown_ok) const {
  ExecutionResult result;

  const auto lang = lookup_language(request.language);
  if (!lang) {
    result.error_code = ErrorCode::unsupported_language;
    result.error_detail = "language not in catalog";
    result.exit_code = -1;
    return result;
  }

  result.unit_name = config_.unit_prefix + "-" + unique_unit_token();

  ScratchDir staging(fs::path(config_.effective_scratch_dir()) / result.unit_name, teardown_ok);
  std::string staging_error;
  if (!staging.create(&staging_error)) {
    return infrastructure_failure(std::move(result), staging_error);
  }
  if (!write_file(staging.path() / source_filename(request.language), request.code) ||
      !write_file(staging.path() / std::string(kInputFilename), request.stdin_data)) {
    return infrastructure_failure(std::move(result),
                                  "staging: cannot write " + staging.path().string());
  }

  const std::string workdir(kSandboxWorkdir);
  const std::string shell_command = "cd " + workdir + " && " + std::string(lang->command);
  const std::string memory = std::to_string(config_.memory_limit_bytes);
  const std::uint64_t control_ms = config_.control_timeout_ms;

  const ProcessResult created = platform(
      {"create", "--name", result.unit_name, "--network", "none", "--memory", memory,
       "--memory-swap", memory, "--pids-limit", std::to_string(config_.pids_limit), "-w",
       workdir, std::string(lang->image), "sh", "-c", shell_command},
      control_ms, kControlOutputBytes);
  if (!platform_ok(created) && !created.timed_out) {
    return infrastructure_failure(std::move(result), describe("create", created));
  }
  // A timed-out create may still have produced the unit.
  ContainerGuard guard(*this, result.unit_name, teardown_ok);
  if (!platform_ok(created)) {
    return infrastructure_failure(std::move(result), describe("create", created));
  }
  global_engine_stats().units_created.fetch_add(1, std::memory_order_relaxed);

  const ProcessResult copied =
      platform({"cp", staging.path().string() + "/.", result.unit_name + ":" + workdir},
               control_ms, kControlOutputBytes);
  if (!platform_ok(copied)) {
    return infrastructure_failure(std::move(result), describe("cp", copied));
  }

  const auto t0 = std::chrono::steady_clock::now();
  const ProcessResult started = platform({"start", result.unit_name}, control_ms,
                                         kControlOutputBytes);
  if (!platform_ok(started)) {
    return infrastructure_failure(std::move(result), describe("start", started));
  }

  const ProcessResult waited = platform({"wait", result.unit_name}, config_.wall_timeout_ms,
                                        kControlOutputBytes);
  std::optional<int> exit_code;
  if (waited.timed_out) {
    const ProcessResult killed = platform({"kill", result.unit_name}, control_ms,
                                          kControlOutputBytes);
    const ProcessResult rewaited = platform({"wait", result.unit_name}, control_ms,
                                            kControlOutputBytes);
    exit_code = parse_exit_code(rewaited);
    if (platform_ok(killed)) {
      result.timed_out = true;
      if (!exit_code || *exit_code == 0) exit_code = kKilledExitCode;
    } else if (!exit_code) {
      return infrastructure_failure(std::move(result), describe("kill", killed));
    }
  } else {
    exit_code = parse_exit_code(waited);
    if (!exit_code) {
      return infrastructure_failure(std::move(result), describe("wait", waited));
    }
  }
  const auto t1 = std::chrono::steady_clock::now();
  result.exit_code = *exit_code;
  result.elapsed_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

  const ProcessResult logs = platform({"logs", result.unit_name}, control_ms,
                                      config_.max_output_bytes);
  if (!platform_ok(logs)) {
    return infrastructure_failure(std::move(result), describe("logs", logs));
  }
  result.stdout_text = logs.stdout_text;
  result.stderr_text = logs.stderr_text;
  result.stdout_truncated = logs.stdout_truncated;
  result.stderr_truncated = logs.stderr_truncated;

  const ProcessResult inspected =
      platform({"inspect", "--format", "{{.State.OOMKilled}}", result.unit_name}, control_ms,
               kControlOutputBytes);
  if (!platform_ok(inspected)) {
    return infrastructure_failure(std::move(result), describe("inspect", inspected));
  }
  result.oom_killed = trim_copy(inspected.stdout_text) == "true";

  return result;
}

std::future<ExecutionResult> run_async(WorkerPool& pool, ISandboxRunner& runner,
                                       ExecutionRequest request) {
  return pool.submit([&runner, request = std::move(request)] { return runner.run(request); });
}

std::string execution_result_to_json(const ExecutionResult& result) {
  jsonlite::Object o;
  if (result.infrastructure_failed()) {
    jsonlite::Object err;
    err["code"] = to_string(result.error_code);
    err["detail"] = result.error_detail;
    o["error"] = std::move(err);
    o["unit_name"] = result.unit_name;
    return jsonlite::to_json(jsonlite::Value{std::move(o)});
  }
  o["stdout"] = result.stdout_text;
  o["stderr"] = result.stderr_text;
  o["exit_code"] = jsonlite::integer(result.exit_code);
  o["elapsed_ms"] = result.elapsed_ms;
  o["memory_bytes"] = result.memory_bytes;
  o["timed_out"] = result.timed_out;
  o["oom_killed"] = result.oom_killed;
  o["stdout_truncated"] = result.stdout_truncated;
  o["stderr_truncated"] = result.stderr_truncated;
  o["unit_name"] = result.unit_name;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace judgebox
