#pragma once

// judgebox/runner.hpp: sandbox runner, one ephemeral execution unit per run.
//
// ISandboxRunner is the seam between the judge and the execution platform.
// ContainerRunner drives a docker-compatible CLI through run_process():
//
//   create --network none --memory M --memory-swap M --pids-limit P
//          -w /workspace <image> sh -c "cd /workspace && <command>"
//   cp     <staging>/. <unit>:/workspace
//   start  <unit>
//   wait   <unit>                       (bounded by wall_timeout_ms)
//   kill   <unit>                       (only when the wall clock expired)
//   logs   <unit>                       (stdout and stderr kept apart)
//   inspect --format {{.State.OOMKilled}} <unit>
//   rm -f  <unit>                       (always, via ContainerGuard)
//
// Unit names are <unit_prefix>-<16 hex>, fresh per call, never reused.
// The host staging directory is removed on every path (ScratchDir).
//
// Thread-safety: run() keeps no mutable member state; concurrent calls on one
// ContainerRunner are safe.

#include <future>
#include <map>
#include <string>
#include <vector>

#include "judgebox/config.hpp"
#include "judgebox/sandbox.hpp"
#include "judgebox/types.hpp"
#include "judgebox/worker_pool.hpp"

namespace judgebox {

class ISandboxRunner {
 public:
  virtual ~ISandboxRunner() = default;

  // Exactly one result per call. Platform failures are reported through
  // ExecutionResult::error_code, never thrown.
  virtual ExecutionResult run(const ExecutionRequest& request) = 0;

  // Whether the execution platform is reachable right now.
  virtual bool available() = 0;

  virtual std::string backend_id() const = 0;
};

class ContainerRunner : public ISandboxRunner {
 public:
  explicit ContainerRunner(JudgeConfig config);

  ExecutionResult run(const ExecutionRequest& request) override;
  bool available() override;
  std::string backend_id() const override { return "container"; }

  const JudgeConfig& config() const { return config_; }

  // Result of invoking the platform CLI; exposed for teardown and tests.
  ProcessResult platform(std::vector<std::string> args, std::uint64_t timeout_ms,
                         std::size_t max_output_bytes) const;

 private:
  ExecutionResult run_unit(const ExecutionRequest& request, bool* teardown_ok) const;

  JudgeConfig config_;
  std::string platform_path_;  // resolved docker_bin; empty when not found
  std::map<std::string, std::string> platform_env_;
};

std::future<ExecutionResult> run_async(WorkerPool& pool, ISandboxRunner& runner,
                                       ExecutionRequest request);

std::string execution_result_to_json(const ExecutionResult& result);

}  // namespace judgebox
