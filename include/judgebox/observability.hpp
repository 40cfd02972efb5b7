#pragma once

// judgebox/observability.hpp: Structured execution observability layer.
//
// Every ISandboxRunner::run() emits one ExecutionEvent and every
// SubmissionJudge::evaluate() emits one JudgeEvent. Events are:
//   - accumulated in the global EngineStats (atomic counters, latency
//     histogram, ring buffer of recent events);
//   - appended as one JSON line to the file named by JUDGEBOX_EVENT_LOG, when
//     set;
//   - passed to an installed hook instead of the file sink, when present.
//
// INVARIANT: events carry digests and metadata only. No stdout/stderr
// content, no test inputs or expected outputs (hidden tests must not leak
// through the event log).
//
// INVARIANT: emission never throws and never blocks on anything slower than
// a short mutex hold or an O_APPEND write.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "judgebox/types.hpp"

namespace judgebox {

struct ExecutionEvent {
  std::string unit_name;
  std::string language;
  std::string source_digest;
  std::string stdout_digest;
  std::string stderr_digest;
  std::uint64_t duration_ns{0};  // whole run() call, setup and teardown included
  double elapsed_ms{0.0};        // start + wait only
  int exit_code{0};
  bool timed_out{false};
  bool oom_killed{false};
  bool teardown_ok{true};
  std::string error_code;
};

struct JudgeEvent {
  std::string task_id;
  std::string language;
  std::string source_digest;
  std::uint64_t duration_ns{0};
  std::uint32_t visible_total{0};
  std::uint32_t visible_passed{0};
  std::uint32_t hidden_total{0};
  std::uint32_t hidden_passed{0};
  std::uint32_t infrastructure_failures{0};
  double max_elapsed_ms{0.0};
  bool passed{false};
  std::string error_code;
};

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // Approximate percentile, p in [0.0, 1.0]. Microseconds; 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<std::uint64_t> count_{0};
  alignas(64) std::atomic<std::uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats: global aggregated statistics. Thread-safe.
// ---------------------------------------------------------------------------
class EngineStats {
 public:
  void record_execution(const ExecutionEvent& ev);
  void record_judgement(const JudgeEvent& ev);
  std::string to_json() const;

  // --- Execution units ---
  alignas(64) std::atomic<std::uint64_t> units_created{0};
  alignas(64) std::atomic<std::uint64_t> units_destroyed{0};
  alignas(64) std::atomic<std::uint64_t> teardown_failures{0};

  // --- Runs ---
  alignas(64) std::atomic<std::uint64_t> total_runs{0};
  alignas(64) std::atomic<std::uint64_t> nonzero_exits{0};
  alignas(64) std::atomic<std::uint64_t> timeouts{0};
  alignas(64) std::atomic<std::uint64_t> oom_kills{0};
  alignas(64) std::atomic<std::uint64_t> infrastructure_errors{0};

  // --- Evaluations ---
  alignas(64) std::atomic<std::uint64_t> total_evaluations{0};
  alignas(64) std::atomic<std::uint64_t> passed_evaluations{0};
  alignas(64) std::atomic<std::uint64_t> rejected_evaluations{0};  // error_code set

  LatencyHistogram run_latency;
  LatencyHistogram evaluate_latency;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<JudgeEvent> recent_judgements_snapshot() const;

  // Test support: zero every counter and drop recent events.
  void reset();

 private:
  mutable std::mutex ring_mu_;
  std::vector<JudgeEvent> ring_buffer_;
  size_t ring_head_{0};
};

EngineStats& global_engine_stats();

void emit_execution_event(const ExecutionEvent& ev);
void emit_judge_event(const JudgeEvent& ev);

std::string execution_event_to_json(const ExecutionEvent& ev);
std::string judge_event_to_json(const JudgeEvent& ev);

// Hooks replace the JSONL file sink. Pass nullptr to uninstall.
using ExecutionEventHook = void (*)(const ExecutionEvent&);
using JudgeEventHook = void (*)(const JudgeEvent&);
void set_execution_event_hook(ExecutionEventHook hook);
void set_judge_event_hook(JudgeEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace judgebox
