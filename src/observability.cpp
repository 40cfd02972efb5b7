#include "judgebox/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "judgebox/jsonlite.hpp"

namespace judgebox {

namespace {

// bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Midpoint of [2^(i-1), 2^i) us; bucket 0 -> 0.5us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  append_fixed(out, "%.3f", mean_us() / 1000.0);
  out += ",\"p50_ms\":";
  append_fixed(out, "%.3f", percentile(0.50) / 1000.0);
  out += ",\"p95_ms\":";
  append_fixed(out, "%.3f", percentile(0.95) / 1000.0);
  out += ",\"p99_ms\":";
  append_fixed(out, "%.3f", percentile(0.99) / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_execution(const ExecutionEvent& ev) {
  total_runs.fetch_add(1, std::memory_order_relaxed);
  if (!ev.error_code.empty()) {
    infrastructure_errors.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.exit_code != 0) {
    nonzero_exits.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.timed_out) timeouts.fetch_add(1, std::memory_order_relaxed);
  if (ev.oom_killed) oom_kills.fetch_add(1, std::memory_order_relaxed);
  if (!ev.teardown_ok) teardown_failures.fetch_add(1, std::memory_order_relaxed);
  run_latency.record(ev.duration_ns);
}

void EngineStats::record_judgement(const JudgeEvent& ev) {
  total_evaluations.fetch_add(1, std::memory_order_relaxed);
  if (!ev.error_code.empty()) {
    rejected_evaluations.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.passed) {
    passed_evaluations.fetch_add(1, std::memory_order_relaxed);
  }
  evaluate_latency.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

std::vector<JudgeEvent> EngineStats::recent_judgements_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Full: oldest entry sits at ring_head_.
  std::vector<JudgeEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

void EngineStats::reset() {
  for (auto* c : {&units_created, &units_destroyed, &teardown_failures, &total_runs,
                  &nonzero_exits, &timeouts, &oom_kills, &infrastructure_errors,
                  &total_evaluations, &passed_evaluations, &rejected_evaluations}) {
    c->store(0, std::memory_order_relaxed);
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string EngineStats::to_json() const {
  auto n = [](const std::atomic<std::uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  std::string out;
  out.reserve(768);
  out += "{\"units\":{\"created\":";
  out += n(units_created);
  out += ",\"destroyed\":";
  out += n(units_destroyed);
  out += ",\"teardown_failures\":";
  out += n(teardown_failures);
  out += "},\"runs\":{\"total\":";
  out += n(total_runs);
  out += ",\"nonzero_exits\":";
  out += n(nonzero_exits);
  out += ",\"timeouts\":";
  out += n(timeouts);
  out += ",\"oom_kills\":";
  out += n(oom_kills);
  out += ",\"infrastructure_errors\":";
  out += n(infrastructure_errors);
  out += ",\"latency\":";
  out += run_latency.to_json();
  out += "},\"evaluations\":{\"total\":";
  out += n(total_evaluations);
  out += ",\"passed\":";
  out += n(passed_evaluations);
  out += ",\"rejected\":";
  out += n(rejected_evaluations);
  out += ",\"latency\":";
  out += evaluate_latency.to_json();
  out += "}}";
  return out;
}

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Serialization + emission
// ---------------------------------------------------------------------------

std::string execution_event_to_json(const ExecutionEvent& ev) {
  jsonlite::Object o;
  o["type"] = "run";
  o["unit_name"] = ev.unit_name;
  o["language"] = ev.language;
  o["source_digest"] = ev.source_digest;
  o["stdout_digest"] = ev.stdout_digest;
  o["stderr_digest"] = ev.stderr_digest;
  o["duration_ns"] = ev.duration_ns;
  o["elapsed_ms"] = ev.elapsed_ms;
  o["exit_code"] = jsonlite::integer(ev.exit_code);
  o["timed_out"] = ev.timed_out;
  o["oom_killed"] = ev.oom_killed;
  o["teardown_ok"] = ev.teardown_ok;
  o["error_code"] = ev.error_code;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::string judge_event_to_json(const JudgeEvent& ev) {
  jsonlite::Object o;
  o["type"] = "evaluate";
  o["task_id"] = ev.task_id;
  o["language"] = ev.language;
  o["source_digest"] = ev.source_digest;
  o["duration_ns"] = ev.duration_ns;
  o["visible_total"] = static_cast<std::uint64_t>(ev.visible_total);
  o["visible_passed"] = static_cast<std::uint64_t>(ev.visible_passed);
  o["hidden_total"] = static_cast<std::uint64_t>(ev.hidden_total);
  o["hidden_passed"] = static_cast<std::uint64_t>(ev.hidden_passed);
  o["infrastructure_failures"] = static_cast<std::uint64_t>(ev.infrastructure_failures);
  o["max_elapsed_ms"] = ev.max_elapsed_ms;
  o["passed"] = ev.passed;
  o["error_code"] = ev.error_code;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

namespace {
std::atomic<ExecutionEventHook> g_execution_hook{nullptr};
std::atomic<JudgeEventHook> g_judge_hook{nullptr};
std::mutex g_sink_mu;

void append_to_event_log(const std::string& json) {
  // Activation: JUDGEBOX_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("JUDGEBOX_EVENT_LOG");
  if (!log_path || !log_path[0]) return;
  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(json.data(), 1, json.size(), f);
    std::fputc('\n', f);
    std::fclose(f);
  }
}
}  // namespace

void set_execution_event_hook(ExecutionEventHook hook) {
  g_execution_hook.store(hook, std::memory_order_release);
}

void set_judge_event_hook(JudgeEventHook hook) {
  g_judge_hook.store(hook, std::memory_order_release);
}

void emit_execution_event(const ExecutionEvent& ev) {
  global_engine_stats().record_execution(ev);
  if (ExecutionEventHook hook = g_execution_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }
  append_to_event_log(execution_event_to_json(ev));
}

void emit_judge_event(const JudgeEvent& ev) {
  global_engine_stats().record_judgement(ev);
  if (JudgeEventHook hook = g_judge_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }
  append_to_event_log(judge_event_to_json(ev));
}

}  // namespace judgebox
