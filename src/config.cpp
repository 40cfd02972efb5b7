#include "judgebox/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

#include "judgebox/jsonlite.hpp"

namespace judgebox {

namespace {

constexpr std::uint64_t kMinMemoryBytes = 16ull << 20;
constexpr std::uint64_t kMaxWallTimeoutMs = 10ull * 60 * 1000;

std::string env_string(const char* name, const std::string& def) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : def;
}

// Unparseable values keep the default.
std::uint64_t env_u64(const char* name, std::uint64_t def) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return def;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (errno != 0 || end == e || *end != '\0' || e[0] == '-') return def;
  return static_cast<std::uint64_t>(v);
}

bool valid_memory_limit(std::uint64_t v) { return v >= kMinMemoryBytes; }
bool valid_pids_limit(std::uint64_t v) {
  return v > 0 && v <= std::numeric_limits<std::uint32_t>::max();
}
bool valid_workers(std::uint64_t v) { return v <= std::numeric_limits<std::uint32_t>::max(); }
bool valid_max_output(std::uint64_t v) {
  return v > 0 && v <= std::numeric_limits<std::size_t>::max();
}

bool valid_unit_prefix(const std::string& prefix) {
  if (prefix.empty()) return false;
  for (char ch : prefix) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '-' || ch == '_';
    if (!ok) return false;
  }
  return true;
}

// Values rejected by the predicate keep the default, like unparseable ones.
std::uint64_t env_u64_checked(const char* name, std::uint64_t def, bool (*valid)(std::uint64_t)) {
  const std::uint64_t v = env_u64(name, def);
  return valid(v) ? v : def;
}

JudgeConfig g_config;
std::once_flag g_config_once;
std::mutex g_config_mu;
bool g_config_explicit{false};

}  // namespace

JudgeConfig JudgeConfig::from_env() {
  JudgeConfig c;
  c.docker_bin = env_string("JUDGEBOX_DOCKER_BIN", c.docker_bin);
  c.memory_limit_bytes =
      env_u64_checked("JUDGEBOX_MEMORY_LIMIT_BYTES", c.memory_limit_bytes, valid_memory_limit);
  c.pids_limit = static_cast<std::uint32_t>(
      env_u64_checked("JUDGEBOX_PIDS_LIMIT", c.pids_limit, valid_pids_limit));
  c.wall_timeout_ms = env_u64("JUDGEBOX_WALL_TIMEOUT_MS", c.wall_timeout_ms);
  c.max_output_bytes = static_cast<std::size_t>(
      env_u64_checked("JUDGEBOX_MAX_OUTPUT_BYTES", c.max_output_bytes, valid_max_output));
  c.tasks_dir = env_string("JUDGEBOX_TASKS_DIR", c.tasks_dir);
  c.scratch_dir = env_string("JUDGEBOX_SCRATCH_DIR", c.scratch_dir);
  c.workers = static_cast<std::uint32_t>(
      env_u64_checked("JUDGEBOX_WORKERS", c.workers, valid_workers));
  const std::string prefix = env_string("JUDGEBOX_UNIT_PREFIX", c.unit_prefix);
  if (valid_unit_prefix(prefix)) c.unit_prefix = prefix;
  return c;
}

std::uint32_t JudgeConfig::effective_workers() const {
  if (workers > 0) return workers;
  const unsigned hc = std::thread::hardware_concurrency();
  return hc > 0 ? hc : 1;
}

std::string JudgeConfig::effective_scratch_dir() const {
  if (!scratch_dir.empty()) return scratch_dir;
  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  return ec ? std::string("/tmp") : tmp.string();
}

const JudgeConfig& init_config(const JudgeConfig& cfg) {
  std::lock_guard<std::mutex> lk(g_config_mu);
  g_config = cfg;
  g_config_explicit = true;
  return g_config;
}

const JudgeConfig& global_config() {
  std::call_once(g_config_once, [] {
    std::lock_guard<std::mutex> lk(g_config_mu);
    if (!g_config_explicit) g_config = JudgeConfig::from_env();
  });
  return g_config;
}

std::string config_to_json(const JudgeConfig& cfg) {
  jsonlite::Object o;
  o["docker_bin"] = cfg.docker_bin;
  o["memory_limit_bytes"] = cfg.memory_limit_bytes;
  o["pids_limit"] = static_cast<std::uint64_t>(cfg.pids_limit);
  o["wall_timeout_ms"] = cfg.wall_timeout_ms;
  o["max_output_bytes"] = static_cast<std::uint64_t>(cfg.max_output_bytes);
  o["tasks_dir"] = cfg.tasks_dir;
  o["scratch_dir"] = cfg.effective_scratch_dir();
  o["workers"] = static_cast<std::uint64_t>(cfg.effective_workers());
  o["unit_prefix"] = cfg.unit_prefix;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back("json_parse_error: " + err->message);
    return r;
  }

  static const std::set<std::string> kStringKeys = {"docker_bin", "tasks_dir", "scratch_dir",
                                                    "unit_prefix"};
  static const std::set<std::string> kNumberKeys = {"memory_limit_bytes", "pids_limit",
                                                    "wall_timeout_ms", "max_output_bytes",
                                                    "workers"};

  for (const auto& [key, value] : obj) {
    if (kStringKeys.count(key)) {
      if (!std::holds_alternative<std::string>(value.v)) {
        r.errors.push_back(key + ": expected string");
      }
    } else if (kNumberKeys.count(key)) {
      if (!std::holds_alternative<std::uint64_t>(value.v)) {
        r.errors.push_back(key + ": expected non-negative integer");
      }
    } else {
      r.warnings.push_back("unknown key: " + key);
    }
  }

  auto str_of = [&](const char* key) { return jsonlite::get_string(obj, key, "x"); };
  if (str_of("docker_bin").empty()) r.errors.push_back("docker_bin: must not be empty");
  if (str_of("tasks_dir").empty()) r.errors.push_back("tasks_dir: must not be empty");

  if (!valid_unit_prefix(jsonlite::get_string(obj, "unit_prefix", "judgebox"))) {
    r.errors.push_back("unit_prefix: must be non-empty [A-Za-z0-9_-]");
  }

  if (obj.count("memory_limit_bytes") &&
      !valid_memory_limit(jsonlite::get_u64(obj, "memory_limit_bytes", kMinMemoryBytes))) {
    r.errors.push_back("memory_limit_bytes: below 16 MiB minimum");
  }
  if (obj.count("pids_limit") && !valid_pids_limit(jsonlite::get_u64(obj, "pids_limit", 1))) {
    r.errors.push_back("pids_limit: must be in [1, 4294967295]");
  }
  if (obj.count("max_output_bytes") &&
      !valid_max_output(jsonlite::get_u64(obj, "max_output_bytes", 1))) {
    r.errors.push_back("max_output_bytes: must be positive");
  }
  if (obj.count("wall_timeout_ms")) {
    const auto ms = jsonlite::get_u64(obj, "wall_timeout_ms", 1);
    if (ms == 0) {
      r.warnings.push_back("wall_timeout_ms: 0 disables the wall-clock limit");
    } else if (ms > kMaxWallTimeoutMs) {
      r.warnings.push_back("wall_timeout_ms: exceeds 10 minutes");
    }
  }

  r.ok = r.errors.empty();
  return r;
}

}  // namespace judgebox
