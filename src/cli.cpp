#include <fstream>
#include <future>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "judgebox/config.hpp"
#include "judgebox/hash.hpp"
#include "judgebox/judge.hpp"
#include "judgebox/jsonlite.hpp"
#include "judgebox/language.hpp"
#include "judgebox/observability.hpp"
#include "judgebox/runner.hpp"
#include "judgebox/task_store.hpp"
#include "judgebox/version.hpp"
#include "judgebox/worker_pool.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.1.0"
#endif

namespace {

using judgebox::kExitError;
using judgebox::kExitNegative;
using judgebox::kExitOk;

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return std::nullopt;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

int fail(const std::string &code, const std::string &detail) {
  judgebox::jsonlite::Object err;
  err["code"] = code;
  err["detail"] = detail;
  judgebox::jsonlite::Object o;
  o["error"] = std::move(err);
  std::cerr << judgebox::jsonlite::to_json(judgebox::jsonlite::Value{std::move(o)})
            << "\n";
  return kExitError;
}

int usage() {
  std::cerr << "usage: judgebox <command> [options]\n"
               "  health\n"
               "  languages\n"
               "  version\n"
               "  run --language L (--code S | --code-file F) [--input S | --input-file F]\n"
               "  judge --language L (--code S | --code-file F) --task ID [--task ID ...]\n"
               "        [--tasks-dir D]\n"
               "  config show\n"
               "  config validate --file F\n"
               "  stats --events F\n";
  return kExitError;
}

struct Options {
  std::string language;
  std::optional<std::string> code;
  std::string code_file;
  std::string input;
  std::string input_file;
  std::vector<std::string> tasks;
  std::string tasks_dir;
  std::string file;
  std::string events;
};

bool parse_options(int argc, char **argv, int first, Options *opts,
                   std::string *error) {
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    auto value = [&](std::string *out) {
      if (i + 1 >= argc) {
        *error = "missing value for " + arg;
        return false;
      }
      *out = argv[++i];
      return true;
    };
    bool ok = true;
    if (arg == "--language") {
      ok = value(&opts->language);
    } else if (arg == "--code") {
      std::string s;
      ok = value(&s);
      opts->code = std::move(s);
    } else if (arg == "--code-file") {
      ok = value(&opts->code_file);
    } else if (arg == "--input") {
      ok = value(&opts->input);
    } else if (arg == "--input-file") {
      ok = value(&opts->input_file);
    } else if (arg == "--task") {
      std::string s;
      ok = value(&s);
      opts->tasks.push_back(std::move(s));
    } else if (arg == "--tasks-dir") {
      ok = value(&opts->tasks_dir);
    } else if (arg == "--file") {
      ok = value(&opts->file);
    } else if (arg == "--events") {
      ok = value(&opts->events);
    } else {
      *error = "unknown option " + arg;
      return false;
    }
    if (!ok)
      return false;
  }
  return true;
}

// Resolves --code / --code-file. False when neither yields source text.
bool load_code(const Options &opts, std::string *code) {
  if (opts.code) {
    *code = *opts.code;
    return true;
  }
  if (opts.code_file.empty())
    return false;
  auto text = read_file(opts.code_file);
  if (!text)
    return false;
  *code = std::move(*text);
  return true;
}

judgebox::ExecutionEvent execution_event_from_json(const judgebox::jsonlite::Object &o) {
  namespace jl = judgebox::jsonlite;
  judgebox::ExecutionEvent ev;
  ev.unit_name = jl::get_string(o, "unit_name");
  ev.language = jl::get_string(o, "language");
  ev.duration_ns = jl::get_u64(o, "duration_ns");
  ev.elapsed_ms = jl::get_double(o, "elapsed_ms");
  ev.exit_code = static_cast<int>(jl::get_double(o, "exit_code"));
  ev.timed_out = jl::get_bool(o, "timed_out");
  ev.oom_killed = jl::get_bool(o, "oom_killed");
  ev.teardown_ok = jl::get_bool(o, "teardown_ok", true);
  ev.error_code = jl::get_string(o, "error_code");
  return ev;
}

judgebox::JudgeEvent judge_event_from_json(const judgebox::jsonlite::Object &o) {
  namespace jl = judgebox::jsonlite;
  judgebox::JudgeEvent ev;
  ev.task_id = jl::get_string(o, "task_id");
  ev.language = jl::get_string(o, "language");
  ev.duration_ns = jl::get_u64(o, "duration_ns");
  ev.passed = jl::get_bool(o, "passed");
  ev.error_code = jl::get_string(o, "error_code");
  return ev;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2)
    return usage();
  const std::string cmd = argv[1];
  const judgebox::JudgeConfig &config = judgebox::global_config();

  if (cmd == "health") {
    const auto h = judgebox::hash_runtime_info();
    judgebox::ContainerRunner runner(config);
    const bool available = runner.available();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_available\":"
              << (h.blake3_available ? "true" : "false")
              << ",\"backend\":\"" << runner.backend_id()
              << "\",\"platform_available\":"
              << (available ? "true" : "false")
              << ",\"config\":" << judgebox::config_to_json(config) << "}\n";
    return available ? kExitOk : kExitNegative;
  }

  if (cmd == "languages") {
    judgebox::jsonlite::Array list;
    for (judgebox::Language l : judgebox::kAllLanguages) {
      const auto d = judgebox::lookup_language(l);
      if (!d)
        continue;
      judgebox::jsonlite::Object o;
      o["name"] = std::string(d->name);
      o["image"] = std::string(d->image);
      o["source_file"] = judgebox::source_filename(l);
      o["command"] = std::string(d->command);
      list.push_back(judgebox::jsonlite::Value{std::move(o)});
    }
    std::cout << judgebox::jsonlite::to_json(judgebox::jsonlite::Value{std::move(list)})
              << "\n";
    return kExitOk;
  }

  if (cmd == "version") {
    std::cout << judgebox::version::manifest_to_json(
                     judgebox::version::current_manifest(PROJECT_VERSION))
              << "\n";
    return kExitOk;
  }

  if (cmd == "config") {
    if (argc >= 3 && std::string(argv[2]) == "show") {
      std::cout << judgebox::config_to_json(config) << "\n";
      return kExitOk;
    }
    if (argc < 3 || std::string(argv[2]) != "validate")
      return usage();
    Options opts;
    std::string error;
    if (!parse_options(argc, argv, 3, &opts, &error))
      return fail("usage", error);
    auto text = read_file(opts.file);
    if (!text)
      return fail("config_invalid", "cannot read " + opts.file);
    const auto r = judgebox::validate_config(*text);
    judgebox::jsonlite::Array errors(r.errors.begin(), r.errors.end());
    judgebox::jsonlite::Array warnings(r.warnings.begin(), r.warnings.end());
    judgebox::jsonlite::Object o;
    o["ok"] = r.ok;
    o["errors"] = std::move(errors);
    o["warnings"] = std::move(warnings);
    std::cout << judgebox::jsonlite::to_json(judgebox::jsonlite::Value{std::move(o)})
              << "\n";
    return r.ok ? kExitOk : kExitNegative;
  }

  if (cmd == "run") {
    Options opts;
    std::string error;
    if (!parse_options(argc, argv, 2, &opts, &error))
      return fail("usage", error);
    const auto lang = judgebox::parse_language(opts.language);
    if (!lang)
      return fail(judgebox::to_string(judgebox::ErrorCode::unsupported_language),
                  "unsupported language: " + opts.language);
    judgebox::ExecutionRequest req;
    req.language = *lang;
    if (!load_code(opts, &req.code))
      return fail("usage", "--code or a readable --code-file is required");
    req.stdin_data = opts.input;
    if (!opts.input_file.empty()) {
      auto text = read_file(opts.input_file);
      if (!text)
        return fail("usage", "cannot read " + opts.input_file);
      req.stdin_data = std::move(*text);
    }
    judgebox::ContainerRunner runner(config);
    const auto result = runner.run(req);
    std::cout << judgebox::execution_result_to_json(result) << "\n";
    return result.infrastructure_failed() ? kExitNegative : kExitOk;
  }

  if (cmd == "judge") {
    Options opts;
    std::string error;
    if (!parse_options(argc, argv, 2, &opts, &error))
      return fail("usage", error);
    if (opts.tasks.empty())
      return fail("usage", "--task is required");
    std::string code;
    if (!load_code(opts, &code))
      return fail("usage", "--code or a readable --code-file is required");

    judgebox::ContainerRunner runner(config);
    judgebox::FileTaskStore store(opts.tasks_dir.empty() ? config.tasks_dir
                                                         : opts.tasks_dir);
    judgebox::SubmissionJudge judge(runner, store);

    // One line per task, in --task order.
    std::vector<std::future<judgebox::JudgeResult>> pending;
    int rc = kExitOk;
    {
      judgebox::WorkerPool pool(config.effective_workers());
      for (const auto &task : opts.tasks)
        pending.push_back(judge.evaluate_async(pool, code, opts.language, task));
      for (auto &f : pending) {
        const auto result = f.get();
        std::cout << judgebox::judge_result_to_json(result) << "\n";
        // Across tasks an error outranks a negative verdict.
        const int status = judgebox::judge_exit_status(result);
        if (status == kExitError || (status == kExitNegative && rc == kExitOk))
          rc = status;
      }
    }
    return rc;
  }

  if (cmd == "stats") {
    Options opts;
    std::string error;
    if (!parse_options(argc, argv, 2, &opts, &error))
      return fail("usage", error);
    std::ifstream ifs(opts.events);
    if (!ifs)
      return fail("usage", "cannot read event log " + opts.events);
    auto &stats = judgebox::global_engine_stats();
    std::uint64_t skipped = 0;
    std::string line;
    while (std::getline(ifs, line)) {
      if (line.empty())
        continue;
      std::optional<judgebox::jsonlite::JsonError> err;
      const auto obj = judgebox::jsonlite::parse(line, &err);
      const std::string type = judgebox::jsonlite::get_string(obj, "type");
      if (err) {
        ++skipped;
      } else if (type == "run") {
        stats.record_execution(execution_event_from_json(obj));
      } else if (type == "evaluate") {
        stats.record_judgement(judge_event_from_json(obj));
      } else {
        ++skipped;
      }
    }
    std::cout << "{\"stats\":" << stats.to_json()
              << ",\"skipped_lines\":" << skipped << "}\n";
    return kExitOk;
  }

  return usage();
}
