#include "judgebox/task_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "judgebox/jsonlite.hpp"

namespace judgebox {

namespace {

constexpr std::size_t kMaxTaskIdLength = 128;

TaskLoadResult failure(ErrorCode code, std::string detail) {
  TaskLoadResult r;
  r.error_code = code;
  r.error_detail = std::move(detail);
  return r;
}

bool parse_cases(const jsonlite::Object& tests, const char* category, std::vector<TestCase>* out,
                 std::string* error) {
  auto it = tests.find(category);
  if (it == tests.end()) return true;
  const auto* arr = std::get_if<jsonlite::Array>(&it->second.v);
  if (!arr) {
    *error = std::string("tests.") + category + ": expected array";
    return false;
  }
  out->reserve(arr->size());
  for (std::size_t i = 0; i < arr->size(); ++i) {
    const auto* obj = std::get_if<jsonlite::Object>(&(*arr)[i].v);
    const std::string where = std::string("tests.") + category + "[" + std::to_string(i) + "]";
    if (!obj) {
      *error = where + ": expected object";
      return false;
    }
    auto in = obj->find("input");
    auto exp = obj->find("output");
    if (in == obj->end() || !std::holds_alternative<std::string>(in->second.v) ||
        exp == obj->end() || !std::holds_alternative<std::string>(exp->second.v)) {
      *error = where + ": \"input\" and \"output\" must be strings";
      return false;
    }
    out->push_back(TestCase{std::get<std::string>(in->second.v),
                            std::get<std::string>(exp->second.v)});
  }
  return true;
}

}  // namespace

bool is_valid_task_id(const std::string& task_id) {
  if (task_id.empty() || task_id.size() > kMaxTaskIdLength) return false;
  for (char c : task_id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

TaskLoadResult parse_task_json(const std::string& task_id, const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object doc = jsonlite::parse(json, &err);
  if (err) {
    return failure(ErrorCode::task_invalid, err->code + ": " + err->message);
  }
  const jsonlite::Object* tests = jsonlite::get_object(doc, "tests");
  if (!tests) {
    return failure(ErrorCode::task_invalid, "missing \"tests\" object");
  }

  TaskTestSuite suite;
  suite.task_id = task_id;
  std::string error;
  if (!parse_cases(*tests, "visible", &suite.visible, &error) ||
      !parse_cases(*tests, "hidden", &suite.hidden, &error)) {
    return failure(ErrorCode::task_invalid, error);
  }

  TaskLoadResult r;
  r.suite = std::move(suite);
  return r;
}

FileTaskStore::FileTaskStore(std::string root) : root_(std::move(root)) {}

TaskLoadResult FileTaskStore::fetch(const std::string& task_id) {
  if (!is_valid_task_id(task_id)) {
    return failure(ErrorCode::task_not_found, "invalid task id");
  }
  const std::filesystem::path path = std::filesystem::path(root_) / (task_id + ".json");
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return failure(ErrorCode::task_not_found, "no task " + task_id);
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return failure(ErrorCode::task_invalid, "cannot open " + path.string());
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return parse_task_json(task_id, ss.str());
}

void InMemoryTaskStore::put(TaskTestSuite suite) {
  std::lock_guard<std::mutex> lk(mu_);
  std::string id = suite.task_id;
  suites_[id] = std::move(suite);
}

TaskLoadResult InMemoryTaskStore::fetch(const std::string& task_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = suites_.find(task_id);
  if (it == suites_.end()) {
    return failure(ErrorCode::task_not_found, "no task " + task_id);
  }
  TaskLoadResult r;
  r.suite = it->second;
  return r;
}

}  // namespace judgebox
