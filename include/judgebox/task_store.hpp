#pragma once

// judgebox/task_store.hpp: Task id -> TaskTestSuite resolution.
//
// Task file shape (FileTaskStore, <root>/<task_id>.json):
//   {"id":"two_sum","title":"...","tests":{
//      "visible":[{"input":"...","output":"..."}],
//      "hidden":[{"input":"...","output":"..."}]}}
// Fields other than "tests" are ignored. A missing "visible" or "hidden"
// array is an empty category.
//
// Task ids are restricted to [A-Za-z0-9_-]{1,128}; anything else never
// reaches the filesystem and is reported as not found.

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "judgebox/types.hpp"

namespace judgebox {

struct TaskLoadResult {
  std::optional<TaskTestSuite> suite;
  ErrorCode error_code{ErrorCode::none};  // task_not_found | task_invalid
  std::string error_detail;

  bool ok() const { return suite.has_value(); }
};

class ITaskStore {
 public:
  virtual ~ITaskStore() = default;

  // nullopt when the id is unknown or the task cannot be used.
  std::optional<TaskTestSuite> load(const std::string& task_id) { return fetch(task_id).suite; }

  // Same lookup with the reason for a miss.
  virtual TaskLoadResult fetch(const std::string& task_id) = 0;
};

bool is_valid_task_id(const std::string& task_id);

// Parse one task document. The suite carries the requested task_id, not the
// document's "id" field.
TaskLoadResult parse_task_json(const std::string& task_id, const std::string& json);

class FileTaskStore : public ITaskStore {
 public:
  explicit FileTaskStore(std::string root);

  TaskLoadResult fetch(const std::string& task_id) override;

  const std::string& root() const { return root_; }

 private:
  std::string root_;
};

class InMemoryTaskStore : public ITaskStore {
 public:
  void put(TaskTestSuite suite);

  TaskLoadResult fetch(const std::string& task_id) override;

 private:
  std::mutex mu_;
  std::map<std::string, TaskTestSuite> suites_;
};

}  // namespace judgebox
