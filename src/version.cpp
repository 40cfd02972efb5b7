#include "judgebox/version.hpp"

#include "judgebox/jsonlite.hpp"

namespace judgebox {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? "0.1.0" : semver;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["semver"] = m.semver;
  o["judge_result_format"] = static_cast<std::uint64_t>(m.judge_result_format);
  o["task_format"] = static_cast<std::uint64_t>(m.task_format);
  o["event_log"] = static_cast<std::uint64_t>(m.event_log);
  o["hash_algorithm"] = static_cast<std::uint64_t>(m.hash_algorithm);
  o["hash_primitive"] = m.hash_primitive;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace version
}  // namespace judgebox
