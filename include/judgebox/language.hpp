#pragma once

// judgebox/language.hpp: Static catalog of supported submission languages.
//
// CATALOG CONTRACT:
//   Every Language value maps to exactly one LanguageDescriptor via an
//   exhaustive switch in language.cpp. Adding a language means adding one
//   enumerator and one case; -Wswitch flags any missing case at compile time.
//   The table is compiled in and never mutated at runtime.
//
// COMMAND TEMPLATE:
//   Executed as `sh -c <command>` inside the execution unit. The working
//   directory is kSandboxWorkdir, the submission lives in
//   kSourceStem + extension and stdin comes from kInputFilename.

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace judgebox {

enum class Language {
  python,
  javascript,
  java,
  cpp,
};

inline constexpr std::array<Language, 4> kAllLanguages{
    Language::python, Language::javascript, Language::java, Language::cpp};

inline constexpr std::string_view kSandboxWorkdir = "/workspace";
inline constexpr std::string_view kSourceStem = "Main";
inline constexpr std::string_view kInputFilename = "input.txt";

struct LanguageDescriptor {
  Language id;
  std::string_view name;       // wire identifier, e.g. "python"
  std::string_view image;      // execution image reference
  std::string_view extension;  // includes the leading dot
  std::string_view command;    // shell command template
};

// Descriptor lookup. Tolerates values outside the enumerator set (e.g. a
// static_cast from an untrusted integer) by returning nullopt.
std::optional<LanguageDescriptor> lookup_language(Language language);

// Parse a wire identifier ("python", "javascript", "java", "cpp").
// Returns nullopt for anything not in the catalog.
std::optional<Language> parse_language(std::string_view name);

// Empty string for values outside the catalog.
std::string to_string(Language language);

// "Main.py", "Main.java", ... Empty string for values outside the catalog.
std::string source_filename(Language language);

}  // namespace judgebox
