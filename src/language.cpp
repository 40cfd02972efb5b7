#include "judgebox/language.hpp"

namespace judgebox {

std::optional<LanguageDescriptor> lookup_language(Language language) {
  // No default case: -Wswitch reports a Language without a descriptor.
  switch (language) {
    case Language::python:
      return LanguageDescriptor{Language::python, "python", "python:3.12-slim", ".py",
                                "python Main.py < input.txt"};
    case Language::javascript:
      return LanguageDescriptor{Language::javascript, "javascript", "node:22-alpine", ".js",
                                "node Main.js < input.txt"};
    case Language::java:
      return LanguageDescriptor{Language::java, "java", "openjdk:21-slim", ".java",
                                "javac Main.java && java Main < input.txt"};
    case Language::cpp:
      return LanguageDescriptor{Language::cpp, "cpp", "gcc:14", ".cpp",
                                "g++ Main.cpp -O2 -std=c++20 -o Main && ./Main < input.txt"};
  }
  return std::nullopt;
}

std::optional<Language> parse_language(std::string_view name) {
  for (Language l : kAllLanguages) {
    const auto d = lookup_language(l);
    if (d && d->name == name) return l;
  }
  return std::nullopt;
}

std::string to_string(Language language) {
  const auto d = lookup_language(language);
  return d ? std::string(d->name) : std::string();
}

std::string source_filename(Language language) {
  const auto d = lookup_language(language);
  if (!d) return {};
  std::string out(kSourceStem);
  out += d->extension;
  return out;
}

}  // namespace judgebox
