#include "judgebox/jsonlite.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace judgebox::jsonlite {

namespace {

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Recursive-descent reader. The first error wins; every read_* returns a
// placeholder once error_ is set and callers unwind.
class Reader {
 public:
  explicit Reader(std::string_view text) : text_(text) {}

  Value read_document() {
    Value v = read_value();
    skip_ws();
    if (!error_ && pos_ != text_.size()) fail("json_parse_error", "trailing data");
    return v;
  }

  const std::optional<JsonError>& error() const { return error_; }

  void fail(const char* code, const std::string& message) {
    if (error_) return;
    error_ = JsonError{code, message + " at offset " + std::to_string(pos_)};
  }

 private:
  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  void skip_ws() {
    while (!at_end()) {
      const char c = text_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++pos_;
    }
  }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  bool consume_word(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) return false;
    pos_ += word.size();
    return true;
  }

  Value read_value() {
    skip_ws();
    if (at_end()) {
      fail("json_parse_error", "unexpected end of input");
      return {};
    }
    switch (peek()) {
      case '{': return read_object();
      case '[': return read_array();
      case '"': return read_string();
      case 't':
        if (consume_word("true")) return Value{true};
        break;
      case 'f':
        if (consume_word("false")) return Value{false};
        break;
      case 'n':
        if (consume_word("null")) return Value{nullptr};
        break;
      default:
        if (peek() == '-' || is_digit(peek())) return read_number();
        break;
    }
    fail("json_parse_error", "unexpected token");
    return {};
  }

  Value read_object() {
    ++pos_;  // '{'
    if (++depth_ > kMaxDepth) {
      fail("json_parse_error", "nesting too deep");
      return {};
    }
    Object out;
    if (!consume('}')) {
      while (!error_) {
        skip_ws();
        if (peek() != '"') {
          fail("json_parse_error", "expected string key");
          break;
        }
        std::string key = read_raw_string();
        if (error_) break;
        if (out.count(key)) {
          fail("json_duplicate_key", "duplicate key \"" + key + "\"");
          break;
        }
        if (!consume(':')) {
          fail("json_parse_error", "expected ':'");
          break;
        }
        Value member = read_value();
        if (error_) break;
        out.emplace(std::move(key), std::move(member));
        if (consume('}')) break;
        if (!consume(',')) fail("json_parse_error", "expected ',' or '}'");
      }
    }
    --depth_;
    return Value{std::move(out)};
  }

  Value read_array() {
    ++pos_;  // '['
    if (++depth_ > kMaxDepth) {
      fail("json_parse_error", "nesting too deep");
      return {};
    }
    Array out;
    if (!consume(']')) {
      while (!error_) {
        out.push_back(read_value());
        if (error_) break;
        if (consume(']')) break;
        if (!consume(',')) fail("json_parse_error", "expected ',' or ']'");
      }
    }
    --depth_;
    return Value{std::move(out)};
  }

  Value read_string() { return Value{read_raw_string()}; }

  bool read_hex4(std::uint32_t* out) {
    if (pos_ + 4 > text_.size()) return false;
    std::uint32_t v = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = text_[pos_++];
      v <<= 4;
      if (is_digit(c)) {
        v |= static_cast<std::uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        v |= static_cast<std::uint32_t>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        v |= static_cast<std::uint32_t>(c - 'A' + 10);
      } else {
        return false;
      }
    }
    *out = v;
    return true;
  }

  // Positioned on the opening quote.
  std::string read_raw_string() {
    ++pos_;
    std::string out;
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "raw control character in string");
        return {};
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!read_hex4(&cp)) {
            fail("json_parse_error", "invalid \\u escape");
            return {};
          }
          if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("json_parse_error", "unpaired low surrogate");
            return {};
          }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            std::uint32_t lo = 0;
            if (!consume_word("\\u") || !read_hex4(&lo) || lo < 0xDC00 || lo > 0xDFFF) {
              fail("json_parse_error", "unpaired high surrogate");
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(out, cp);
          break;
        }
        default:
          fail("json_parse_error", std::string("invalid escape \\") + esc);
          return {};
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  Value read_number() {
    const std::size_t start = pos_;
    bool integral = true;
    if (peek() == '-') {
      integral = false;
      ++pos_;
    }
    if (!is_digit(peek())) {
      fail("json_parse_error", "invalid number");
      return {};
    }
    if (peek() == '0') {
      ++pos_;
      if (is_digit(peek())) {
        fail("json_parse_error", "leading zero");
        return {};
      }
    } else {
      while (is_digit(peek())) ++pos_;
    }
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "digit expected after '.'");
        return {};
      }
      while (is_digit(peek())) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "digit expected in exponent");
        return {};
      }
      while (is_digit(peek())) ++pos_;
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    if (integral) {
      std::uint64_t n = 0;
      const auto [ptr, ec] = std::from_chars(first, last, n);
      if (ec != std::errc() || ptr != last) {
        fail("json_parse_error", "integer out of range");
        return {};
      }
      return Value{n};
    }
    double d = 0.0;
    const auto [ptr, ec] = std::from_chars(first, last, d);
    if (ec != std::errc() || ptr != last || !std::isfinite(d)) {
      fail("json_parse_error", "number out of range");
      return {};
    }
    return Value{d};
  }

  std::string_view text_;
  std::size_t pos_{0};
  std::size_t depth_{0};
  std::optional<JsonError> error_;
};

// Length of the well-formed UTF-8 sequence starting at s[i] (Unicode Table
// 3-7), or 0 when the bytes there are ill-formed.
std::size_t utf8_sequence_length(const std::string& s, std::size_t i) {
  const auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
  const unsigned char b0 = byte(i);
  std::size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0) lo = 0xA0;  // overlong
    if (b0 == 0xED) hi = 0x9F;  // surrogates
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0) lo = 0x90;  // overlong
    if (b0 == 0xF4) hi = 0x8F;  // above U+10FFFF
  } else {
    return 0;
  }
  if (i + len > s.size()) return 0;
  if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
  for (std::size_t k = 2; k < len; ++k) {
    if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
  }
  return len;
}

// Ill-formed UTF-8 (candidate output is arbitrary bytes) is replaced byte by
// byte with U+FFFD so the document stays valid JSON.
void write_string(std::string& out, const std::string& s) {
  out += '"';
  std::size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (static_cast<unsigned char>(c) >= 0x80) {
      const std::size_t len = utf8_sequence_length(s, i);
      if (len == 0) {
        out += "\\ufffd";
        ++i;
      } else {
        out.append(s, i, len);
        i += len;
      }
      continue;
    }
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
    ++i;
  }
  out += '"';
}

void write_value(std::string& out, const Value& value) {
  std::visit(
      [&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
          out += std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
          out += format_double(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          write_string(out, x);
        } else if constexpr (std::is_same_v<T, Array>) {
          out += '[';
          for (std::size_t i = 0; i < x.size(); ++i) {
            if (i) out += ',';
            write_value(out, x[i]);
          }
          out += ']';
        } else {
          out += '{';
          bool first = true;
          for (const auto& [k, member] : x) {
            if (!first) out += ',';
            first = false;
            write_string(out, k);
            out += ':';
            write_value(out, member);
          }
          out += '}';
        }
      },
      value.v);
}

template <typename T>
const T* member_as(const Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value root = reader.read_document();
  if (!reader.error() && !std::holds_alternative<Object>(root.v)) {
    reader.fail("json_parse_error", "root is not an object");
  }
  if (error) *error = reader.error();
  if (reader.error()) return {};
  return std::get<Object>(std::move(root.v));
}

std::string to_json(const Value& v) {
  std::string out;
  write_value(out, v);
  return out;
}

// Non-finite values have no JSON spelling and come out as null.
std::string format_double(double d) {
  if (!std::isfinite(d)) return "null";
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string s(buf, static_cast<std::size_t>(n));
  while (s.back() == '0') s.pop_back();
  if (s.back() == '.') s += '0';
  return s;
}

Value integer(std::int64_t n) {
  if (n >= 0) return Value{static_cast<std::uint64_t>(n)};
  return Value{static_cast<double>(n)};
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = member_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = member_as<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* n = member_as<std::uint64_t>(obj, key);
  return n ? *n : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  if (const auto* d = member_as<double>(obj, key)) return *d;
  if (const auto* n = member_as<std::uint64_t>(obj, key)) return static_cast<double>(*n);
  return def;
}

const Object* get_object(const Object& obj, const std::string& key) {
  return member_as<Object>(obj, key);
}

const Array* get_array(const Object& obj, const std::string& key) {
  return member_as<Array>(obj, key);
}

}  // namespace judgebox::jsonlite
