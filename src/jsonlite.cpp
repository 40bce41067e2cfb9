#include "codelab/jsonlite.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace codelab::jsonlite {

namespace {

// Guards against stack exhaustion on hostile input from the C ABI.
constexpr int kMaxDepth = 64;

void append_utf8(std::string& o, std::uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  int depth{0};
  std::optional<JsonError> err;

  void fail(const std::string& msg) {
    if (!err) err = JsonError{"json_parse_error", msg + " at offset " + std::to_string(i)};
  }

  void ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  bool eat(char c) {
    ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  bool hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) {
      fail("expected string");
      return {};
    }
    std::string o;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("control character in string");
        return {};
      }
      if (c != '\\') {
        o += c;
        continue;
      }
      if (i >= s.size()) break;
      const char n = s[i++];
      switch (n) {
        case '"': o += '"'; break;
        case '\\': o += '\\'; break;
        case '/': o += '/'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'n': o += '\n'; break;
        case 'r': o += '\r'; break;
        case 't': o += '\t'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!hex4(cp)) {
            fail("invalid \\u escape");
            return {};
          }
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            std::uint32_t lo = 0;
            if (!hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
              fail("invalid surrogate pair");
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default:
          fail("invalid escape");
          return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out) {
    const size_t start = i;
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    const std::string text = s.substr(start, i - start);
    if (is_float || text[0] == '-') {
      out = Value{std::strtod(text.c_str(), nullptr)};
      return true;
    }
    errno = 0;
    const unsigned long long n = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
      out = Value{std::strtod(text.c_str(), nullptr)};
    } else {
      out = Value{static_cast<std::uint64_t>(n)};
    }
    return true;
  }

  Value value() {
    ws();
    if (i >= s.size()) {
      fail("unexpected eof");
      return {};
    }
    if (depth > kMaxDepth) {
      fail("nesting too deep");
      return {};
    }
    const char c = s[i];
    if (c == '{') return Value{object()};
    if (c == '[') return Value{array()};
    if (c == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num;
    if (parse_number(num)) return num;
    fail("unexpected token");
    return {};
  }

  Object object() {
    Object out;
    ++depth;
    eat('{');
    if (eat('}')) {
      --depth;
      return out;
    }
    while (!err) {
      ws();
      std::string key = parse_string();
      if (err) break;
      if (out.contains(key)) {
        err = JsonError{"json_duplicate_key", "duplicate key: " + key};
        break;
      }
      if (!eat(':')) {
        fail("expected ':'");
        break;
      }
      Value v = value();
      if (err) break;
      out.emplace(std::move(key), std::move(v));
      if (eat('}')) break;
      if (!eat(',')) fail("expected ',' or '}'");
    }
    --depth;
    return out;
  }

  Array array() {
    Array out;
    ++depth;
    eat('[');
    if (eat(']')) {
      --depth;
      return out;
    }
    while (!err) {
      out.push_back(value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) fail("expected ',' or ']'");
    }
    --depth;
    return out;
  }

  Value document() {
    Value v = value();
    ws();
    if (!err && i != s.size()) fail("trailing data");
    return v;
  }
};

std::string format_double(double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string out(buf, static_cast<size_t>(n));
  while (!out.empty() && out.back() == '0') out.pop_back();
  if (!out.empty() && out.back() == '.') out.push_back('0');
  return out;
}

}  // namespace

std::string escape(const std::string& s) {
  bool clean = true;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      clean = false;
      break;
    }
  }
  if (clean) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    switch (c) {
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o += buf;
        } else {
          o += c;
        }
    }
  }
  return o;
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (const auto* b = std::get_if<bool>(&v.v)) return *b ? "true" : "false";
  if (const auto* n = std::get_if<std::uint64_t>(&v.v)) return std::to_string(*n);
  if (const auto* d = std::get_if<double>(&v.v)) return format_double(*d);
  if (const auto* str = std::get_if<std::string>(&v.v)) return "\"" + escape(*str) + "\"";
  std::string out;
  if (const auto* obj = std::get_if<Object>(&v.v)) {
    out += '{';
    bool first = true;
    for (const auto& [k, item] : *obj) {
      if (!first) out += ',';
      first = false;
      out += '"';
      out += escape(k);
      out += "\":";
      out += to_json(item);
    }
    out += '}';
    return out;
  }
  out += '[';
  bool first = true;
  for (const auto& item : std::get<Array>(v.v)) {
    if (!first) out += ',';
    first = false;
    out += to_json(item);
  }
  out += ']';
  return out;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.document();
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.document();
  if (!p.err && !std::holds_alternative<Object>(v.v)) {
    p.err = JsonError{"json_parse_error", "top-level value must be an object"};
  }
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(std::move(v.v));
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  (void)p.document();
  return p.err;
}

bool has_key(const Object& obj, const std::string& key) { return obj.contains(key); }

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (const auto* d = std::get_if<double>(&it->second.v)) return *d;
  if (const auto* n = std::get_if<std::uint64_t>(&it->second.v)) return static_cast<double>(*n);
  return def;
}

std::optional<std::uint64_t> get_optional_u64(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return std::nullopt;
  return std::get<std::uint64_t>(it->second.v);
}

std::optional<std::string> get_optional_string(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return std::nullopt;
  return std::get<std::string>(it->second.v);
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return out;
  for (const auto& [k, v] : std::get<Object>(it->second.v)) {
    if (const auto* s = std::get_if<std::string>(&v.v)) out[k] = *s;
  }
  return out;
}

Object get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return {};
  return std::get<Object>(it->second.v);
}

}  // namespace codelab::jsonlite
