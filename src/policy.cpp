#include "codelab/policy.hpp"

#include <cctype>
#include <vector>

namespace codelab {

namespace {

enum class TokKind { ident, punct, end_stmt };

struct Token {
  TokKind kind;
  std::string text;
};

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Lexer for the subset of both surface languages the scan cares about:
// identifiers, punctuation and statement ends. Comments and string literal
// bodies produce no tokens, except the {...} fields of Python f-strings,
// which are code and are lexed in place.
class Lexer {
 public:
  Lexer(const std::string& src, LanguageId lang) : s_(src), lang_(lang) {}

  std::vector<Token> run() {
    lex_range(0, s_.size());
    return std::move(out_);
  }

 private:
  const std::string& s_;
  LanguageId lang_;
  std::vector<Token> out_;

  bool line_comment_at(size_t i) const {
    if (s_[i] == '#') return true;
    return lang_ == LanguageId::jac && s_.compare(i, 2, "//") == 0;
  }

  void lex_range(size_t i, size_t end) {
    while (i < end) {
      const char c = s_[i];
      if (c == '\n' || c == ';') {
        out_.push_back({TokKind::end_stmt, std::string(1, c)});
        ++i;
      } else if (std::isspace(static_cast<unsigned char>(c))) {
        ++i;
      } else if (line_comment_at(i)) {
        while (i < end && s_[i] != '\n') ++i;
      } else if (lang_ == LanguageId::jac && s_.compare(i, 2, "/*") == 0) {
        const size_t close = s_.find("*/", i + 2);
        i = (close == std::string::npos || close + 2 > end) ? end : close + 2;
      } else if (c == '"' || c == '\'') {
        i = skip_string(i, end, false);
      } else if (is_ident_start(c)) {
        const size_t start = i;
        while (i < end && is_ident_char(s_[i])) ++i;
        std::string word = s_.substr(start, i - start);
        // String prefixes: r"", b"", f"", rb"", fr"" ...
        if (i < end && (s_[i] == '"' || s_[i] == '\'') && word.size() <= 2 &&
            word.find_first_not_of("rRbBuUfF") == std::string::npos) {
          const bool fstring = word.find_first_of("fF") != std::string::npos;
          i = skip_string(i, end, fstring);
        } else {
          out_.push_back({TokKind::ident, std::move(word)});
        }
      } else if (std::isdigit(static_cast<unsigned char>(c))) {
        while (i < end && (is_ident_char(s_[i]) || s_[i] == '.')) ++i;
      } else {
        out_.push_back({TokKind::punct, std::string(1, c)});
        ++i;
      }
    }
  }

  // Returns the index just past the closing quote (or end on an unterminated
  // literal). For f-strings the replacement fields are lexed as code.
  size_t skip_string(size_t i, size_t end, bool fstring) {
    const char q = s_[i];
    const bool triple = i + 2 < end && s_[i + 1] == q && s_[i + 2] == q;
    const size_t qlen = triple ? 3 : 1;
    i += qlen;
    while (i < end) {
      const char c = s_[i];
      if (c == '\\') {
        i += 2;
        continue;
      }
      if (!triple && c == '\n') return i;
      if (c == q && (!triple || (i + 2 < end && s_[i + 1] == q && s_[i + 2] == q))) {
        return i + qlen;
      }
      if (fstring && c == '{') {
        if (i + 1 < end && s_[i + 1] == '{') {
          i += 2;
          continue;
        }
        size_t close = i + 1;
        int depth = 1;
        while (close < end && depth > 0) {
          if (s_[close] == '{') ++depth;
          else if (s_[close] == '}') --depth;
          if (depth > 0) ++close;
        }
        lex_range(i + 1, close);
        i = close + 1;
        continue;
      }
      ++i;
    }
    return end;
  }
};

bool module_blocked(const std::string& dotted, const std::set<std::string>& blocked,
                    std::string* hit) {
  if (dotted.empty()) return false;
  // "os.path" is blocked by "os" as well as by "os.path".
  size_t pos = 0;
  while (true) {
    pos = dotted.find('.', pos);
    const std::string prefix = pos == std::string::npos ? dotted : dotted.substr(0, pos);
    if (blocked.contains(prefix)) {
      *hit = prefix;
      return true;
    }
    if (pos == std::string::npos) return false;
    ++pos;
  }
}

class ConstructScanner {
 public:
  ConstructScanner(std::vector<Token> toks, const SecurityPolicy& policy)
      : t_(std::move(toks)), policy_(policy) {}

  std::optional<PolicyViolation> run() {
    for (size_t k = 0; k < t_.size(); ++k) {
      const Token& tok = t_[k];
      if (tok.kind != TokKind::ident) continue;
      if (tok.text == "import" || tok.text == "include") {
        if (auto v = import_stmt(k)) return v;
      } else if (tok.text == "from" && at_stmt_start(k)) {
        if (auto v = from_stmt(k + 1)) return v;
      } else if (policy_.blocked_functions.contains(tok.text) && is_call(k)) {
        return PolicyViolation{PolicyViolationKind::forbidden_construct, tok.text,
                               "call to blocked function '" + tok.text + "'"};
      }
    }
    return std::nullopt;
  }

 private:
  std::vector<Token> t_;
  const SecurityPolicy& policy_;

  bool punct_at(size_t k, const char* p) const {
    return k < t_.size() && t_[k].kind == TokKind::punct && t_[k].text == p;
  }
  bool ident_at(size_t k) const { return k < t_.size() && t_[k].kind == TokKind::ident; }
  bool end_at(size_t k) const { return k >= t_.size() || t_[k].kind == TokKind::end_stmt; }

  bool at_stmt_start(size_t k) const { return k == 0 || t_[k - 1].kind == TokKind::end_stmt; }

  bool is_call(size_t k) const {
    if (!punct_at(k + 1, "(")) return false;
    // `def open(...)` / `can open(...)` define rather than call.
    if (k > 0 && t_[k - 1].kind == TokKind::ident) {
      const std::string& prev = t_[k - 1].text;
      if (prev == "def" || prev == "can" || prev == "class") return false;
    }
    return true;
  }

  // Reads a.b.c starting at k; advances k past it.
  std::string dotted_name(size_t& k) const {
    std::string name;
    while (punct_at(k, ".")) {
      ++k;  // relative-import dots contribute nothing to the module name
    }
    if (!ident_at(k) || t_[k].text == "import") return name;
    name = t_[k++].text;
    while (punct_at(k, ".") && ident_at(k + 1)) {
      name += "." + t_[k + 1].text;
      k += 2;
    }
    return name;
  }

  std::optional<PolicyViolation> blocked(const std::string& module) const {
    std::string hit;
    if (module_blocked(module, policy_.blocked_imports, &hit)) {
      return PolicyViolation{PolicyViolationKind::forbidden_construct, hit,
                             "import of blocked module '" + module + "'"};
    }
    return std::nullopt;
  }

  // import a.b [as x], c ...      (PY)
  // import:py a, b;               (JAC)
  // import:py from a { b, c };    (JAC)
  std::optional<PolicyViolation> import_stmt(size_t k) {
    size_t j = k + 1;
    if (punct_at(j, ":") && ident_at(j + 1)) j += 2;
    if (ident_at(j) && t_[j].text == "from") return from_stmt(j + 1);
    while (!end_at(j)) {
      if (ident_at(j) && t_[j].text == "as") {
        j += 2;
        continue;
      }
      if (ident_at(j) || punct_at(j, ".")) {
        const std::string name = dotted_name(j);
        if (auto v = blocked(name)) return v;
        continue;
      }
      ++j;
    }
    return std::nullopt;
  }

  // from a.b import c, d    /   from a import (c,\n d)
  std::optional<PolicyViolation> from_stmt(size_t j) {
    const std::string module = dotted_name(j);
    if (auto v = blocked(module)) return v;
    if (ident_at(j) && t_[j].text == "import") ++j;
    int depth = 0;
    while (j < t_.size()) {
      const Token& tok = t_[j];
      if (tok.kind == TokKind::end_stmt && (depth == 0 || tok.text == ";")) break;
      if (punct_at(j, "(") || punct_at(j, "{")) ++depth;
      if (punct_at(j, ")") || punct_at(j, "}")) --depth;
      if (ident_at(j) && tok.text == "as") {
        j += 2;
        continue;
      }
      if (ident_at(j)) {
        const std::string full = module.empty() ? tok.text : module + "." + tok.text;
        if (auto v = blocked(full)) return v;
      }
      ++j;
    }
    return std::nullopt;
  }
};

}  // namespace

std::string to_string(PolicyViolationKind kind) {
  switch (kind) {
    case PolicyViolationKind::unsupported_language: return "unsupported_language";
    case PolicyViolationKind::code_too_large: return "code_too_large";
    case PolicyViolationKind::forbidden_construct: return "forbidden_construct";
    case PolicyViolationKind::rate_limited: return "rate_limited";
  }
  return "unknown";
}

std::optional<PolicyViolation> scan_forbidden_constructs(const std::string& code,
                                                         LanguageId language,
                                                         const SecurityPolicy& policy) {
  ConstructScanner scanner(Lexer(code, language).run(), policy);
  return scanner.run();
}

PolicyViolation rate_limit_violation(const std::string& window, std::uint64_t count,
                                     std::uint64_t cap) {
  return PolicyViolation{PolicyViolationKind::rate_limited, window,
                         std::to_string(count) + " executions in the last " + window +
                             ", cap is " + std::to_string(cap)};
}

std::optional<PolicyViolation> validate_request(const ExecutionRequest& request,
                                                const SecurityPolicy& policy,
                                                const RateCounterView& rate_state,
                                                const CallerIdentity& caller) {
  if (!policy.allowed_languages.contains(request.language)) {
    return PolicyViolation{PolicyViolationKind::unsupported_language, to_string(request.language),
                           "language '" + to_string(request.language) + "' is not allowed"};
  }

  if (request.code.size() > request.limits.max_code_bytes()) {
    return PolicyViolation{PolicyViolationKind::code_too_large, "",
                           "code is " + std::to_string(request.code.size()) +
                               " bytes, limit is " +
                               std::to_string(request.limits.max_code_bytes())};
  }

  if (auto v = scan_forbidden_constructs(request.code, request.language, policy)) {
    return v;
  }

  const std::uint64_t per_minute = rate_state.executions_in_last_minute(caller);
  if (per_minute >= policy.max_executions_per_minute) {
    return rate_limit_violation("minute", per_minute, policy.max_executions_per_minute);
  }
  const std::uint64_t per_hour = rate_state.executions_in_last_hour(caller);
  if (per_hour >= policy.max_executions_per_hour) {
    return rate_limit_violation("hour", per_hour, policy.max_executions_per_hour);
  }
  return std::nullopt;
}

std::string violation_to_json(const PolicyViolation& v) {
  jsonlite::Object obj;
  obj["kind"] = to_string(v.kind);
  obj["name"] = v.name;
  obj["detail"] = v.detail;
  return jsonlite::to_json(obj);
}

jsonlite::Object policy_to_object(const SecurityPolicy& policy) {
  jsonlite::Object obj;
  jsonlite::Array imports;
  for (const auto& m : policy.blocked_imports) imports.push_back(m);
  jsonlite::Array functions;
  for (const auto& f : policy.blocked_functions) functions.push_back(f);
  jsonlite::Array langs;
  for (auto l : policy.allowed_languages) langs.push_back(to_string(l));
  obj["blocked_imports"] = std::move(imports);
  obj["blocked_functions"] = std::move(functions);
  obj["allowed_languages"] = std::move(langs);
  obj["sandboxing_enabled"] = policy.sandboxing_enabled;
  obj["network_access_enabled"] = policy.network_access_enabled;
  obj["max_executions_per_minute"] = policy.max_executions_per_minute;
  obj["max_executions_per_hour"] = policy.max_executions_per_hour;
  return obj;
}

SecurityPolicy policy_from_object(const jsonlite::Object& obj, std::vector<std::string>* errors) {
  SecurityPolicy p;
  auto report = [&](const std::string& msg) {
    if (errors) errors->push_back(msg);
  };
  auto read_set = [&](const char* key, std::set<std::string>& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!std::holds_alternative<jsonlite::Array>(it->second.v)) {
      report(std::string(key) + " must be an array of strings");
      return;
    }
    out.clear();
    for (const auto& item : std::get<jsonlite::Array>(it->second.v)) {
      if (const auto* s = std::get_if<std::string>(&item.v)) {
        out.insert(*s);
      } else {
        report(std::string(key) + " must contain only strings");
      }
    }
  };
  auto read_bool = [&](const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (const auto* b = std::get_if<bool>(&it->second.v)) out = *b;
    else report(std::string(key) + " must be a boolean");
  };
  auto read_count = [&](const char* key, std::uint64_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    const auto* n = std::get_if<std::uint64_t>(&it->second.v);
    if (!n || *n == 0) {
      report(std::string(key) + " must be a positive integer");
      return;
    }
    out = *n;
  };

  read_set("blocked_imports", p.blocked_imports);
  read_set("blocked_functions", p.blocked_functions);
  std::set<std::string> lang_names;
  if (obj.contains("allowed_languages")) {
    read_set("allowed_languages", lang_names);
    p.allowed_languages.clear();
    for (const auto& name : lang_names) {
      if (auto lang = parse_language(name)) p.allowed_languages.insert(*lang);
      else report("unknown language in allowed_languages: " + name);
    }
  }
  read_bool("sandboxing_enabled", p.sandboxing_enabled);
  read_bool("network_access_enabled", p.network_access_enabled);
  read_count("max_executions_per_minute", p.max_executions_per_minute);
  read_count("max_executions_per_hour", p.max_executions_per_hour);
  return p;
}

}  // namespace codelab
