#include "codelab/translator.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <string_view>

#include "codelab/jsonlite.hpp"

namespace codelab {

namespace {

constexpr int kIndentUnit = 4;
constexpr int kTabStop = 8;

const std::vector<GrammarRule> kGrammar = {
    {LineKind::function_def, "can", "def", "can NAME(PARAMS) ->", "def NAME(PARAMS):", true, false},
    {LineKind::if_header, "if", "if", "if COND ->", "if COND:", true, false},
    {LineKind::elif_header, "elif", "elif", "elif COND ->", "elif COND:", true, true},
    {LineKind::else_header, "else", "else", "else ->", "else:", true, true},
    {LineKind::for_header, "for", "for", "for TARGET in ITER ->", "for TARGET in ITER:", true, false},
    {LineKind::while_header, "while", "while", "while COND ->", "while COND:", true, false},
    {LineKind::return_stmt, "return", "return", "return EXPR;", "return EXPR", false, false},
    {LineKind::declaration, "var", "", "var NAME: TYPE = EXPR;", "NAME: TYPE = EXPR", false, false},
    {LineKind::block_end, "ye", "", "ye", "<dedent>", false, false},
    {LineKind::comment, "//", "#", "// TEXT", "# TEXT", false, false},
    {LineKind::statement, "", "", "STMT;", "STMT", false, false},
};

// Leading words that only exist in JAC's object-spatial syntax.
const std::set<std::string, std::less<>> kJacOnlyWords = {
    "walker", "node",  "edge",   "obj",  "has",  "spawn", "visit",   "report",
    "disengage", "take", "here", "glob", "with", "enum",  "impl",    "test",
    "import", "include", "ability", "can"};

// Words that can never start an annotated assignment.
const std::set<std::string, std::less<>> kPyKeywords = {
    "False", "None",   "True",  "and",    "as",     "assert", "async",  "await",
    "break", "class",  "continue", "def", "del",    "elif",   "else",   "except",
    "finally", "for",  "from",  "global", "if",     "import", "in",     "is",
    "lambda", "nonlocal", "not", "or",    "pass",   "raise",  "return", "try",
    "while", "with",   "yield", "match",  "case"};

bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

bool starts_with(std::string_view s, std::string_view p) {
  return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}
bool ends_with(std::string_view s, std::string_view p) {
  return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}

std::string rtrim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}
std::string ltrim(const std::string& s) {
  const size_t i = s.find_first_not_of(" \t");
  return i == std::string::npos ? std::string() : s.substr(i);
}
std::string trim(const std::string& s) { return ltrim(rtrim(s)); }

std::string first_word(const std::string& s) {
  if (s.empty() || !(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return {};
  size_t i = 0;
  while (i < s.size() && is_ident_char(s[i])) ++i;
  return s.substr(0, i);
}

// True when `word` (the first word of `head`) is followed by what an ordinary
// identifier takes: assignment, a call, attribute or subscript access, or an
// operator. `test = 1;` is PY; `test walks {` is not.
bool used_as_identifier(const std::string& head, const std::string& word) {
  size_t i = word.size();
  while (i < head.size() && std::isspace(static_cast<unsigned char>(head[i]))) ++i;
  if (i == head.size()) return false;
  return std::string_view("=(.[,)+-*/%<>!&|^").find(head[i]) != std::string_view::npos;
}

std::string squash(const std::string& s) {
  std::string o;
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) o += c;
  }
  return o;
}

// ---------------------------------------------------------------------------
// Logical lines
// ---------------------------------------------------------------------------

struct LogicalLine {
  int line_no{0};
  int indent{0};
  // parts[0] has its leading whitespace removed; continuation parts are verbatim.
  std::vector<std::string> parts;
  std::string comment;  // text after the marker, verbatim
  bool has_comment{false};

  bool comment_only() const { return has_comment && parts.size() == 1 && parts[0].empty(); }
  const std::string& head() const { return parts.front(); }
  const std::string& tail() const { return parts.back(); }
  std::string joined() const {
    std::string s;
    for (size_t i = 0; i < parts.size(); ++i) {
      if (i) s += '\n';
      s += parts[i];
    }
    return s;
  }
};

struct ScanState {
  char triple{0};  // quote of an open triple-quoted string
  int brackets{0};
};

// Scans one physical line, tracking strings and brackets. Returns the offset
// of a comment marker outside any literal, or npos.
size_t scan_line(const std::string& line, LanguageId lang, ScanState& st, size_t* marker_len) {
  size_t i = 0;
  while (i < line.size()) {
    if (st.triple) {
      if (line[i] == '\\') {
        i += 2;
        continue;
      }
      if (line.compare(i, 3, std::string(3, st.triple)) == 0) {
        st.triple = 0;
        i += 3;
        continue;
      }
      ++i;
      continue;
    }
    const char c = line[i];
    if (c == '#') {
      *marker_len = 1;
      return i;
    }
    if (lang == LanguageId::jac && line.compare(i, 2, "//") == 0) {
      *marker_len = 2;
      return i;
    }
    if (c == '"' || c == '\'') {
      if (line.compare(i, 3, std::string(3, c)) == 0) {
        st.triple = c;
        i += 3;
        continue;
      }
      ++i;
      while (i < line.size() && line[i] != c) {
        if (line[i] == '\\') ++i;
        ++i;
      }
      ++i;
      continue;
    }
    // JAC braces delimit object-spatial blocks, not expressions.
    const bool brace = c == '{' || c == '}';
    if (!(brace && lang == LanguageId::jac)) {
      if (c == '(' || c == '[' || c == '{') ++st.brackets;
      else if ((c == ')' || c == ']' || c == '}') && st.brackets > 0) --st.brackets;
    }
    ++i;
  }
  return std::string::npos;
}

int column_of(const std::string& line, size_t ws_end) {
  int col = 0;
  for (size_t i = 0; i < ws_end; ++i) {
    col = line[i] == '\t' ? (col / kTabStop + 1) * kTabStop : col + 1;
  }
  return col;
}

void finish_line(LogicalLine& ll, size_t comment_at, size_t marker_len) {
  std::string& tail = ll.parts.back();
  if (comment_at != std::string::npos) {
    ll.comment = tail.substr(comment_at + marker_len);
    ll.has_comment = true;
    tail.erase(comment_at);
  }
  tail = rtrim(tail);
}

std::vector<LogicalLine> split_logical(const std::string& src, LanguageId lang) {
  std::vector<std::string> phys;
  size_t start = 0;
  while (start <= src.size()) {
    size_t nl = src.find('\n', start);
    if (nl == std::string::npos) nl = src.size();
    std::string line = src.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    phys.push_back(std::move(line));
    start = nl + 1;
  }

  std::vector<LogicalLine> out;
  ScanState st;
  LogicalLine cur;
  bool open = false;
  size_t comment_at = std::string::npos;
  size_t marker_len = 0;
  for (size_t n = 0; n < phys.size(); ++n) {
    const std::string& line = phys[n];
    if (!open) {
      const size_t ws = line.find_first_not_of(" \t");
      if (ws == std::string::npos) continue;
      cur = LogicalLine{};
      cur.line_no = static_cast<int>(n + 1);
      cur.indent = column_of(line, ws);
      cur.parts.push_back(line.substr(ws));
    } else {
      cur.parts.push_back(line);
    }
    comment_at = scan_line(cur.parts.back(), lang, st, &marker_len);
    const bool backslash =
        comment_at == std::string::npos && !st.triple && ends_with(rtrim(line), "\\");
    open = st.triple != 0 || st.brackets > 0 || backslash;
    if (!open) {
      finish_line(cur, comment_at, marker_len);
      out.push_back(std::move(cur));
    }
  }
  if (open) {
    finish_line(cur, comment_at, marker_len);
    out.push_back(std::move(cur));
  }
  return out;
}

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

class Emitter {
 public:
  explicit Emitter(LanguageId target) : marker_(target == LanguageId::py ? "#" : "//") {}

  void raw(int depth, const std::string& text) {
    lines_.push_back(std::string(static_cast<size_t>(depth * kIndentUnit), ' ') + text);
  }

  void line(int depth, const LogicalLine& ll) {
    if (ll.comment_only()) {
      raw(depth, marker_ + ll.comment);
      return;
    }
    for (size_t i = 0; i < ll.parts.size(); ++i) {
      std::string text = ll.parts[i];
      if (i + 1 == ll.parts.size() && ll.has_comment) {
        text += text.empty() ? marker_ + ll.comment : "  " + marker_ + ll.comment;
      }
      if (i == 0) raw(depth, text);
      else lines_.push_back(std::move(text));
    }
  }

  void comment(int depth, const LogicalLine& ll) {
    if (ll.has_comment) raw(depth, marker_ + ll.comment);
  }

  std::string str() const {
    std::string s;
    for (size_t i = 0; i < lines_.size(); ++i) {
      if (i) s += '\n';
      s += lines_[i];
    }
    return s;
  }

 private:
  std::string marker_;
  std::vector<std::string> lines_;
};

// Text between a leading keyword and a trailing marker, trimmed.
std::string between(const LogicalLine& ll, std::string_view kw, std::string_view suffix) {
  std::string s = ll.joined();
  s = s.substr(std::min(kw.size(), s.size()));
  s = rtrim(s);
  if (ends_with(s, suffix)) s.erase(s.size() - suffix.size());
  return trim(s);
}

void replace_head(LogicalLine& ll, std::string_view from, std::string_view to) {
  ll.parts.front() = std::string(to) + ll.parts.front().substr(from.size());
}

void replace_tail(LogicalLine& ll, std::string_view from, std::string_view to) {
  std::string& t = ll.parts.back();
  if (ends_with(t, from)) t.erase(t.size() - from.size());
  t = rtrim(t) + std::string(to);
}

const GrammarRule* rule_for_keyword(const std::string& word, LanguageId lang) {
  if (word.empty()) return nullptr;
  for (const auto& r : kGrammar) {
    const std::string_view kw = lang == LanguageId::jac ? r.jac_keyword : r.py_keyword;
    if (r.kind == LineKind::comment || r.kind == LineKind::block_end) continue;
    if (!kw.empty() && kw == word) return &r;
  }
  return nullptr;
}

bool chain_accepts(LineKind open, LineKind next) {
  if (next == LineKind::elif_header) {
    return open == LineKind::if_header || open == LineKind::elif_header;
  }
  if (next == LineKind::else_header) {
    return open == LineKind::if_header || open == LineKind::elif_header ||
           open == LineKind::for_header || open == LineKind::while_header;
  }
  return false;
}

bool is_chain(LineKind k) { return k == LineKind::elif_header || k == LineKind::else_header; }

bool opens_block(LineKind k) {
  for (const auto& r : kGrammar) {
    if (r.kind == k) return r.opens_block;
  }
  return false;
}

std::string at_line(int line_no) { return "line " + std::to_string(line_no) + ": "; }

// NAME, NAME(...), NAME(...) -> T
bool valid_signature(const std::string& sig, bool parens_required) {
  const std::string name = first_word(sig);
  if (name.empty()) return false;
  const std::string rest = ltrim(sig.substr(name.size()));
  if (rest.empty()) return !parens_required;
  if (rest[0] == '(') return true;
  return !parens_required && starts_with(rest, "->");
}

struct Classified {
  LineKind kind;
  bool opens;
};

// ---------------------------------------------------------------------------
// JAC -> PY
// ---------------------------------------------------------------------------

class JacToPy {
 public:
  explicit JacToPy(TranslationResult& r) : r_(r), out_(LanguageId::py) {}

  void run(const std::vector<LogicalLine>& lines) {
    for (const auto& ll : lines) {
      step(ll);
      if (!r_.success) break;
    }
    if (r_.success) {
      for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
        r_.success = false;
        r_.errors.push_back(at_line(it->line_no) + "block '" + it->header +
                            "' is never closed with 'ye'");
      }
    }
    r_.translated_code = out_.str();
  }

 private:
  struct Frame {
    LineKind kind;
    int line_no;
    int body{0};
    std::string header;
  };

  TranslationResult& r_;
  Emitter out_;
  std::vector<Frame> stack_;
  std::optional<Frame> just_closed_;

  int depth() const { return static_cast<int>(stack_.size()); }

  void fail(const LogicalLine& ll, const std::string& msg) {
    r_.success = false;
    r_.errors.push_back(at_line(ll.line_no) + msg);
  }

  void mark_body() {
    if (!stack_.empty()) ++stack_.back().body;
  }

  static LineKind classify(const LogicalLine& ll) {
    if (ll.comment_only()) return LineKind::comment;
    const std::string& head = ll.head();
    if (ll.parts.size() == 1 && (head == "ye" || head == "ye;")) return LineKind::block_end;
    const std::string word = first_word(head);
    const bool arrow = ends_with(ll.tail(), "->");
    if (const GrammarRule* rule = rule_for_keyword(word, LanguageId::jac)) {
      switch (rule->kind) {
        case LineKind::function_def:
          return arrow && valid_signature(between(ll, "can", "->"), false) ? rule->kind
                                                                          : LineKind::unrecognized;
        case LineKind::if_header:
        case LineKind::elif_header:
        case LineKind::while_header:
          return arrow && !between(ll, word, "->").empty() ? rule->kind : LineKind::unrecognized;
        case LineKind::for_header:
          return arrow && between(ll, word, "->").find(" in ") != std::string::npos
                     ? rule->kind
                     : LineKind::unrecognized;
        case LineKind::else_header:
          return ll.parts.size() == 1 && squash(head) == "else->" ? rule->kind
                                                                 : LineKind::unrecognized;
        case LineKind::return_stmt:
        case LineKind::declaration:
          return arrow ? LineKind::unrecognized : rule->kind;
        default:
          break;
      }
    }
    if (arrow || ends_with(ll.tail(), "{") || starts_with(head, "}") ||
        (kJacOnlyWords.contains(word) && !used_as_identifier(head, word))) {
      return LineKind::unrecognized;
    }
    return LineKind::statement;
  }

  static LogicalLine to_py_header(const LogicalLine& ll, LineKind kind) {
    LogicalLine t = ll;
    if (kind == LineKind::else_header) {
      t.parts = {"else:"};
      return t;
    }
    if (kind == LineKind::function_def) {
      replace_head(t, "can", "def");
      if (t.parts.size() == 1) {
        // `can greet ->` has no parameter list; Python needs one.
        std::string& h = t.parts.front();
        const size_t name_at = h.find_first_not_of(" \t", 3);
        const std::string name = first_word(h.substr(name_at));
        const size_t after = name_at + name.size();
        const size_t next = h.find_first_not_of(" \t", after);
        if (next == std::string::npos || h[next] != '(') h.insert(after, "()");
      }
    }
    replace_tail(t, "->", ":");
    return t;
  }

  static LogicalLine to_py_simple(const LogicalLine& ll, LineKind kind) {
    LogicalLine t = ll;
    if (kind == LineKind::declaration) {
      t.parts.front() = ltrim(t.parts.front().substr(3));
    }
    std::string& tail = t.parts.back();
    if (ends_with(tail, ";")) tail = rtrim(tail.substr(0, tail.size() - 1));
    if (kind == LineKind::declaration && t.parts.size() == 1 &&
        tail.find('=') == std::string::npos && tail.find(':') == std::string::npos) {
      tail += " = None";
    }
    if (t.parts.size() == 1 && tail.empty()) tail = "pass";
    return t;
  }

  void close_top() {
    if (stack_.back().body == 0) {
      out_.raw(depth(), "pass");
      stack_.back().body = 1;  // a reopened else/elif must not add a second pass
    }
    just_closed_ = stack_.back();
    stack_.pop_back();
  }

  void step(const LogicalLine& ll) {
    const LineKind kind = classify(ll);
    std::optional<Frame> reopenable;
    reopenable.swap(just_closed_);

    switch (kind) {
      case LineKind::comment:
        out_.line(depth(), ll);
        just_closed_.swap(reopenable);  // comments do not break an if/else chain
        return;

      case LineKind::block_end:
        if (stack_.empty()) {
          fail(ll, "'ye' without an open block");
          return;
        }
        close_top();
        out_.comment(depth(), ll);
        return;

      case LineKind::elif_header:
      case LineKind::else_header: {
        // `if c -> ... ye else -> ... ye` is accepted as well as the
        // single-terminator form.
        if ((stack_.empty() || !chain_accepts(stack_.back().kind, kind)) && reopenable &&
            chain_accepts(reopenable->kind, kind)) {
          stack_.push_back(*reopenable);
        }
        if (stack_.empty() || !chain_accepts(stack_.back().kind, kind)) {
          fail(ll, "'" + first_word(ll.head()) + "' without a matching 'if'");
          return;
        }
        if (stack_.back().body == 0) out_.raw(depth(), "pass");
        Frame& f = stack_.back();
        f.kind = kind;
        f.body = 0;
        f.line_no = ll.line_no;
        f.header = ll.head();
        out_.line(depth() - 1, to_py_header(ll, kind));
        return;
      }

      case LineKind::function_def:
      case LineKind::if_header:
      case LineKind::for_header:
      case LineKind::while_header:
        mark_body();
        out_.line(depth(), to_py_header(ll, kind));
        stack_.push_back(Frame{kind, ll.line_no, 0, ll.head()});
        return;

      case LineKind::return_stmt:
      case LineKind::declaration:
      case LineKind::statement:
        mark_body();
        out_.line(depth(), to_py_simple(ll, kind));
        return;

      case LineKind::unrecognized:
        mark_body();
        out_.line(depth(), ll);
        r_.warnings.push_back(at_line(ll.line_no) +
                              "unrecognized construct passed through unchanged: '" + ll.head() +
                              "'");
        return;
    }
  }
};

// ---------------------------------------------------------------------------
// PY -> JAC
// ---------------------------------------------------------------------------

class PyToJac {
 public:
  explicit PyToJac(TranslationResult& r) : r_(r), out_(LanguageId::jac) {}

  void run(const std::vector<LogicalLine>& lines) {
    for (const auto& ll : lines) {
      step(ll);
      if (!r_.success) break;
    }
    if (r_.success && !stack_.empty() && stack_.back().body_col < 0) {
      r_.success = false;
      r_.errors.push_back(at_line(stack_.back().line_no) + "expected an indented block after '" +
                          stack_.back().header + "' before end of input");
    }
    if (r_.success) {
      while (!stack_.empty()) close_top();
    }
    r_.translated_code = out_.str();
  }

 private:
  struct Frame {
    LineKind kind;
    int line_no;
    int header_col;
    int body_col;
    bool opaque;  // header outside the grammar: no terminator is emitted
    std::string header;
  };

  TranslationResult& r_;
  Emitter out_;
  std::vector<Frame> stack_;

  int depth() const { return static_cast<int>(stack_.size()); }

  void fail(const LogicalLine& ll, const std::string& msg) {
    r_.success = false;
    r_.errors.push_back(at_line(ll.line_no) + msg);
  }

  void close_top() {
    const Frame f = stack_.back();
    stack_.pop_back();
    if (!f.opaque) out_.raw(depth(), "ye");
  }

  static bool is_annotation(const std::string& head, const std::string& word) {
    if (word.empty() || kPyKeywords.contains(word)) return false;
    size_t i = word.size();
    while (i < head.size() && head[i] == '.') {
      const std::string part = first_word(head.substr(i + 1));
      if (part.empty()) return false;
      i += 1 + part.size();
    }
    while (i < head.size() && (head[i] == ' ' || head[i] == '\t')) ++i;
    if (i >= head.size() || head[i] != ':') return false;
    return i + 1 >= head.size() || (head[i + 1] != '=' && head[i + 1] != ':');
  }

  static Classified classify(const LogicalLine& ll) {
    if (ll.comment_only()) return {LineKind::comment, false};
    const std::string& head = ll.head();
    const std::string word = first_word(head);
    const bool colon = ends_with(ll.tail(), ":");
    if (const GrammarRule* rule = rule_for_keyword(word, LanguageId::py)) {
      bool ok = false;
      switch (rule->kind) {
        case LineKind::function_def:
          ok = colon && valid_signature(between(ll, "def", ":"), true);
          break;
        case LineKind::if_header:
        case LineKind::elif_header:
        case LineKind::while_header:
          ok = colon && !between(ll, word, ":").empty();
          break;
        case LineKind::for_header:
          ok = colon && between(ll, word, ":").find(" in ") != std::string::npos;
          break;
        case LineKind::else_header:
          ok = ll.parts.size() == 1 && squash(head) == "else:";
          break;
        case LineKind::return_stmt:
          ok = !colon;
          break;
        default:
          break;
      }
      if (ok) return {rule->kind, rule->opens_block};
      return {LineKind::unrecognized, colon};
    }
    if (colon) return {LineKind::unrecognized, true};  // class, try, with, ...
    if (starts_with(head, "@")) return {LineKind::unrecognized, false};
    if (is_annotation(head, word)) return {LineKind::declaration, false};
    return {LineKind::statement, false};
  }

  static LogicalLine to_jac(const LogicalLine& ll, LineKind kind) {
    LogicalLine t = ll;
    switch (kind) {
      case LineKind::else_header:
        t.parts = {"else ->"};
        break;
      case LineKind::function_def:
        replace_head(t, "def", "can");
        replace_tail(t, ":", " ->");
        break;
      case LineKind::if_header:
      case LineKind::elif_header:
      case LineKind::for_header:
      case LineKind::while_header:
        replace_tail(t, ":", " ->");
        break;
      case LineKind::declaration:
        t.parts.front() = "var " + t.parts.front();
        if (!ends_with(t.parts.back(), ";")) t.parts.back() += ";";
        break;
      case LineKind::return_stmt:
      case LineKind::statement:
        if (!ends_with(t.parts.back(), ";")) t.parts.back() += ";";
        break;
      default:
        break;
    }
    return t;
  }

  void step(const LogicalLine& ll) {
    if (ll.comment_only()) {
      out_.line(depth(), ll);
      return;
    }
    Classified c = classify(ll);
    const int col = ll.indent;

    if (!stack_.empty() && stack_.back().body_col < 0) {
      Frame& f = stack_.back();
      if (col <= f.header_col) {
        fail(ll, "expected an indented block after '" + f.header + "' on line " +
                     std::to_string(f.line_no));
        return;
      }
      f.body_col = col;
    } else {
      bool continuation = false;
      while (!stack_.empty() && col < stack_.back().body_col) {
        const Frame& f = stack_.back();
        if (col > f.header_col) {
          fail(ll, "unindent does not match any outer indentation level");
          return;
        }
        if (col == f.header_col && is_chain(c.kind)) {
          if (!f.opaque) {
            continuation = true;
            break;
          }
          // else/elif after try/except/with: outside the grammar as well.
          c = {LineKind::unrecognized, true};
        }
        close_top();
      }

      if (continuation) {
        Frame& f = stack_.back();
        if (!chain_accepts(f.kind, c.kind)) {
          fail(ll, "'" + first_word(ll.head()) + "' without a matching 'if'");
          return;
        }
        out_.line(depth() - 1, to_jac(ll, c.kind));
        f.kind = c.kind;
        f.line_no = ll.line_no;
        f.body_col = -1;
        f.header = ll.head();
        return;
      }

      const int expected = stack_.empty() ? 0 : stack_.back().body_col;
      if (col > expected) {
        fail(ll, "unexpected indent");
        return;
      }
      if (col < expected) {
        fail(ll, "unindent does not match any outer indentation level");
        return;
      }
    }

    if (is_chain(c.kind)) {
      fail(ll, "'" + first_word(ll.head()) + "' without a matching 'if'");
      return;
    }

    if (c.kind == LineKind::unrecognized) {
      out_.line(depth(), ll);
      r_.warnings.push_back(at_line(ll.line_no) +
                            "unrecognized construct passed through unchanged: '" + ll.head() + "'");
    } else {
      out_.line(depth(), to_jac(ll, c.kind));
    }
    if (c.opens) {
      stack_.push_back(Frame{c.kind, ll.line_no, col, -1, c.kind == LineKind::unrecognized,
                             ll.head()});
    }
  }
};

}  // namespace

std::string to_string(LineKind kind) {
  switch (kind) {
    case LineKind::function_def: return "function_def";
    case LineKind::if_header: return "if";
    case LineKind::elif_header: return "elif";
    case LineKind::else_header: return "else";
    case LineKind::for_header: return "for";
    case LineKind::while_header: return "while";
    case LineKind::return_stmt: return "return";
    case LineKind::declaration: return "declaration";
    case LineKind::block_end: return "block_end";
    case LineKind::comment: return "comment";
    case LineKind::statement: return "statement";
    case LineKind::unrecognized: return "unrecognized";
  }
  return "unknown";
}

const std::vector<GrammarRule>& grammar_table() { return kGrammar; }

TranslationResult translate(const std::string& source, LanguageId from, LanguageId to) {
  TranslationResult r;
  if (from == to) return r;
  const auto lines = split_logical(source, from);
  if (lines.empty()) return r;
  if (from == LanguageId::jac) {
    JacToPy(r).run(lines);
  } else {
    PyToJac(r).run(lines);
  }
  return r;
}

std::vector<std::string> check_structure(const std::string& source, LanguageId language) {
  const LanguageId other = language == LanguageId::jac ? LanguageId::py : LanguageId::jac;
  return translate(source, language, other).errors;
}

std::string translation_to_json(const TranslationResult& r) {
  jsonlite::Object obj;
  obj["success"] = r.success;
  obj["translated_code"] = r.translated_code;
  jsonlite::Array errors;
  for (const auto& e : r.errors) errors.push_back(e);
  jsonlite::Array warnings;
  for (const auto& w : r.warnings) warnings.push_back(w);
  obj["errors"] = std::move(errors);
  obj["warnings"] = std::move(warnings);
  return jsonlite::to_json(obj);
}

}  // namespace codelab
