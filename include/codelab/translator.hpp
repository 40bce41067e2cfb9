#pragma once

// codelab/translator.hpp — Structural JAC <-> PY rewriter.
//
// The two surface languages differ in block delimitation:
//   JAC   `can add(a, b) ->` ... `ye`      explicit header arrow + terminator
//   PY    `def add(a, b):` + indentation    trailing colon + indent level
//
// translate() is a line-oriented state machine, not a parser:
//   1. split the source into logical lines (bracket, backslash and
//      triple-quote continuations stay attached to their first line; blank
//      lines are dropped; a trailing comment is split off the last line);
//   2. classify each logical line against grammar_table();
//   3. track nesting explicitly (a frame stack: JAC opens on a header and
//      closes on `ye`; PY opens on a header and closes on dedent);
//   4. re-emit in the target form at depth * 4 spaces.
//
// Lines outside the grammar are copied with re-indentation only and reported
// in `warnings`. Structural ambiguity (missing or extra terminator, bad
// indentation, header without body) stops translation: `success` is false,
// `errors` says where, and `translated_code` holds the output produced so far.
// Never throws.

#include <string>
#include <string_view>
#include <vector>

#include "codelab/types.hpp"

namespace codelab {

struct TranslationResult {
  bool success{true};
  std::string translated_code;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

enum class LineKind {
  function_def,
  if_header,
  elif_header,
  else_header,
  for_header,
  while_header,
  return_stmt,
  declaration,
  block_end,
  comment,
  statement,
  unrecognized,
};

std::string to_string(LineKind kind);

// One row per recognized construct. jac_keyword/py_keyword is the leading
// token that selects the row (empty: selected structurally).
struct GrammarRule {
  LineKind kind;
  std::string_view jac_keyword;
  std::string_view py_keyword;
  std::string_view jac_form;
  std::string_view py_form;
  bool opens_block;
  bool continues_chain;
};

const std::vector<GrammarRule>& grammar_table();

// Equal languages or empty source give an empty result with success = true.
TranslationResult translate(const std::string& source, LanguageId from, LanguageId to);

// Structural errors only (unterminated or unexpected blocks, headers without a
// body, inconsistent indentation). Empty when the block structure is sound.
std::vector<std::string> check_structure(const std::string& source, LanguageId language);

std::string translation_to_json(const TranslationResult& r);

}  // namespace codelab
