#pragma once

// cordon/lexer.hpp: Tokenizer for the cordon analysis script.
//
// Layout rules follow the familiar indentation-structured scripting style:
// NEWLINE ends a logical line, INDENT/DEDENT bracket blocks, newlines inside
// (), [] and {} are ignored, and a trailing backslash joins physical lines.

#include <stdexcept>
#include <string>
#include <vector>

namespace cordon {

enum class TokenKind {
  end_of_input,
  newline,
  indent,
  dedent,
  name,
  integer,
  floating,
  string,
  fstring,
  op,
};

struct Token {
  TokenKind kind{TokenKind::end_of_input};
  // name/op: spelling; integer/floating: literal text (underscores removed);
  // string: decoded value; fstring: raw body, escapes still in place;
  // end_of_input: empty, or the unclosed-bracket error positioned at the
  // opening bracket.
  std::string text;
  int line{0};
  int column{0};
};

// Thrown by the lexer and parser; converted to a ParseError violation by
// the validator and never escapes the public API.
class SyntaxError : public std::runtime_error {
 public:
  SyntaxError(const std::string& message, int line, int column)
      : std::runtime_error(message), line_(line), column_(column) {}

  int line() const noexcept { return line_; }
  int column() const noexcept { return column_; }

 private:
  int line_;
  int column_;
};

/**
 * @brief Splits source into tokens. The result always ends with NEWLINE
 *        (when the last line had content), any pending DEDENTs, then
 *        end_of_input. A bracket still open at the end of the source is
 *        not thrown here: the stream stops at an end_of_input token whose
 *        text is the error, so an earlier parser error takes precedence.
 * @throws SyntaxError on malformed input (bad indentation, unterminated
 *         strings, unsupported literals, stray characters).
 */
std::vector<Token> tokenize(const std::string& source);

// Resolves backslash escapes of a non-raw string body.
std::string decode_escapes(const std::string& body, int line, int column);

bool is_keyword(const std::string& word);

}  // namespace cordon
