#include "cordon/lexer.hpp"

#include <array>
#include <cctype>
#include <string_view>
#include <unordered_set>

namespace cordon {

namespace {

// Longest first: the scanner takes the first entry that matches.
constexpr std::array<std::string_view, 47> kOperators = {
    "**=", "//=", ">>=", "<<=", "...",
    "**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=",
    "->", "<<", ">>", ":=",
    "+", "-", "*", "/", "%", "@", "&", "|", "^", "~", "<", ">",
    "(", ")", "[", "]", "{", "}", ",", ":", ".", ";", "=", "!",
};

bool is_name_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

bool is_name_char(char c) {
  return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

class Lexer {
 public:
  explicit Lexer(const std::string& src) : src_(src) {}

  std::vector<Token> run() {
    indents_.push_back(0);
    while (pos_ < src_.size()) {
      if (at_line_start_ && depth_ == 0) {
        if (handle_indentation()) continue;
      }
      scan_token();
    }
    if (depth_ > 0) {
      // The parser usually fails earlier inside the open bracket; this only
      // surfaces when it runs out of tokens first.
      push(TokenKind::end_of_input, "unexpected EOF: '" + std::string(1, open_bracket_) + "' was never closed",
           open_line_, open_column_);
      return std::move(tokens_);
    }
    if (!tokens_.empty() && tokens_.back().kind != TokenKind::newline &&
        tokens_.back().kind != TokenKind::dedent && tokens_.back().kind != TokenKind::indent) {
      push(TokenKind::newline, "", line_, column());
    }
    while (indents_.size() > 1) {
      indents_.pop_back();
      push(TokenKind::dedent, "", line_, 1);
    }
    push(TokenKind::end_of_input, "", line_, column());
    return std::move(tokens_);
  }

 private:
  int column() const { return static_cast<int>(pos_ - line_start_) + 1; }

  void push(TokenKind kind, std::string text, int line, int col) {
    tokens_.push_back(Token{kind, std::move(text), line, col});
  }

  void newline_advance() {
    ++pos_;
    ++line_;
    line_start_ = pos_;
  }

  // Returns true when the whole line was consumed (blank or comment-only).
  bool handle_indentation() {
    int width = 0;
    size_t p = pos_;
    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t' || src_[p] == '\f')) {
      if (src_[p] == '\t') width = (width / 8 + 1) * 8;
      else if (src_[p] == ' ') ++width;
      ++p;
    }
    if (p >= src_.size()) {
      pos_ = p;
      return true;
    }
    if (src_[p] == '#' || src_[p] == '\n' || src_[p] == '\r') {
      pos_ = p;
      while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
      if (pos_ < src_.size()) newline_advance();
      return true;
    }
    pos_ = p;
    at_line_start_ = false;
    if (width > indents_.back()) {
      indents_.push_back(width);
      push(TokenKind::indent, "", line_, 1);
    } else {
      while (width < indents_.back()) {
        indents_.pop_back();
        push(TokenKind::dedent, "", line_, 1);
      }
      if (width != indents_.back()) {
        throw SyntaxError("unindent does not match any outer indentation level", line_, column());
      }
    }
    return false;
  }

  void scan_token() {
    const char c = src_[pos_];
    if (c == ' ' || c == '\t' || c == '\f') {
      ++pos_;
      return;
    }
    if (c == '#') {
      while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
      return;
    }
    if (c == '\r') {
      ++pos_;
      return;
    }
    if (c == '\n') {
      if (depth_ == 0 && !at_line_start_) {
        push(TokenKind::newline, "", line_, column());
        at_line_start_ = true;
      }
      newline_advance();
      return;
    }
    if (c == '\\') {
      size_t p = pos_ + 1;
      if (p < src_.size() && src_[p] == '\r') ++p;
      if (p < src_.size() && src_[p] == '\n') {
        pos_ = p;
        newline_advance();
        return;
      }
      throw SyntaxError("unexpected character after line continuation character", line_, column());
    }
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && pos_ + 1 < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
      scan_number();
      return;
    }
    if (is_name_start(c)) {
      size_t p = pos_;
      while (p < src_.size() && is_name_char(src_[p])) ++p;
      const std::string word = src_.substr(pos_, p - pos_);
      if (p < src_.size() && (src_[p] == '\'' || src_[p] == '"') && is_string_prefix(word)) {
        scan_string(word, p);
        return;
      }
      push(TokenKind::name, word, line_, column());
      pos_ = p;
      return;
    }
    if (c == '\'' || c == '"') {
      scan_string("", pos_);
      return;
    }
    for (const auto& op : kOperators) {
      if (src_.compare(pos_, op.size(), op) == 0) {
        if (op == "!" || op == ":=" || op == "...") {
          throw SyntaxError("invalid syntax '" + std::string(op) + "'", line_, column());
        }
        if (op == "(" || op == "[" || op == "{") {
          if (depth_++ == 0) {
            open_bracket_ = op[0];
            open_line_ = line_;
            open_column_ = column();
          }
        }
        if (op == ")" || op == "]" || op == "}") {
          if (depth_ == 0) throw SyntaxError("unmatched '" + std::string(op) + "'", line_, column());
          --depth_;
        }
        push(TokenKind::op, std::string(op), line_, column());
        pos_ += op.size();
        return;
      }
    }
    throw SyntaxError(std::string("invalid character '") + c + "'", line_, column());
  }

  static bool is_string_prefix(const std::string& word) {
    if (word.empty() || word.size() > 2) return false;
    for (char ch : word) {
      const char l = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
      if (l != 'r' && l != 'f' && l != 'b' && l != 'u') return false;
    }
    return true;
  }

  void scan_string(const std::string& prefix, size_t quote_pos) {
    const int start_line = line_;
    const int start_col = column();
    bool raw = false;
    bool formatted = false;
    for (char ch : prefix) {
      const char l = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
      if (l == 'r') raw = true;
      else if (l == 'f') formatted = true;
      else if (l == 'b') throw SyntaxError("bytes literals are not supported", start_line, start_col);
    }
    pos_ = quote_pos;
    const char q = src_[pos_];
    const bool triple = src_.compare(pos_, 3, std::string(3, q)) == 0;
    pos_ += triple ? 3 : 1;
    std::string body;
    while (true) {
      if (pos_ >= src_.size()) {
        throw SyntaxError(triple ? "unterminated triple-quoted string literal" : "unterminated string literal",
                          start_line, start_col);
      }
      const char ch = src_[pos_];
      if (ch == '\\' && pos_ + 1 < src_.size()) {
        body += ch;
        body += src_[pos_ + 1];
        if (src_[pos_ + 1] == '\n') {
          pos_ += 1;
          newline_advance();
        } else {
          pos_ += 2;
        }
        continue;
      }
      if (triple) {
        if (src_.compare(pos_, 3, std::string(3, q)) == 0) {
          pos_ += 3;
          break;
        }
      } else if (ch == q) {
        ++pos_;
        break;
      }
      if (ch == '\n') {
        if (!triple) throw SyntaxError("unterminated string literal", start_line, start_col);
        body += ch;
        newline_advance();
        continue;
      }
      body += ch;
      ++pos_;
    }
    at_line_start_ = false;
    if (formatted) {
      // The parser resolves escapes per literal segment; raw-ness is carried
      // as a leading marker character so "{" handling stays in one place.
      push(TokenKind::fstring, std::string(raw ? "r" : "-") + body, start_line, start_col);
    } else {
      push(TokenKind::string, raw ? body : decode_escapes(body, start_line, start_col), start_line, start_col);
    }
  }

  void scan_number() {
    const int start_col = column();
    size_t p = pos_;
    std::string digits;
    bool is_float = false;
    if (src_[p] == '0' && p + 1 < src_.size() && (src_[p + 1] == 'x' || src_[p + 1] == 'X')) {
      p += 2;
      while (p < src_.size() && (std::isxdigit(static_cast<unsigned char>(src_[p])) || src_[p] == '_')) {
        if (src_[p] != '_') digits += src_[p];
        ++p;
      }
      if (digits.empty()) throw SyntaxError("invalid hexadecimal literal", line_, start_col);
      unsigned long long v = 0;
      for (char ch : digits) {
        const unsigned d = std::isdigit(static_cast<unsigned char>(ch))
                               ? static_cast<unsigned>(ch - '0')
                               : static_cast<unsigned>(std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10);
        if (v > (0x7fffffffffffffffULL >> 4)) throw SyntaxError("integer literal too large", line_, start_col);
        v = v * 16 + d;
      }
      push(TokenKind::integer, std::to_string(v), line_, start_col);
      pos_ = p;
      return;
    }
    auto take_digits = [&]() {
      while (p < src_.size() && (std::isdigit(static_cast<unsigned char>(src_[p])) || src_[p] == '_')) {
        if (src_[p] != '_') digits += src_[p];
        ++p;
      }
    };
    take_digits();
    if (p < src_.size() && src_[p] == '.') {
      is_float = true;
      digits += '.';
      ++p;
      take_digits();
    }
    if (p < src_.size() && (src_[p] == 'e' || src_[p] == 'E')) {
      size_t q = p + 1;
      if (q < src_.size() && (src_[q] == '+' || src_[q] == '-')) ++q;
      if (q < src_.size() && std::isdigit(static_cast<unsigned char>(src_[q]))) {
        is_float = true;
        digits += 'e';
        digits.append(src_, p + 1, q - p - 1);
        p = q;
        take_digits();
      }
    }
    if (p < src_.size() && (src_[p] == 'j' || src_[p] == 'J')) {
      throw SyntaxError("complex literals are not supported", line_, start_col);
    }
    if (p < src_.size() && is_name_start(src_[p])) {
      throw SyntaxError("invalid decimal literal", line_, start_col);
    }
    if (!is_float && digits.size() > 1 && digits[0] == '0' && digits.find_first_not_of('0') != std::string::npos) {
      throw SyntaxError("leading zeros in decimal integer literals are not permitted", line_, start_col);
    }
    if (!is_float && (digits.size() > 19 || (digits.size() == 19 && digits > "9223372036854775807"))) {
      throw SyntaxError("integer literal too large", line_, start_col);
    }
    push(is_float ? TokenKind::floating : TokenKind::integer, digits, line_, start_col);
    pos_ = p;
  }

  const std::string& src_;
  size_t pos_{0};
  size_t line_start_{0};
  int line_{1};
  int depth_{0};
  char open_bracket_{'('};
  int open_line_{0};
  int open_column_{0};
  bool at_line_start_{true};
  std::vector<int> indents_;
  std::vector<Token> tokens_;
};

}  // namespace

bool is_keyword(const std::string& word) {
  static const std::unordered_set<std::string> kKeywords = {
      "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class",
      "continue", "def", "del", "elif", "else", "except", "finally", "for", "from", "global",
      "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass", "raise",
      "return", "try", "while", "with", "yield",
  };
  return kKeywords.count(word) != 0;
}

std::string decode_escapes(const std::string& body, int line, int column) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) {
      out += c;
      continue;
    }
    const char n = body[++i];
    switch (n) {
      case '\n': break;
      case '\\': out += '\\'; break;
      case '\'': out += '\''; break;
      case '"': out += '"'; break;
      case 'n': out += '\n'; break;
      case 't': out += '\t'; break;
      case 'r': out += '\r'; break;
      case '0': out += '\0'; break;
      case 'a': out += '\a'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'v': out += '\v'; break;
      case 'x': {
        const std::string hex = body.substr(i + 1, 2);
        if (hex.size() != 2 || !std::isxdigit(static_cast<unsigned char>(hex[0])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[1]))) {
          throw SyntaxError("truncated \\xXX escape", line, column);
        }
        out += static_cast<char>(std::stoi(hex, nullptr, 16));
        i += 2;
        break;
      }
      default:
        // Unknown escapes are kept verbatim.
        out += '\\';
        out += n;
        break;
    }
  }
  return out;
}

std::vector<Token> tokenize(const std::string& source) { return Lexer(source).run(); }

}  // namespace cordon
