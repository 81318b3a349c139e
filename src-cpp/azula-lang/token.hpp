#pragma once
#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <utility>

namespace azula {

enum class TokenKind {
  Illegal,
  EndOfFile,

  Type,
  Identifier,
  String,
  Number,

  Function,
  Return,
  As,
  Struct,
  True,
  False,

  Assign,    // =
  Colon,     // :
  Semicolon, // ;
  Comma,     // ,

  Plus,
  Minus,
  Asterisk,
  Slash,
  Modulo,
  Eq,    // ==
  NotEq, // !=
  Lt,
  Gt,
  LtEq, // <=
  GtEq, // >=
  Or,
  And,
  Not, // !

  If,
  ElseIf,
  Else,
  Switch,
  Default,
  For,

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
};

inline constexpr std::size_t kind_count = static_cast<std::size_t>(TokenKind::RBracket) + 1;

const std::array<TokenKind, kind_count> &all_kinds();

// Upper-case display name, e.g. "LT_EQ". Parentheses print as LBRACKET/RBRACKET
// and square brackets as LSQUARE/RSQUARE.
const char *kind_name(TokenKind k);

bool is_keyword(TokenKind k);
bool is_operator(TokenKind k);
bool is_sentinel(TokenKind k);

class Token {
public:
  Token(TokenKind kind, std::string literal, std::string source_file, std::size_t line, std::size_t column)
      : kind_(kind), literal_(std::move(literal)), file_(std::move(source_file)), line_(line), col_(column) {}

  TokenKind kind() const {
    return kind_;
  }
  const std::string &literal() const {
    return literal_;
  }
  const std::string &source_file() const {
    return file_;
  }
  std::size_t line() const {
    return line_;
  }
  std::size_t column() const {
    return col_;
  }

  /// Token <KIND> (<literal>) in <file> line <line>, character <column>
  std::string to_string() const;

  friend bool operator==(const Token &a, const Token &b) {
    return a.kind_ == b.kind_ && a.line_ == b.line_ && a.col_ == b.col_ && a.literal_ == b.literal_ && a.file_ == b.file_;
  }
  friend bool operator!=(const Token &a, const Token &b) {
    return !(a == b);
  }

private:
  TokenKind kind_;
  std::string literal_;
  std::string file_;
  std::size_t line_;
  std::size_t col_;
};

std::ostream &operator<<(std::ostream &os, TokenKind k);
std::ostream &operator<<(std::ostream &os, const Token &t);

} // namespace azula
