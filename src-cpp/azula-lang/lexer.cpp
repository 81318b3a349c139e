#include "lexer.hpp"
#include <cctype>
#include <fmt/format.h>

namespace azula {

namespace {

struct TwoChar {
  char a, b;
  TokenKind kind;
};

// Checked before the single-character forms (maximal munch).
constexpr TwoChar kTwoChar[] = {
    {'=', '=', TokenKind::Eq},
    {'!', '=', TokenKind::NotEq},
    {'<', '=', TokenKind::LtEq},
    {'>', '=', TokenKind::GtEq},
    {'&', '&', TokenKind::And},
    {'|', '|', TokenKind::Or},
};

bool is_ident_start(char c) {
  return std::isalpha((unsigned char)c) || c == '_';
}
bool is_ident_char(char c) {
  return std::isalnum((unsigned char)c) || c == '_';
}
bool is_digit(char c) {
  return std::isdigit((unsigned char)c) != 0;
}
bool is_continuation(char c) {
  return ((unsigned char)c & 0xC0) == 0x80;
}
// Continuation bytes announced by a UTF-8 lead byte.
std::size_t continuation_bytes(char c) {
  unsigned char b = (unsigned char)c;
  if (b >= 0xC0 && b < 0xE0)
    return 1;
  if (b >= 0xE0 && b < 0xF0)
    return 2;
  if (b >= 0xF0 && b < 0xF8)
    return 3;
  return 0;
}

} // namespace

// Every consumed character goes through here. Columns count code points: only
// the continuation bytes a lead byte announced are zero-width, a stray one
// counts as a character of its own.
char Lexer::get() {
  if (at_end())
    return '\0';
  char c = src_[pos_++];
  if (c == '\n') {
    ++line_;
    col_  = 1;
    cont_ = 0;
  } else if (is_continuation(c) && cont_ > 0) {
    --cont_;
  } else {
    ++col_;
    cont_ = continuation_bytes(c);
  }
  return c;
}

void Lexer::skip_ws() {
  for (;;) {
    char c = peek();
    if (at_end()) {
      break;
    } else if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      get();
    } else if (c == '/' && peek(1) == '/') {
      while (!at_end() && peek() != '\n')
        get();
    } else {
      break;
    }
  }
}

Token Lexer::make(TokenKind k, std::size_t start, std::size_t line, std::size_t col) const {
  return Token(k, src_.substr(start, pos_ - start), file_, line, col);
}

Token Lexer::illegal(std::size_t start, std::size_t line, std::size_t col, const std::string &why) {
  Token t = make(TokenKind::Illegal, start, line, col);
  diags_.push_back(fmt::format("{}:{}:{}: {}", file_, line, col, why));
  return t;
}

Token Lexer::identifier(std::size_t start, std::size_t line, std::size_t col) {
  while (!at_end() && is_ident_char(peek()))
    get();
  std::string_view text(src_.data() + start, pos_ - start);
  auto kw = keywords_.resolve(text);
  return make(kw ? *kw : TokenKind::Identifier, start, line, col);
}

Token Lexer::number(std::size_t start, std::size_t line, std::size_t col) {
  while (!at_end() && is_digit(peek()))
    get();
  if (peek() == '.' && is_digit(peek(1))) {
    get();
    while (!at_end() && is_digit(peek()))
      get();
  }
  return make(TokenKind::Number, start, line, col);
}

// A string may not span lines. Hitting a newline or the end of input before
// the closing quote yields one Illegal token for the partial run.
Token Lexer::string_literal(std::size_t start, std::size_t line, std::size_t col) {
  get(); // opening quote
  for (;;) {
    if (at_end() || peek() == '\n')
      return illegal(start, line, col, "unterminated string literal");
    char c = get();
    if (c == '\\') {
      if (!at_end() && peek() != '\n')
        get();
      continue;
    }
    if (c == '"')
      return make(TokenKind::String, start, line, col);
  }
}

std::optional<Token> Lexer::symbol(std::size_t start, std::size_t line, std::size_t col) {
  char c = peek();
  for (const auto &tc : kTwoChar) {
    if (c == tc.a && peek(1) == tc.b) {
      get();
      get();
      return make(tc.kind, start, line, col);
    }
  }

  TokenKind k;
  switch (c) {
  case '=':
    k = TokenKind::Assign;
    break;
  case ':':
    k = TokenKind::Colon;
    break;
  case ';':
    k = TokenKind::Semicolon;
    break;
  case ',':
    k = TokenKind::Comma;
    break;
  case '+':
    k = TokenKind::Plus;
    break;
  case '-':
    k = TokenKind::Minus;
    break;
  case '*':
    k = TokenKind::Asterisk;
    break;
  case '/':
    k = TokenKind::Slash;
    break;
  case '%':
    k = TokenKind::Modulo;
    break;
  case '<':
    k = TokenKind::Lt;
    break;
  case '>':
    k = TokenKind::Gt;
    break;
  case '!':
    k = TokenKind::Not;
    break;
  case '(':
    k = TokenKind::LParen;
    break;
  case ')':
    k = TokenKind::RParen;
    break;
  case '{':
    k = TokenKind::LBrace;
    break;
  case '}':
    k = TokenKind::RBrace;
    break;
  case '[':
    k = TokenKind::LBracket;
    break;
  case ']':
    k = TokenKind::RBracket;
    break;
  default:
    return std::nullopt;
  }
  get();
  return make(k, start, line, col);
}

Token Lexer::Next() {
  if (eof_)
    return *eof_;

  skip_ws();
  std::size_t start = pos_, tok_line = line_, tok_col = col_;
  if (at_end()) {
    eof_ = Token(TokenKind::EndOfFile, "", file_, tok_line, tok_col);
    return *eof_;
  }

  char c = peek();
  if (is_ident_start(c))
    return identifier(start, tok_line, tok_col);
  if (is_digit(c))
    return number(start, tok_line, tok_col);
  if (c == '"')
    return string_literal(start, tok_line, tok_col);
  if (auto t = symbol(start, tok_line, tok_col))
    return std::move(*t);

  // One character, taking a whole UTF-8 sequence for non-ASCII input.
  get();
  while (cont_ > 0 && !at_end() && is_continuation(peek()))
    get();
  return illegal(start, tok_line, tok_col, fmt::format("illegal character '{}'", src_.substr(start, pos_ - start)));
}

std::vector<Token> Lexer::Lex() {
  std::vector<Token> out;
  for (;;) {
    out.push_back(Next());
    if (out.back().kind() == TokenKind::EndOfFile)
      break;
  }
  return out;
}

} // namespace azula
