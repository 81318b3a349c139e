#include "token.hpp"
#include <fmt/format.h>

namespace azula {

const std::array<TokenKind, kind_count> &all_kinds() {
  static const std::array<TokenKind, kind_count> kinds = [] {
    std::array<TokenKind, kind_count> a{};
    for (std::size_t i = 0; i < kind_count; ++i)
      a[i] = static_cast<TokenKind>(i);
    return a;
  }();
  return kinds;
}

const char *kind_name(TokenKind k) {
  switch (k) {
  case TokenKind::Illegal:
    return "ILLEGAL";
  case TokenKind::EndOfFile:
    return "EOF";
  case TokenKind::Type:
    return "TYPE";
  case TokenKind::Identifier:
    return "IDENTIFIER";
  case TokenKind::String:
    return "STRING";
  case TokenKind::Number:
    return "NUMBER";
  case TokenKind::Function:
    return "FUNCTION";
  case TokenKind::Return:
    return "RETURN";
  case TokenKind::As:
    return "AS";
  case TokenKind::Struct:
    return "STRUCT";
  case TokenKind::True:
    return "TRUE";
  case TokenKind::False:
    return "FALSE";
  case TokenKind::Assign:
    return "ASSIGN";
  case TokenKind::Colon:
    return "COLON";
  case TokenKind::Semicolon:
    return "SEMICOLON";
  case TokenKind::Comma:
    return "COMMA";
  case TokenKind::Plus:
    return "PLUS";
  case TokenKind::Minus:
    return "MINUS";
  case TokenKind::Asterisk:
    return "ASTERISK";
  case TokenKind::Slash:
    return "SLASH";
  case TokenKind::Modulo:
    return "MODULO";
  case TokenKind::Eq:
    return "EQ";
  case TokenKind::NotEq:
    return "NOT_EQ";
  case TokenKind::Lt:
    return "LT";
  case TokenKind::Gt:
    return "GT";
  case TokenKind::LtEq:
    return "LT_EQ";
  case TokenKind::GtEq:
    return "GT_EQ";
  case TokenKind::Or:
    return "OR";
  case TokenKind::And:
    return "AND";
  case TokenKind::Not:
    return "NOT";
  case TokenKind::If:
    return "IF";
  case TokenKind::ElseIf:
    return "ELSEIF";
  case TokenKind::Else:
    return "ELSE";
  case TokenKind::Switch:
    return "SWITCH";
  case TokenKind::Default:
    return "DEFAULT";
  case TokenKind::For:
    return "FOR";
  case TokenKind::LParen:
    return "LBRACKET";
  case TokenKind::RParen:
    return "RBRACKET";
  case TokenKind::LBrace:
    return "LBRACE";
  case TokenKind::RBrace:
    return "RBRACE";
  case TokenKind::LBracket:
    return "LSQUARE";
  case TokenKind::RBracket:
    return "RSQUARE";
  }
  return "?";
}

bool is_keyword(TokenKind k) {
  switch (k) {
  case TokenKind::Type:
  case TokenKind::Function:
  case TokenKind::Return:
  case TokenKind::As:
  case TokenKind::Struct:
  case TokenKind::True:
  case TokenKind::False:
  case TokenKind::If:
  case TokenKind::ElseIf:
  case TokenKind::Else:
  case TokenKind::Switch:
  case TokenKind::Default:
  case TokenKind::For:
    return true;
  // "or"/"and" are keywords too, but also have symbolic spellings
  case TokenKind::Or:
  case TokenKind::And:
    return true;
  case TokenKind::Illegal:
  case TokenKind::EndOfFile:
  case TokenKind::Identifier:
  case TokenKind::String:
  case TokenKind::Number:
  case TokenKind::Assign:
  case TokenKind::Colon:
  case TokenKind::Semicolon:
  case TokenKind::Comma:
  case TokenKind::Plus:
  case TokenKind::Minus:
  case TokenKind::Asterisk:
  case TokenKind::Slash:
  case TokenKind::Modulo:
  case TokenKind::Eq:
  case TokenKind::NotEq:
  case TokenKind::Lt:
  case TokenKind::Gt:
  case TokenKind::LtEq:
  case TokenKind::GtEq:
  case TokenKind::Not:
  case TokenKind::LParen:
  case TokenKind::RParen:
  case TokenKind::LBrace:
  case TokenKind::RBrace:
  case TokenKind::LBracket:
  case TokenKind::RBracket:
    return false;
  }
  return false;
}

bool is_operator(TokenKind k) {
  switch (k) {
  case TokenKind::Plus:
  case TokenKind::Minus:
  case TokenKind::Asterisk:
  case TokenKind::Slash:
  case TokenKind::Modulo:
  case TokenKind::Eq:
  case TokenKind::NotEq:
  case TokenKind::Lt:
  case TokenKind::Gt:
  case TokenKind::LtEq:
  case TokenKind::GtEq:
  case TokenKind::Or:
  case TokenKind::And:
  case TokenKind::Not:
    return true;
  case TokenKind::Illegal:
  case TokenKind::EndOfFile:
  case TokenKind::Type:
  case TokenKind::Identifier:
  case TokenKind::String:
  case TokenKind::Number:
  case TokenKind::Function:
  case TokenKind::Return:
  case TokenKind::As:
  case TokenKind::Struct:
  case TokenKind::True:
  case TokenKind::False:
  case TokenKind::Assign:
  case TokenKind::Colon:
  case TokenKind::Semicolon:
  case TokenKind::Comma:
  case TokenKind::If:
  case TokenKind::ElseIf:
  case TokenKind::Else:
  case TokenKind::Switch:
  case TokenKind::Default:
  case TokenKind::For:
  case TokenKind::LParen:
  case TokenKind::RParen:
  case TokenKind::LBrace:
  case TokenKind::RBrace:
  case TokenKind::LBracket:
  case TokenKind::RBracket:
    return false;
  }
  return false;
}

bool is_sentinel(TokenKind k) {
  switch (k) {
  case TokenKind::Illegal:
  case TokenKind::EndOfFile:
    return true;
  case TokenKind::Type:
  case TokenKind::Identifier:
  case TokenKind::String:
  case TokenKind::Number:
  case TokenKind::Function:
  case TokenKind::Return:
  case TokenKind::As:
  case TokenKind::Struct:
  case TokenKind::True:
  case TokenKind::False:
  case TokenKind::Assign:
  case TokenKind::Colon:
  case TokenKind::Semicolon:
  case TokenKind::Comma:
  case TokenKind::Plus:
  case TokenKind::Minus:
  case TokenKind::Asterisk:
  case TokenKind::Slash:
  case TokenKind::Modulo:
  case TokenKind::Eq:
  case TokenKind::NotEq:
  case TokenKind::Lt:
  case TokenKind::Gt:
  case TokenKind::LtEq:
  case TokenKind::GtEq:
  case TokenKind::Or:
  case TokenKind::And:
  case TokenKind::Not:
  case TokenKind::If:
  case TokenKind::ElseIf:
  case TokenKind::Else:
  case TokenKind::Switch:
  case TokenKind::Default:
  case TokenKind::For:
  case TokenKind::LParen:
  case TokenKind::RParen:
  case TokenKind::LBrace:
  case TokenKind::RBrace:
  case TokenKind::LBracket:
  case TokenKind::RBracket:
    return false;
  }
  return false;
}

std::string Token::to_string() const {
  return fmt::format("Token {} ({}) in {} line {}, character {}", kind_name(kind_), literal_, file_, line_, col_);
}

std::ostream &operator<<(std::ostream &os, TokenKind k) {
  return os << kind_name(k);
}

std::ostream &operator<<(std::ostream &os, const Token &t) {
  return os << t.to_string();
}

} // namespace azula
