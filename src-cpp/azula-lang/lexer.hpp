#pragma once
#include "keywords.hpp"
#include "token.hpp"
#include <optional>
#include <string>
#include <vector>

namespace azula {

class Lexer {
public:
  explicit Lexer(std::string src, std::string file = "<input>", const KeywordTable &keywords = KeywordTable::standard())
      : src_(std::move(src)), file_(std::move(file)), keywords_(keywords) {}
  // The table is held by reference and must outlive the lexer.
  Lexer(std::string src, std::string file, const KeywordTable &&keywords) = delete;

  // Remaining tokens up to and including the single EndOfFile token.
  std::vector<Token> Lex();
  // One token per call; keeps returning EndOfFile once the input is exhausted.
  Token Next();

  bool done() const { return eof_.has_value(); }
  const std::string &file() const { return file_; }
  const std::vector<std::string> &diagnostics() const { return diags_; }

private:
  bool at_end() const { return pos_ >= src_.size(); }
  char peek(std::size_t ahead = 0) const { return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0'; }
  char get();
  void skip_ws();
  Token make(TokenKind k, std::size_t start, std::size_t line, std::size_t col) const;
  Token illegal(std::size_t start, std::size_t line, std::size_t col, const std::string &why);

  Token identifier(std::size_t start, std::size_t line, std::size_t col);
  Token number(std::size_t start, std::size_t line, std::size_t col);
  Token string_literal(std::size_t start, std::size_t line, std::size_t col);
  std::optional<Token> symbol(std::size_t start, std::size_t line, std::size_t col);

  std::string src_;
  std::string file_;
  const KeywordTable &keywords_;
  std::size_t pos_{0};
  std::size_t line_{1};
  std::size_t col_{1};
  std::size_t cont_{0};
  std::optional<Token> eof_;
  std::vector<std::string> diags_;
};

} // namespace azula
