#pragma once
#include "token.hpp"
#include <string>
#include <vector>

namespace azula {

// Read-only cursor over a lexed token sequence for a parser. Never moves
// past the trailing EndOfFile token.
class TokenStream {
public:
  // Throws std::invalid_argument unless toks ends with exactly one EndOfFile.
  explicit TokenStream(std::vector<Token> toks);

  const Token &peek() const {
    return t[i];
  }
  const Token &prev() const;
  const Token &advance();
  bool is_at_end() const {
    return peek().kind() == TokenKind::EndOfFile;
  }
  bool check(TokenKind k) const;
  bool match(TokenKind k);
  // Consumes a token of kind k, or records m against the current token.
  bool expect(TokenKind k, const std::string &m);
  void error_here(const std::string &m);

  std::size_t position() const {
    return i;
  }
  const std::vector<Token> &tokens() const {
    return t;
  }
  const std::vector<std::string> &diagnostics() const {
    return diags;
  }

private:
  std::vector<Token> t;
  std::size_t i{0};
  std::vector<std::string> diags;
};

} // namespace azula
