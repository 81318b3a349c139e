#include "token_stream.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace azula {

TokenStream::TokenStream(std::vector<Token> toks) : t(std::move(toks)) {
  if (t.empty() || t.back().kind() != TokenKind::EndOfFile)
    throw std::invalid_argument("token stream must end with EndOfFile");
  auto eofs = std::count_if(t.begin(), t.end(), [](const Token &tok) { return tok.kind() == TokenKind::EndOfFile; });
  if (eofs != 1)
    throw std::invalid_argument("token stream has more than one EndOfFile");
}

const Token &TokenStream::prev() const {
  return t[i == 0 ? 0 : i - 1];
}

const Token &TokenStream::advance() {
  if (!is_at_end())
    ++i;
  return prev();
}

bool TokenStream::check(TokenKind k) const {
  return peek().kind() == k;
}

bool TokenStream::match(TokenKind k) {
  if (check(k) && !is_at_end()) {
    advance();
    return true;
  }
  return false;
}

bool TokenStream::expect(TokenKind k, const std::string &m) {
  if (match(k))
    return true;
  error_here(m);
  return false;
}

void TokenStream::error_here(const std::string &m) {
  std::ostringstream os;
  os << "[" << peek().source_file() << " " << peek().line() << ":" << peek().column() << "] " << m;
  diags.push_back(os.str());
}

} // namespace azula
