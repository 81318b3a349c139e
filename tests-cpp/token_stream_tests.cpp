#include <gtest/gtest.h>
#include "../src-cpp/azula-lang/lexer.hpp"
#include "../src-cpp/azula-lang/token_stream.hpp"
#include <stdexcept>

using azula::TokenKind;
using azula::TokenStream;

static TokenStream stream(const char* src){
  azula::Lexer lx(src, "s.az");
  return TokenStream(lx.Lex());
}

TEST(TokenStream, WalksTokensInOrder){
  auto ts = stream("func main() { return 1; }");
  EXPECT_TRUE(ts.match(TokenKind::Function));
  EXPECT_EQ(ts.prev().literal(), "func");
  EXPECT_TRUE(ts.check(TokenKind::Identifier));
  EXPECT_EQ(ts.advance().literal(), "main");
  EXPECT_TRUE(ts.expect(TokenKind::LParen, "expected '('"));
  EXPECT_TRUE(ts.expect(TokenKind::RParen, "expected ')'"));
  EXPECT_TRUE(ts.diagnostics().empty());
}

TEST(TokenStream, ExpectRecordsPositionedDiagnostic){
  auto ts = stream("func main(\n  x");
  ts.advance();
  ts.advance();
  ts.advance();
  EXPECT_FALSE(ts.expect(TokenKind::RParen, "expected ')'"));
  ASSERT_EQ(ts.diagnostics().size(), 1u);
  EXPECT_EQ(ts.diagnostics()[0], "[s.az 2:3] expected ')'");
  // nothing consumed on failure
  EXPECT_EQ(ts.peek().literal(), "x");
}

TEST(TokenStream, NeverMovesPastEof){
  auto ts = stream("x");
  ts.advance();
  ASSERT_TRUE(ts.is_at_end());
  auto pos = ts.position();
  EXPECT_EQ(ts.advance().kind(), TokenKind::Identifier);
  EXPECT_EQ(ts.position(), pos);
  EXPECT_TRUE(ts.check(TokenKind::EndOfFile));
  EXPECT_FALSE(ts.match(TokenKind::EndOfFile));
}

TEST(TokenStream, RequiresSingleTrailingEof){
  EXPECT_THROW(TokenStream(std::vector<azula::Token>{}), std::invalid_argument);
  std::vector<azula::Token> no_eof = {azula::Token(TokenKind::Identifier, "x", "s.az", 1, 1)};
  EXPECT_THROW(TokenStream(std::move(no_eof)), std::invalid_argument);
  std::vector<azula::Token> two_eof = {azula::Token(TokenKind::EndOfFile, "", "s.az", 1, 1),
                                       azula::Token(TokenKind::EndOfFile, "", "s.az", 1, 1)};
  EXPECT_THROW(TokenStream(std::move(two_eof)), std::invalid_argument);
}
