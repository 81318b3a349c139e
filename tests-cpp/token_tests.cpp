#include <gtest/gtest.h>
#include "../src-cpp/azula-lang/token.hpp"
#include <set>
#include <sstream>
#include <string>

using azula::Token;
using azula::TokenKind;

TEST(Token, ToStringHasFixedShape){
  Token t(TokenKind::LtEq, "<=", "main.az", 3, 14);
  EXPECT_EQ(t.to_string(), "Token LT_EQ (<=) in main.az line 3, character 14");
}

TEST(Token, EndOfFileRendersEmptyLiteral){
  Token t(TokenKind::EndOfFile, "", "t.az", 1, 1);
  EXPECT_EQ(t.to_string(), "Token EOF () in t.az line 1, character 1");
  EXPECT_TRUE(t.literal().empty());
}

TEST(Token, StreamOperatorMatchesToString){
  Token t(TokenKind::Identifier, "x", "t.az", 1, 4);
  std::ostringstream os;
  os << t;
  EXPECT_EQ(os.str(), t.to_string());
}

TEST(Token, AccessorsReturnConstructionValues){
  Token t(TokenKind::String, "\"hi\"", "lib/a.az", 7, 2);
  EXPECT_EQ(t.kind(), TokenKind::String);
  EXPECT_EQ(t.literal(), "\"hi\"");
  EXPECT_EQ(t.source_file(), "lib/a.az");
  EXPECT_EQ(t.line(), 7u);
  EXPECT_EQ(t.column(), 2u);
}

TEST(Token, OwnsItsText){
  std::string literal = "value";
  std::string file = "f.az";
  Token t(TokenKind::Identifier, literal, file, 1, 1);
  literal.assign("changed");
  file.clear();
  EXPECT_EQ(t.literal(), "value");
  EXPECT_EQ(t.source_file(), "f.az");
}

TEST(Token, EqualityComparesAllFields){
  Token a(TokenKind::Number, "10", "t.az", 1, 9);
  EXPECT_EQ(a, Token(TokenKind::Number, "10", "t.az", 1, 9));
  EXPECT_NE(a, Token(TokenKind::Number, "10", "t.az", 1, 10));
  EXPECT_NE(a, Token(TokenKind::Number, "10", "u.az", 1, 9));
  EXPECT_NE(a, Token(TokenKind::Identifier, "10", "t.az", 1, 9));
}

TEST(TokenKind, DisplayNamesAreUnique){
  std::set<std::string> names;
  for (auto k : azula::all_kinds()) {
    std::string n = azula::kind_name(k);
    EXPECT_NE(n, "?");
    EXPECT_TRUE(names.insert(n).second) << n;
  }
  EXPECT_EQ(names.size(), azula::kind_count);
}

TEST(TokenKind, DelimiterDisplayNames){
  EXPECT_STREQ(azula::kind_name(TokenKind::LParen), "LBRACKET");
  EXPECT_STREQ(azula::kind_name(TokenKind::RParen), "RBRACKET");
  EXPECT_STREQ(azula::kind_name(TokenKind::LBracket), "LSQUARE");
  EXPECT_STREQ(azula::kind_name(TokenKind::RBracket), "RSQUARE");
  EXPECT_STREQ(azula::kind_name(TokenKind::LBrace), "LBRACE");
  EXPECT_EQ(Token(TokenKind::LParen, "(", "t.az", 1, 1).to_string(), "Token LBRACKET (() in t.az line 1, character 1");
  EXPECT_EQ(Token(TokenKind::LBracket, "[", "t.az", 1, 3).to_string(), "Token LSQUARE ([) in t.az line 1, character 3");
}

TEST(TokenKind, OnlyIllegalAndEofAreSentinels){
  for (auto k : azula::all_kinds()) {
    bool want = k == TokenKind::Illegal || k == TokenKind::EndOfFile;
    EXPECT_EQ(azula::is_sentinel(k), want) << k;
  }
}

TEST(TokenKind, Classification){
  EXPECT_TRUE(azula::is_keyword(TokenKind::If));
  EXPECT_TRUE(azula::is_keyword(TokenKind::Type));
  EXPECT_FALSE(azula::is_keyword(TokenKind::Identifier));
  EXPECT_TRUE(azula::is_operator(TokenKind::GtEq));
  EXPECT_TRUE(azula::is_operator(TokenKind::Not));
  EXPECT_FALSE(azula::is_operator(TokenKind::Assign));
  EXPECT_TRUE(azula::is_sentinel(TokenKind::Illegal));
  EXPECT_TRUE(azula::is_sentinel(TokenKind::EndOfFile));
  EXPECT_FALSE(azula::is_sentinel(TokenKind::Number));
}
