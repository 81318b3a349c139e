#include <gtest/gtest.h>
#include "../src-cpp/azula-lang/keywords.hpp"
#include "../src-cpp/azula-lang/lexer.hpp"
#include <future>
#include <string>
#include <vector>

static std::string program(){
  std::string src;
  for (int i = 0; i < 200; ++i) {
    src += "func f" + std::to_string(i) + "(a: int) : bool {\n";
    src += "  if a >= " + std::to_string(i) + " and a != 3.5 { return true; } elseif a % 2 == 0 { return false; }\n";
    src += "  s = \"x\"; // note\n  switch a { default: for [] }\n}\n";
  }
  return src;
}

TEST(Concurrency, IndependentLexersShareKeywordTable){
  const std::string src = program();
  const auto& kw = azula::KeywordTable::standard();
  auto expected = azula::Lexer(src, "c.az", kw).Lex();
  ASSERT_GT(expected.size(), 1000u);

  std::vector<std::future<std::vector<azula::Token>>> runs;
  for (int i = 0; i < 8; ++i)
    runs.push_back(std::async(std::launch::async, [&src, &kw] {
      azula::Lexer lx(src, "c.az", kw);
      return lx.Lex();
    }));
  for (auto& r : runs)
    EXPECT_EQ(r.get(), expected);
}

TEST(Concurrency, StandardTableIsOneInstanceAcrossThreads){
  std::vector<std::future<const azula::KeywordTable*>> runs;
  for (int i = 0; i < 8; ++i)
    runs.push_back(std::async(std::launch::async, [] { return &azula::KeywordTable::standard(); }));
  const azula::KeywordTable* first = nullptr;
  for (auto& r : runs) {
    auto* p = r.get();
    if (!first) first = p;
    EXPECT_EQ(p, first);
  }
  EXPECT_EQ(first->resolve("elseif"), azula::TokenKind::ElseIf);
}
