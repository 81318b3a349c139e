#include <benchmark/benchmark.h>
#include "../src-cpp/azula-lang/keywords.hpp"
#include "../src-cpp/azula-lang/lexer.hpp"
#include <string>

static std::string make_source(int funcs) {
  std::string src;
  for (int i = 0; i < funcs; ++i) {
    src += "func f" + std::to_string(i) + "(a: int, b: float) : bool {\n";
    src += "  if a >= 10 and b != 2.5 { return true; } elseif a % 3 == 0 { return false; }\n";
    src += "  // comment line\n  s = \"text \\\"quoted\\\"\";\n  return a < b;\n}\n";
  }
  return src;
}

static void BM_Lex(benchmark::State& state) {
  const std::string src = make_source((int)state.range(0));
  for (auto _ : state) {
    azula::Lexer lx(src, "bench.az");
    auto toks = lx.Lex();
    benchmark::DoNotOptimize(toks.data());
  }
  state.SetBytesProcessed((int64_t)state.iterations() * (int64_t)src.size());
}

BENCHMARK(BM_Lex)->Arg(10)->Arg(100)->Arg(1000);

static void BM_KeywordResolve(benchmark::State& state) {
  const auto& kw = azula::KeywordTable::standard();
  const char* words[] = {"if", "elseif", "counter", "return", "x", "struct", "value_1"};
  for (auto _ : state) {
    for (const char* w : words) {
      auto r = kw.resolve(w);
      benchmark::DoNotOptimize(r);
    }
  }
}

BENCHMARK(BM_KeywordResolve);

BENCHMARK_MAIN();
