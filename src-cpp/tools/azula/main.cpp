#include "../../azula-lang/lexer.hpp"
#include "../../azula-lang/token_json.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char *kVersion = "azula 0.1.0";
constexpr const char *kUsage =
    "Usage: azula [--tokens|--json|--check] [--out PATH] [--jobs N] [--trace] <file>...\n"
    "       azula --help | --version\n";

bool g_trace = false;

template <typename... Args>
void trace(fmt::format_string<Args...> f, Args &&...args) {
  if (g_trace)
    fmt::print(stderr, "[cli] {}\n", fmt::format(f, std::forward<Args>(args)...));
}

struct FileResult {
  std::string path;
  bool readable{false};
  std::vector<azula::Token> tokens;
  std::vector<std::string> diags;
};

FileResult lex_file(const std::string &path) {
  FileResult r;
  r.path = path;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return r;
  std::stringstream ss;
  ss << ifs.rdbuf();
  r.readable = true;
  azula::Lexer lx(ss.str(), path);
  r.tokens = lx.Lex();
  r.diags  = lx.diagnostics();
  return r;
}

// Each file gets its own Lexer; only the keyword table is shared.
std::vector<FileResult> lex_all(const std::vector<std::string> &files, std::size_t jobs) {
  std::vector<FileResult> out;
  out.reserve(files.size());
  for (std::size_t i = 0; i < files.size(); i += jobs) {
    std::vector<std::future<FileResult>> batch;
    for (std::size_t j = i; j < std::min(files.size(), i + jobs); ++j)
      batch.push_back(std::async(jobs > 1 ? std::launch::async : std::launch::deferred, lex_file, files[j]));
    for (auto &f : batch) {
      out.push_back(f.get());
      trace("lexed {} ({} tokens)", out.back().path, out.back().tokens.size());
    }
  }
  return out;
}

void write_text_atomic(const fs::path &target, const std::string &text) {
  std::error_code ec;
  if (auto parent = target.parent_path(); !parent.empty())
    fs::create_directories(parent, ec);
  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      throw std::runtime_error(std::string("cannot open temp file: ") + tmp.string());
    out.write(text.data(), (std::streamsize)text.size());
    out.flush();
    if (!out)
      throw std::runtime_error(std::string("cannot flush temp file: ") + tmp.string());
  }
#if defined(_WIN32)
  fs::remove(target, ec);
#endif
  fs::rename(tmp, target, ec);
  if (ec)
    throw std::runtime_error(std::string("rename failed: ") + tmp.string() + " -> " + target.string() + ": " + ec.message());
}

std::string dump(const json &j) {
  return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

} // namespace

int main(int argc, char **argv) {
  if (const char *env = std::getenv("AZULA_TRACE"); env && std::string(env) == "1")
    g_trace = true;

  std::string mode = argc >= 2 ? argv[1] : "";
  if (mode == "--help" || argc < 2) {
    fmt::print("{}", kUsage);
    return 0;
  }
  if (mode == "--version") {
    fmt::print("{}\n", kVersion);
    return 0;
  }
  if (!(mode == "--tokens" || mode == "--json" || mode == "--check")) {
    fmt::print("{}", kUsage);
    return 2;
  }

  fs::path outPath;
  std::size_t jobs = 1;
  std::vector<std::string> files;
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--out=", 0) == 0) { outPath = fs::path(a.substr(6)); continue; }
    if (a == "--out" && i + 1 < argc) { outPath = fs::path(argv[++i]); continue; }
    if (a == "--jobs" && i + 1 < argc) { jobs = (std::size_t)std::max(1L, std::strtol(argv[++i], nullptr, 10)); continue; }
    if (a == "--trace") { g_trace = true; continue; }
    if (!a.empty() && a[0] != '-') { files.push_back(a); continue; }
    fmt::print("unknown option: {}\n{}", a, kUsage);
    return 2;
  }
  if (files.empty()) {
    fmt::print("{}", kUsage);
    return 2;
  }
  trace("mode: {}, files: {}, jobs: {}", mode, files.size(), jobs);

  try {
    auto results = lex_all(files, jobs);
    std::string text;
    int rc = 0;

    if (mode == "--tokens") {
      for (const auto &r : results) {
        if (!r.readable) {
          text += fmt::format("cannot open file: {}\n", r.path);
          rc = 1;
          continue;
        }
        for (const auto &t : r.tokens)
          text += t.to_string() + "\n";
      }
    } else if (mode == "--json") {
      json j = json::object();
      for (const auto &r : results) {
        if (!r.readable) {
          j[r.path] = {{"error", fmt::format("cannot open file: {}", r.path)}};
          rc = 1;
          continue;
        }
        j[r.path] = azula::lex_result_json(r.tokens, r.diags);
      }
      text = dump(j);
    } else {
      json j;
      j["diagnostics"] = json::array();
      for (const auto &r : results) {
        if (!r.readable) {
          j["diagnostics"].push_back(fmt::format("cannot open file: {}", r.path));
          continue;
        }
        for (const auto &d : r.diags)
          j["diagnostics"].push_back(d);
      }
      rc   = j["diagnostics"].empty() ? 0 : 1;
      text = dump(j);
    }

    fmt::print("{}", text);
    if (!outPath.empty()) {
      trace("writing output to: {}", outPath.string());
      write_text_atomic(outPath, text);
    }
    return rc;
  } catch (const std::exception &e) {
    fmt::print("error: {}\n", e.what());
    return 1;
  }
}
