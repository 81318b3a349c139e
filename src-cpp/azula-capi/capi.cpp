#include "capi.hpp"
#include "../azula-lang/lexer.hpp"
#include "../azula-lang/token_json.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

using json = nlohmann::json;

static char* dup_utf8(const std::string& s){
  char* p = (char*)::malloc(s.size()+1);
  if (!p) return nullptr;
  std::memcpy(p, s.data(), s.size());
  p[s.size()] = '\0';
  return p;
}

static std::string dump(const json& j){
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

extern "C" {

AZULA_API void azula_free(char* ptr){ if(ptr) ::free(ptr); }

AZULA_API int azula_tokenize(const char* source_utf8, const char* file_utf8, char** out_json, char** out_error){
  if (!source_utf8 || !file_utf8 || !out_json || !out_error) return 1;
  *out_json = nullptr; *out_error = nullptr;
  try{
    azula::Lexer lex(source_utf8, file_utf8);
    auto toks = lex.Lex();
    *out_json = dup_utf8(dump(azula::lex_result_json(toks, lex.diagnostics())));
    if (!*out_json) { *out_error = dup_utf8("alloc failure"); return 2; }
    return 0;
  } catch (const std::exception& ex){
    *out_error = dup_utf8(ex.what());
    return 3;
  }
}

AZULA_API int azula_check_source(const char* source_utf8, const char* file_utf8, char** out_json, char** out_error){
  if (!source_utf8 || !file_utf8 || !out_json || !out_error) return 1;
  *out_json = nullptr; *out_error = nullptr;
  try{
    azula::Lexer lex(source_utf8, file_utf8);
    lex.Lex();
    json out; out["diagnostics"] = json::array();
    for (auto& d : lex.diagnostics()) out["diagnostics"].push_back(d);
    *out_json = dup_utf8(dump(out));
    if (!*out_json) { *out_error = dup_utf8("alloc failure"); return 2; }
    return lex.diagnostics().empty() ? 0 : 4;
  } catch (const std::exception& ex){
    *out_error = dup_utf8(ex.what());
    return 3;
  }
}

} // extern "C"
