#include "token_json.hpp"

namespace azula {

void to_json(nlohmann::json &j, const Token &t) {
  j = nlohmann::json{
      {"kind", kind_name(t.kind())},
      {"literal", t.literal()},
      {"file", t.source_file()},
      {"line", t.line()},
      {"column", t.column()},
  };
}

nlohmann::json lex_result_json(const std::vector<Token> &toks, const std::vector<std::string> &diags) {
  nlohmann::json j;
  j["tokens"]      = toks;
  j["diagnostics"] = diags;
  return j;
}

} // namespace azula
