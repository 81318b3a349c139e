#pragma once
#include "token.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace azula {

void to_json(nlohmann::json &j, const Token &t);

// {"tokens": [...], "diagnostics": [...]}
nlohmann::json lex_result_json(const std::vector<Token> &toks, const std::vector<std::string> &diags);

} // namespace azula
