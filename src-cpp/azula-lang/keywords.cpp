#include "keywords.hpp"
#include <cctype>
#include <stdexcept>

namespace azula {

bool is_identifier_shaped(std::string_view s) {
  if (s.empty())
    return false;
  if (!(std::isalpha((unsigned char)s[0]) || s[0] == '_'))
    return false;
  for (char c : s) {
    if (!(std::isalnum((unsigned char)c) || c == '_'))
      return false;
  }
  return true;
}

KeywordTable::KeywordTable(std::initializer_list<std::pair<const char *, TokenKind>> entries) {
  map_.reserve(entries.size());
  for (const auto &e : entries) {
    std::string key = e.first ? e.first : "";
    if (!is_identifier_shaped(key))
      throw std::invalid_argument("keyword is not identifier-shaped: '" + key + "'");
    if (!map_.emplace(key, e.second).second)
      throw std::invalid_argument("duplicate keyword: '" + key + "'");
  }
}

const KeywordTable &KeywordTable::standard() {
  static const KeywordTable table = {
      {"int", TokenKind::Type},
      {"bool", TokenKind::Type},
      {"string", TokenKind::Type},
      {"float", TokenKind::Type},
      {"error", TokenKind::Type},
      {"void", TokenKind::Type},

      {"func", TokenKind::Function},
      {"return", TokenKind::Return},
      {"as", TokenKind::As},
      {"struct", TokenKind::Struct},

      {"true", TokenKind::True},
      {"false", TokenKind::False},
      {"or", TokenKind::Or},
      {"and", TokenKind::And},

      {"if", TokenKind::If},
      {"elseif", TokenKind::ElseIf},
      {"else", TokenKind::Else},

      {"switch", TokenKind::Switch},
      {"default", TokenKind::Default},

      {"for", TokenKind::For},
  };
  return table;
}

std::optional<TokenKind> KeywordTable::resolve(std::string_view candidate) const {
  // unordered_map<std::string> has no heterogeneous find before C++20
  auto it = map_.find(std::string(candidate));
  if (it == map_.end())
    return std::nullopt;
  return it->second;
}

} // namespace azula
