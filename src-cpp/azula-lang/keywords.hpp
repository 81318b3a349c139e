#pragma once
#include "token.hpp"
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace azula {

// Reserved spelling -> kind. Immutable once constructed, so a single instance
// may be shared by any number of lexers on any number of threads.
class KeywordTable {
public:
  using Map = std::unordered_map<std::string, TokenKind>;

  // Throws std::invalid_argument for a key that is not identifier-shaped or
  // appears twice.
  KeywordTable(std::initializer_list<std::pair<const char *, TokenKind>> entries);

  // The Azula reserved words.
  static const KeywordTable &standard();

  std::optional<TokenKind> resolve(std::string_view candidate) const;
  bool contains(std::string_view candidate) const { return resolve(candidate).has_value(); }
  std::size_t size() const { return map_.size(); }

  Map::const_iterator begin() const { return map_.begin(); }
  Map::const_iterator end() const { return map_.end(); }

private:
  Map map_;
};

bool is_identifier_shaped(std::string_view s);

} // namespace azula
