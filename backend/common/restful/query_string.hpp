#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace common {

// Request target split into its path and decoded query parameters.
// Repeated keys keep their first value.
struct RequestTarget {
  std::string path;
  std::map<std::string, std::string> query;

  std::optional<std::string> param(const std::string& key) const;
};

RequestTarget parseTarget(std::string_view target);

// Decodes %XX escapes and '+' as space. Malformed escapes are kept verbatim.
std::string percentDecode(std::string_view text);

// Escapes everything except A-Z a-z 0-9 and - _ . ! ~ * ' ( ), so the result
// can be embedded as a single query parameter value.
std::string percentEncode(std::string_view text);

}
