#include "strings.hpp"

#include <algorithm>
#include <ctype.h>

namespace utils::strings {

namespace {
char FoldCase(char curr) {
  return static_cast<char>(tolower(static_cast<unsigned char>(curr)));
}

bool IsQuote(char curr) { return curr == '"'; }
} // namespace

bool IsBlank(std::string_view value) {
  return std::all_of(value.begin(), value.end(), [](char curr) {
    return isspace(static_cast<unsigned char>(curr)) != 0;
  });
}

std::string UnQuote(std::string_view value) {
  if (value.size() >= 2 && IsQuote(value.front()) && IsQuote(value.back())) {
    return std::string(value.substr(1, value.size() - 2));
  }
  return std::string(value);
}

std::string ToLower(std::string_view value) {
  std::string result;
  result.reserve(value.size());
  for (char curr : value) {
    result.push_back(FoldCase(curr));
  }
  return result;
}

bool EqualsIgnoreCase(std::string_view left, std::string_view right) {
  return left.size() == right.size() &&
         std::equal(left.begin(), left.end(), right.begin(),
                    [](char a, char b) { return FoldCase(a) == FoldCase(b); });
}

bool CaseInsensitiveLess::operator()(std::string_view left,
                                     std::string_view right) const {
  return std::lexicographical_compare(
      left.begin(), left.end(), right.begin(), right.end(),
      [](char a, char b) { return FoldCase(a) < FoldCase(b); });
}

} // namespace utils::strings
