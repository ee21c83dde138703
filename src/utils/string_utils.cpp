/**
 * @file string_utils.cpp
 * @brief String helper implementation
 */

#include "utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace binlogsync::utils {

namespace {

int HexValue(char chr) {
  if (chr >= '0' && chr <= '9') {
    return chr - '0';
  }
  if (chr >= 'a' && chr <= 'f') {
    return chr - 'a' + 10;  // NOLINT(readability-magic-numbers)
  }
  if (chr >= 'A' && chr <= 'F') {
    return chr - 'A' + 10;  // NOLINT(readability-magic-numbers)
  }
  return -1;
}

bool IsUnreserved(char chr) {
  return std::isalnum(static_cast<unsigned char>(chr)) != 0 || chr == '-' || chr == '_' || chr == '.' || chr == '~' ||
         chr == ':';
}

}  // namespace

std::string ToLower(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return result;
}

std::string ToUpper(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::toupper(chr)); });
  return result;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

std::string Trim(std::string_view text) {
  constexpr std::string_view kWhitespace = " \t\r\n";
  const size_t begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const size_t end = text.find_last_not_of(kWhitespace);
  return std::string(text.substr(begin, end - begin + 1));
}

std::vector<std::string> Split(std::string_view text, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = text.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(text.substr(start));
      break;
    }
    parts.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::optional<std::string> PercentDecode(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char chr = text[i];
    if (chr == '+') {
      result.push_back(' ');
    } else if (chr == '%') {
      if (i + 2 >= text.size()) {
        return std::nullopt;
      }
      int high = HexValue(text[i + 1]);
      int low = HexValue(text[i + 2]);
      if (high < 0 || low < 0) {
        return std::nullopt;
      }
      result.push_back(static_cast<char>((high << 4) | low));
      i += 2;
    } else {
      result.push_back(chr);
    }
  }
  return result;
}

std::string PercentEncode(std::string_view text) {
  static constexpr char kHexDigits[] = "0123456789ABCDEF";
  std::string result;
  result.reserve(text.size());
  for (char chr : text) {
    if (IsUnreserved(chr)) {
      result.push_back(chr);
    } else {
      auto byte = static_cast<unsigned char>(chr);
      result.push_back('%');
      result.push_back(kHexDigits[byte >> 4]);
      result.push_back(kHexDigits[byte & 0x0F]);
    }
  }
  return result;
}

std::optional<uint64_t> ParseUint64(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  uint64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::string EscapeSqlString(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (char chr : text) {
    switch (chr) {
      case '\'':
        result += "\\'";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\0':
        result += "\\0";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      default:
        result.push_back(chr);
    }
  }
  return result;
}

std::string QuoteIdentifier(std::string_view identifier) {
  std::string result = "`";
  for (char chr : identifier) {
    if (chr == '`') {
      result += "``";
    } else {
      result.push_back(chr);
    }
  }
  result += "`";
  return result;
}

}  // namespace binlogsync::utils
