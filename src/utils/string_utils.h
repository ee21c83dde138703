/**
 * @file string_utils.h
 * @brief Small string helpers shared by DSN parsing, config and SQL handling
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace binlogsync::utils {

/**
 * @brief ASCII lower-case copy
 */
std::string ToLower(std::string_view text);

std::string ToUpper(std::string_view text);

/**
 * @brief ASCII case-insensitive equality
 */
bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);

/**
 * @brief Strip leading and trailing whitespace
 */
std::string Trim(std::string_view text);

/**
 * @brief Split on a single delimiter, keeping empty pieces
 */
std::vector<std::string> Split(std::string_view text, char delimiter);

/**
 * @brief Decode %XX escapes and '+' as used in DSN query strings
 * @return Decoded text, or nullopt on a malformed escape
 */
std::optional<std::string> PercentDecode(std::string_view text);

/**
 * @brief Encode characters that would break a DSN query string
 */
std::string PercentEncode(std::string_view text);

/**
 * @brief Parse a base-10 unsigned integer that must consume the whole input
 */
std::optional<uint64_t> ParseUint64(std::string_view text);

/**
 * @brief Escape a value for use inside a single-quoted SQL string literal
 */
std::string EscapeSqlString(std::string_view text);

/**
 * @brief Quote an identifier with backticks, doubling embedded backticks
 */
std::string QuoteIdentifier(std::string_view identifier);

}  // namespace binlogsync::utils
