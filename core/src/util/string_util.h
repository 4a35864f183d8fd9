#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cryoql::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep matching deterministic.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);
/// Joins argv-style parts with single spaces for logging and reproduction.
std::string join(const std::vector<std::string>& parts, const std::string& sep = " ");
/// Decodes an Ethereum JSON-RPC quantity ("0x1a") into an integer.
/// Returns nullopt for empty, non-hex or overflowing input.
std::optional<int64_t> parse_hex_quantity(const std::string& text);
/// Escapes a value for use inside a single-quoted SQL string literal.
std::string sql_quote_literal(const std::string& value);
/// Wraps an identifier in double quotes, doubling embedded quotes.
std::string sql_quote_identifier(const std::string& name);

}  // namespace cryoql::util
