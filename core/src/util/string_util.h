#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqljudge::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep comparisons deterministic.
std::string to_lower(std::string_view s);
/// Converts a string to uppercase for keyword matching.
/// MUST avoid locale-sensitive behavior to keep scanning deterministic.
std::string to_upper(std::string_view s);
/// Trims leading and trailing ASCII whitespace.
std::string trim_ws(std::string_view s);
/// True when the text holds only whitespace.
bool is_blank(std::string_view s);
/// Joins parts with a separator.
std::string join(const std::vector<std::string>& parts, std::string_view sep);
/// Shortest stable rendering of a double (%.15g, NaN, Infinity, -Infinity).
std::string format_real(double v);
/// Renders bytes as a SQL blob literal x'..'.
std::string format_blob(const std::string& bytes);
/// Shortens text to at most `max_bytes` bytes plus "...", on a UTF-8 character boundary.
std::string abbreviate(std::string_view s, size_t max_bytes);
/// Returns 1-based line/column for a byte offset.
std::pair<size_t, size_t> line_col_from_offset(const std::string& text, size_t offset);

}  // namespace sqljudge::util
