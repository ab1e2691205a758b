#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace usagestat::util {

/*
  Tag and description helpers.

  Pure functions, safe for concurrent use.
*/

// Lowercase, trim, collapse inner whitespace, drop empties and duplicates
// (first occurrence wins). With filter_stopwords, common English stopwords
// are dropped unless they contain '_'.
std::vector<std::string> NormalizeTags(const std::vector<std::string>& tags, bool filter_stopwords = false);

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> ParseTagsString(std::string_view value);

std::string TagsToString(const std::vector<std::string>& tags);

// Trim and collapse every whitespace run to a single space.
std::string CollapseWhitespace(std::string_view value);

// Unicode lowercase of UTF-8 text ("MÉTÉO" -> "météo").
std::string ToLower(std::string_view value);

// Lowercase with a titlecased first character ("éTAT" -> "État").
std::string Capitalize(std::string_view value);

// Decimal digits only; std::nullopt on anything else or above max.
std::optional<uint64_t> ParseUnsigned(std::string_view value, uint64_t max = std::numeric_limits<uint64_t>::max());

// First sentence of description, truncated to max_length with "...".
// Falls back to a humanized name: "my_cool_tool" -> "My cool tool".
std::string DeriveShortDescription(std::string_view description, std::string_view fallback_name, std::size_t max_length = 160);

} // namespace usagestat::util
