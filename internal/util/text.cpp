#include "text.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>
#include <unordered_set>

namespace usagestat::util {

namespace {

const std::unordered_set<std::string_view>& Stopwords() {
  static const std::unordered_set<std::string_view> kStopwords = {
      "a",  "an", "and", "are", "as", "at",   "be",   "by",   "for", "from", "get",  "has",  "have", "in",
      "is", "it", "its", "of",  "on", "or",   "that", "the",  "this", "to",  "was",  "will", "with",
  };
  return kStopwords;
}

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string ToLower(std::string_view value) {
  // Root locale: full Unicode mapping without language-specific rules.
  auto text = icu::UnicodeString::fromUTF8(icu::StringPiece(value.data(), static_cast<int32_t>(value.size())));
  text.toLower(icu::Locale::getRoot());

  std::string out;
  text.toUTF8String(out);
  return out;
}

std::string Capitalize(std::string_view value) {
  auto text = icu::UnicodeString::fromUTF8(icu::StringPiece(value.data(), static_cast<int32_t>(value.size())));
  text.toLower(icu::Locale::getRoot());
  if (!text.isEmpty()) {
    const UChar32 first = text.char32At(0);
    text.replace(0, U16_LENGTH(first), static_cast<UChar32>(u_totitle(first)));
  }

  std::string out;
  text.toUTF8String(out);
  return out;
}

std::optional<uint64_t> ParseUnsigned(std::string_view value, uint64_t max) {
  uint64_t parsed = 0;
  const auto* end = value.data() + value.size();
  auto [ptr, ec]  = std::from_chars(value.data(), end, parsed);
  if (value.empty() || ec != std::errc() || ptr != end || parsed > max) {
    return std::nullopt;
  }
  return parsed;
}

std::string CollapseWhitespace(std::string_view value) {
  std::string out;
  out.reserve(value.size());

  bool pending_space = false;
  for (char c : value) {
    if (IsSpace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::vector<std::string> NormalizeTags(const std::vector<std::string>& tags, bool filter_stopwords) {
  std::vector<std::string>        result;
  std::unordered_set<std::string> seen;

  for (const auto& tag : tags) {
    auto normalized = ToLower(CollapseWhitespace(tag));
    if (normalized.empty() || seen.count(normalized)) {
      continue;
    }
    if (filter_stopwords && Stopwords().count(normalized) && normalized.find('_') == std::string::npos) {
      continue;
    }
    seen.insert(normalized);
    result.push_back(std::move(normalized));
  }

  return result;
}

std::vector<std::string> ParseTagsString(std::string_view value) {
  std::vector<std::string> out;

  std::size_t start = 0;
  while (start <= value.size()) {
    auto end = value.find(',', start);
    if (end == std::string_view::npos) {
      end = value.size();
    }

    auto token = CollapseWhitespace(value.substr(start, end - start));
    if (!token.empty()) {
      out.push_back(std::move(token));
    }
    start = end + 1;
  }

  return out;
}

std::string TagsToString(const std::vector<std::string>& tags) {
  std::string out;
  for (std::size_t i = 0; i < tags.size(); ++i) {
    if (i) out.push_back(',');
    out += tags[i];
  }
  return out;
}

std::string DeriveShortDescription(std::string_view description, std::string_view fallback_name, std::size_t max_length) {
  auto collapsed = CollapseWhitespace(description);

  if (!collapsed.empty()) {
    // ". " is preferred even when "! " or "? " appears earlier
    for (std::string_view delimiter : {". ", "! ", "? "}) {
      const auto end = collapsed.find(delimiter);
      if (end != std::string::npos) {
        collapsed.resize(end + 1);
        break;
      }
    }

    if (collapsed.size() > max_length) {
      auto cut = collapsed.substr(0, max_length >= 3 ? max_length - 3 : 0);
      while (!cut.empty() && IsSpace(cut.back())) cut.pop_back();
      return cut + "...";
    }
    return collapsed;
  }

  std::string readable(fallback_name);
  std::replace(readable.begin(), readable.end(), '_', ' ');
  std::replace(readable.begin(), readable.end(), '-', ' ');
  readable = Capitalize(CollapseWhitespace(readable));
  if (readable.empty()) {
    return "No description available.";
  }
  return readable;
}

} // namespace usagestat::util
