#include "internal/util/text.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

using usagestat::util::CollapseWhitespace;
using usagestat::util::DeriveShortDescription;
using usagestat::util::NormalizeTags;
using usagestat::util::ParseTagsString;
using usagestat::util::ParseUnsigned;
using usagestat::util::TagsToString;
using usagestat::util::ToLower;

void TestNormalizeTagsTrimsLowercasesAndDedupes() {
  const auto tags = NormalizeTags({"B", "a", "a", " C "});
  assert((tags == std::vector<std::string>{"b", "a", "c"}));
}

void TestNormalizeTagsDropsEmptiesAndCollapsesInnerWhitespace() {
  const auto tags = NormalizeTags({"", "   ", "Data   Science", "data science"});
  assert((tags == std::vector<std::string>{"data science"}));
}

void TestStopwordsOnlyFilteredOnRequest() {
  assert((NormalizeTags({"the", "weather"}) == std::vector<std::string>{"the", "weather"}));
  assert((NormalizeTags({"the", "weather"}, true) == std::vector<std::string>{"weather"}));
  assert((NormalizeTags({"Get", "to", "celsius"}, true) == std::vector<std::string>{"celsius"}));
}

void TestTagStringRoundTrip() {
  const auto tags = NormalizeTags({"B", "a", "a", " C "});
  assert(TagsToString(tags) == "b,a,c");
  assert(ParseTagsString(TagsToString(tags)) == tags);
  assert((ParseTagsString(" x ,, y,") == std::vector<std::string>{"x", "y"}));
  assert(ParseTagsString("").empty());
}

void TestCollapseWhitespace() {
  assert(CollapseWhitespace("  weather \t\n forecast  ") == "weather forecast");
  assert(CollapseWhitespace("   ").empty());
}

void TestShortDescriptionTakesFirstSentence() {
  assert(DeriveShortDescription("Get weather data. Supports formats.", "get_weather") == "Get weather data.");
  assert(DeriveShortDescription("Really?  Yes. Sure.", "x") == "Really? Yes.");
  assert(DeriveShortDescription("Really? Yes! Sure", "x") == "Really? Yes!");
  assert(DeriveShortDescription("Hi there! Use it. More", "x") == "Hi there! Use it.");
  assert(DeriveShortDescription("No terminator here", "x") == "No terminator here");
}

void TestShortDescriptionTruncates() {
  const std::string long_text(200, 'w');
  const auto        short_text = DeriveShortDescription(long_text, "x", 20);
  assert(short_text.size() == 20);
  assert(short_text.substr(17) == "...");
}

void TestShortDescriptionFallsBackToName() {
  assert(DeriveShortDescription("", "my_cool_tool") == "My cool tool");
  assert(DeriveShortDescription("  ", "fetch-page") == "Fetch page");
  assert(DeriveShortDescription("", "") == "No description available.");
}

void TestCaseFoldingIsUnicodeAware() {
  assert(ToLower("MÉTÉO") == "météo");
  assert(ToLower("TEMPÉRATURE Ünïcode") == "température ünïcode");
  assert((NormalizeTags({"Météo", "MÉTÉO", " météo "}) == std::vector<std::string>{"météo"}));
  assert(DeriveShortDescription("", "état_du_réseau") == "État du réseau");
}

void TestParseUnsigned() {
  assert(ParseUnsigned("0") == 0u);
  assert(ParseUnsigned("18446744073709551615") == UINT64_MAX);
  assert(!ParseUnsigned("18446744073709551616"));
  assert(!ParseUnsigned(""));
  assert(!ParseUnsigned("-1"));
  assert(!ParseUnsigned("12abc"));
  assert(!ParseUnsigned(" 12"));

  assert(ParseUnsigned("4294967295", UINT32_MAX) == UINT32_MAX);
  assert(!ParseUnsigned("4294967296", UINT32_MAX));
}

} // namespace

int main() {
  TestNormalizeTagsTrimsLowercasesAndDedupes();
  TestNormalizeTagsDropsEmptiesAndCollapsesInnerWhitespace();
  TestStopwordsOnlyFilteredOnRequest();
  TestTagStringRoundTrip();
  TestCollapseWhitespace();
  TestShortDescriptionTakesFirstSentence();
  TestShortDescriptionTruncates();
  TestShortDescriptionFallsBackToName();
  TestCaseFoldingIsUnicodeAware();
  TestParseUnsigned();

  std::cout << "usagestat_unit_text_util: pass\n";
  return 0;
}
