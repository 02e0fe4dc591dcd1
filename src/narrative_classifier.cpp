#include "narrative_classifier.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>
#include <utility>

namespace {

const size_t kBannerScanLimit = 5;
const size_t kHeaderColonLimit = 40;

struct SectionPattern {
  std::regex pattern;
  NarrativeSection section;
  // When set, one of these must also occur somewhere after the prefix.
  std::vector<std::string> anyOf;
};

// First match wins; matched against the upper-cased paragraph. Patterns stay
// anchored prefixes without open-ended repetition.
const std::vector<SectionPattern>& sectionPatterns() {
  static const std::vector<SectionPattern> patterns = {
    {std::regex("^APPROACH TO\\b"), NarrativeSection::Approach, {"SHORTFALL", "TARGET"}},
    {std::regex("^OTHER VAT\\b|^OTHER ACTIVITIES"), NarrativeSection::Other, {}},
    {std::regex("^OPEN OPP"), NarrativeSection::OpenOpportunities, {}},
    {std::regex("^BIG PLAY"), NarrativeSection::BigPlays, {}},
    {std::regex("^ACCOUNT GOAL"), NarrativeSection::AccountGoals, {}},
    {std::regex("^RELATIONSHIP"), NarrativeSection::Relationships, {}},
    {std::regex("^RESEARCH"), NarrativeSection::Research, {}},
  };
  return patterns;
}

bool containsAny(const std::string& text, const std::vector<std::string>& words) {
  return std::any_of(words.begin(), words.end(), [&](const std::string& w) { return contains(text, w); });
}

const std::unordered_set<std::string>& redundantLabels() {
  static const std::unordered_set<std::string> labels = {
    "STATUS OVERALL", "RAISED BY", "DESCRIPTION", "IMPACT",
    "DATE RISK BECOMES ISSUE", "STATUS", "OWNER", "IMPACT RATING",
    "LIKELIHOOD", "MITIGATION", "COMMENTS", "RISK RATING",
    "ISSUE RATING", "RISKS", "ISSUES", "RISK", "ISSUE",
    "PEOPLE", "PROCESS", "PEOPLE PROCESS", "WEEK ENDING",
  };
  return labels;
}

} // namespace

size_t bannerParagraphCount(const std::vector<std::string>& paragraphs) {
  static const std::regex leadingNumber("^[0-9]{1,2}\\s");
  static const std::regex bareYear("^[0-9]{4}$");

  size_t count = 0;
  for (size_t i = 0; i < std::min(kBannerScanLimit, paragraphs.size()); ++i) {
    std::string upper = toUpper(paragraphs[i]);
    if (contains(upper, "VAT REPORT") || contains(upper, "OVERALL STATUS") ||
        std::regex_search(paragraphs[i], leadingNumber) ||
        std::regex_match(trim(paragraphs[i]), bareYear)) {
      count = i + 1;
    }
  }
  return count;
}

bool isRedundantLabel(const std::string& text) {
  std::string upper = toUpper(trim(text));
  if (isStatusToken(upper)) return true;
  if (redundantLabels().count(upper) > 0) return true;
  if (startsWith(upper, "WEEK ENDING")) return true;
  return contains(upper, "VAT REPORT") && upper.size() < 30;
}

bool detectSectionHeader(const std::string& text, NarrativeSection& section) {
  std::string upper = toUpper(text);
  for (const auto& p : sectionPatterns()) {
    if (std::regex_search(upper, p.pattern) && (p.anyOf.empty() || containsAny(upper, p.anyOf))) {
      section = p.section;
      return true;
    }
  }
  return false;
}

NarrativeText classifyNarrative(const std::vector<std::string>& paragraphs) {
  std::array<std::vector<std::string>, kNarrativeSectionCount> lines;
  NarrativeSection current = NarrativeSection::Summary;

  for (size_t i = bannerParagraphCount(paragraphs); i < paragraphs.size(); ++i) {
    std::string p = trim(paragraphs[i]);
    if (p.empty() || isRedundantLabel(p)) continue;

    NarrativeSection header = current;
    if (detectSectionHeader(p, header)) {
      current = header;
      size_t colon = p.find(':');
      if (colon != std::string::npos && colon < kHeaderColonLimit) {
        std::string afterColon = trim(p.substr(colon + 1));
        if (!afterColon.empty()) lines[static_cast<size_t>(current)].push_back(afterColon);
      } else {
        lines[static_cast<size_t>(current)].push_back(p);
      }
      continue;
    }

    lines[static_cast<size_t>(current)].push_back(p);
  }

  NarrativeText text;
  for (size_t s = 0; s < kNarrativeSectionCount; ++s) {
    text.sections[s] = trim(joinLines(lines[s]));
  }
  return text;
}
