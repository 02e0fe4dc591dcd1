#include "slide_classifier.hpp"

#include "text_utils.hpp"

#include <regex>

namespace {

const char* const kDeckTitleMarker = "VAT REPORT";
const char* const kDeckSubtitleMarker = "SALES COMMITTEE";
const char* const kStatusUpdateMarker = "PLANNER STATUS";

std::string firstParagraph(const Slide& slide) {
  return slide.paragraphs.empty() ? std::string() : slide.paragraphs.front();
}

} // namespace

const char* slideKindName(SlideKind kind) {
  switch (kind) {
    case SlideKind::DeckTitle: return "deck-title";
    case SlideKind::Blank: return "blank";
    case SlideKind::Title: return "title";
    case SlideKind::StatusUpdate: return "status-update";
    case SlideKind::Content: return "content";
  }
  return "content";
}

std::optional<std::string> resolveEntityName(const std::string& text,
                                             const std::vector<EntityAlias>& aliases) {
  static const std::regex vatWord("\\s*VAT\\s*", std::regex::icase);
  std::string cleaned = toUpper(trim(std::regex_replace(decodeXmlText(text), vatWord, " ")));
  if (cleaned.empty()) return std::nullopt;

  for (const auto& a : aliases) {
    if (cleaned == a.alias || contains(cleaned, a.alias)) {
      return a.canonicalName;
    }
  }
  return std::nullopt;
}

bool isDeckTitlePage(const Slide& slide) {
  if (slide.index != 1) return false;
  std::string first = toUpper(firstParagraph(slide));
  return contains(first, kDeckTitleMarker) && contains(first, kDeckSubtitleMarker);
}

bool isTitleCandidate(const Slide& slide, const ParserOptions& options) {
  return slide.paragraphs.size() <= options.titleSlideMaxParagraphs &&
         slide.byteSize < options.titleSlideMaxBytes &&
         slide.tables.empty();
}

bool isStatusUpdateSlide(const Slide& slide) {
  return startsWith(toUpper(trim(firstParagraph(slide))), kStatusUpdateMarker) &&
         !slide.tables.empty();
}

SlideClassification classifySlide(const Slide& slide, const ParserOptions& options) {
  SlideClassification result;
  if (isDeckTitlePage(slide)) {
    result.kind = SlideKind::DeckTitle;
    return result;
  }
  if (slide.paragraphs.empty() && slide.tables.empty()) {
    result.kind = SlideKind::Blank;
    return result;
  }
  if (isTitleCandidate(slide, options)) {
    if (auto name = resolveEntityName(firstParagraph(slide), options.entityAliases)) {
      result.kind = SlideKind::Title;
      result.entityName = *name;
      return result;
    }
  }
  result.kind = isStatusUpdateSlide(slide) ? SlideKind::StatusUpdate : SlideKind::Content;
  return result;
}
