#pragma once

#include "parser_options.hpp"
#include "slide_extractor.hpp"

#include <optional>
#include <string>
#include <vector>

enum class SlideKind {
  DeckTitle,     // the deck's own cover page, ignored
  Blank,         // no paragraphs and no tables, ignored
  Title,         // opens a new entity group
  StatusUpdate,  // task-tracking slide of the current entity
  Content,
};

const char* slideKindName(SlideKind kind);

struct SlideClassification {
  SlideKind kind = SlideKind::Content;
  std::string entityName;  // set for SlideKind::Title only
};

// Maps a title paragraph to its canonical entity name. The word "VAT" is
// removed before matching; a match is an exact or substring hit on an alias.
std::optional<std::string> resolveEntityName(const std::string& text,
                                             const std::vector<EntityAlias>& aliases);

bool isDeckTitlePage(const Slide& slide);
bool isTitleCandidate(const Slide& slide, const ParserOptions& options);
bool isStatusUpdateSlide(const Slide& slide);

SlideClassification classifySlide(const Slide& slide, const ParserOptions& options);
