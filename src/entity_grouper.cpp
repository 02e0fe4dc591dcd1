#include "entity_grouper.hpp"

#include "slide_classifier.hpp"

#include <spdlog/spdlog.h>

std::vector<EntityGroup> groupSlides(const std::vector<Slide>& slides,
                                     const ParserOptions& options,
                                     std::vector<ParseWarning>& warnings) {
  std::vector<EntityGroup> groups;

  for (const auto& slide : slides) {
    SlideClassification c = classifySlide(slide, options);
    spdlog::debug("slide {}: {} ({} paragraphs, {} tables, {} bytes)", slide.index,
                  slideKindName(c.kind), slide.paragraphs.size(), slide.tables.size(), slide.byteSize);

    switch (c.kind) {
      case SlideKind::DeckTitle:
      case SlideKind::Blank:
        continue;
      case SlideKind::Title:
        groups.push_back(EntityGroup{c.entityName, slide, {}, {}});
        continue;
      case SlideKind::StatusUpdate:
      case SlideKind::Content:
        break;
    }

    // Once opened, a group stays current until the next title slide.
    if (groups.empty()) {
      spdlog::warn("slide {} precedes the first entity title slide, dropped", slide.index);
      warnings.push_back(ParseWarning{slide.index, "slide precedes the first entity title slide and was dropped"});
      continue;
    }

    if (c.kind == SlideKind::StatusUpdate) {
      groups.back().statusUpdateSlides.push_back(slide);
    } else {
      groups.back().contentSlides.push_back(slide);
    }
  }

  return groups;
}
