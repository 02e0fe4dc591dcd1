#pragma once

#include "entity_grouper.hpp"
#include "narrative_classifier.hpp"
#include "parser_options.hpp"
#include "report.hpp"
#include "table_extractor.hpp"

#include <array>
#include <string>
#include <vector>

// Everything one content slide contributes to its entity's report.
struct SlideExtraction {
  std::string reportDate;
  std::string overallStatus;
  std::array<std::string, kStatusCategoryCount> categoryStatus;
  NarrativeText narrative;
  std::vector<Risk> risks;
  std::vector<Task> tasks;
};

SlideExtraction extractContentSlide(const Slide& slide, const Slide& titleSlide);

// Scalars keep the first value seen, narrative fields are appended line-wise,
// risks and tasks are appended in order.
void mergeSlideExtraction(ParsedReport& report, const SlideExtraction& extraction);

// Tasks of every 7-column table on a status-update slide.
std::vector<Task> extractStatusUpdateTasks(const Slide& slide);

// Date printed on the first slide of the deck (the cover), empty when none.
std::string deckReportDate(const std::vector<Slide>& slides);

// Report date fallbacks, in order: content slides, the title slide, `deckDate`,
// then options.today or the current UTC date.
ParsedReport assembleReport(const EntityGroup& group, const ParserOptions& options,
                            const std::string& deckDate = std::string());

// Summary lines of all reports joined with "; ".
std::string buildSummary(const std::vector<ParsedReport>& reports);
