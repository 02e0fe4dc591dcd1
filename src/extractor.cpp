#include "extractor.hpp"

#include "archive_reader.hpp"
#include "entity_grouper.hpp"
#include "report_assembler.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

std::string readDeckFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << ifs.rdbuf();
  if (ifs.bad()) {
    throw std::runtime_error("Failed to read " + path);
  }
  return buffer.str();
}

std::vector<Slide> extractDeckSlides(const std::string& deckBytes,
                                     const ParserOptions& options,
                                     std::vector<ParseWarning>& warnings) {
  std::vector<Slide> slides;
  for (const auto& entry : readSlideEntries(deckBytes, options.tempRoot, options.maxSlideBytes)) {
    try {
      slides.push_back(extractSlide(entry.index, entry.xml));
    } catch (const SlideParseError& e) {
      spdlog::warn("{}, treated as empty", e.what());
      warnings.push_back(ParseWarning{entry.index, "slide markup is not XML and was treated as empty"});
      Slide empty;
      empty.index = entry.index;
      empty.byteSize = entry.xml.size();
      slides.push_back(std::move(empty));
    }
  }
  return slides;
}

std::vector<Slide> extractDeckSlides(const std::string& deckBytes, const ParserOptions& options) {
  std::vector<ParseWarning> ignored;
  return extractDeckSlides(deckBytes, options, ignored);
}

DeckParseResult parseDeck(const std::string& deckBytes, const ParserOptions& options) {
  DeckParseResult result;
  std::vector<Slide> slides = extractDeckSlides(deckBytes, options, result.warnings);

  std::string deckDate = deckReportDate(slides);
  std::vector<EntityGroup> groups = groupSlides(slides, options, result.warnings);
  for (const auto& group : groups) {
    result.reports.push_back(assembleReport(group, options, deckDate));
  }
  result.summary = buildSummary(result.reports);

  spdlog::info("parsed {} slides into {} report(s)", slides.size(), result.reports.size());
  return result;
}
