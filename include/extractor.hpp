#pragma once

#include "parse_warning.hpp"
#include "parser_options.hpp"
#include "report.hpp"
#include "slide_extractor.hpp"

#include <string>
#include <vector>

struct DeckParseResult {
  std::vector<ParsedReport> reports;  // in order of the entity title slides
  std::string summary;
  std::vector<ParseWarning> warnings;
};

// Returns the raw bytes of the file at `path`.
// Throws std::runtime_error on failure.
std::string readDeckFile(const std::string& path);

// Extracts every slide without classifying anything. Slides whose payload is
// not XML come back empty and are reported in `warnings`.
// Throws ArchiveError.
std::vector<Slide> extractDeckSlides(const std::string& deckBytes,
                                     const ParserOptions& options,
                                     std::vector<ParseWarning>& warnings);

std::vector<Slide> extractDeckSlides(const std::string& deckBytes,
                                     const ParserOptions& options = ParserOptions());

// Builds one report per entity found in the deck.
// Throws ArchiveError; every other problem only leaves fields empty.
DeckParseResult parseDeck(const std::string& deckBytes, const ParserOptions& options = ParserOptions());
