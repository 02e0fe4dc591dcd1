#pragma once

#include "parse_warning.hpp"
#include "parser_options.hpp"
#include "slide_extractor.hpp"

#include <string>
#include <vector>

struct EntityGroup {
  std::string entityName;
  Slide titleSlide;
  std::vector<Slide> contentSlides;
  std::vector<Slide> statusUpdateSlides;
};

// Walks the slides in order. A title slide opens a new group; the slides that
// follow belong to it until the next title slide. Slides seen before any group
// is open are dropped and reported in `warnings`.
std::vector<EntityGroup> groupSlides(const std::vector<Slide>& slides,
                                     const ParserOptions& options,
                                     std::vector<ParseWarning>& warnings);
