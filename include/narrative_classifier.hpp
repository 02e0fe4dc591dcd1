#pragma once

#include "report.hpp"

#include <array>
#include <string>
#include <vector>

struct NarrativeText {
  // Indexed by NarrativeSection; each entry newline-joined and trimmed.
  std::array<std::string, kNarrativeSectionCount> sections;

  const std::string& operator[](NarrativeSection s) const { return sections[static_cast<size_t>(s)]; }
};

// Number of leading paragraphs that form the slide banner (title, status
// marker, page number or year), looked for among the first five.
size_t bannerParagraphCount(const std::vector<std::string>& paragraphs);

// True for bare status tokens and table header labels already captured from
// tables. `text` is compared case-insensitively.
bool isRedundantLabel(const std::string& text);

// Section a paragraph header switches to, or false if it is not a header.
bool detectSectionHeader(const std::string& text, NarrativeSection& section);

// Assigns each paragraph to a section, starting in the summary section and
// switching whenever a section header is seen.
NarrativeText classifyNarrative(const std::vector<std::string>& paragraphs);
