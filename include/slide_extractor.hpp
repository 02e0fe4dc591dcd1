#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

using TableRow = std::vector<std::string>;
using Table = std::vector<TableRow>;

struct Slide {
  int index = 0;                        // 1-based position in the deck
  std::vector<std::string> paragraphs;  // document order, never re-sorted
  std::vector<Table> tables;
  size_t byteSize = 0;                  // size of the slide markup
};

// Raised only when a slide payload is not XML at all.
class SlideParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Decodes the predefined XML entities and numeric character references, then
// replaces the non-breaking hyphen (U+2011) with '-'. En and em dashes are kept.
std::string decodeXmlText(const std::string& in);

// Text of every <a:p> element, runs concatenated, blank paragraphs dropped.
std::vector<std::string> extractParagraphs(const std::string& xml);

// Every <a:tbl> as rows of <a:tc> cells; runs in a cell are joined by a space.
std::vector<Table> extractTables(const std::string& xml);

// Throws SlideParseError if `xml` does not look like an XML document.
Slide extractSlide(int index, const std::string& xml);
