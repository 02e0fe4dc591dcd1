#pragma once

#include "extractor.hpp"

#include <ostream>
#include <string>
#include <vector>

std::string jsonEscape(const std::string& s);

// Compact JSON view of reports, summary and warnings.
void writeReportsJson(std::ostream& os, const DeckParseResult& result);

// Compact JSON view of the raw slide dump.
void writeSlidesJson(std::ostream& os, const std::vector<Slide>& slides);

// Writes risks.csv and tasks.csv into outDir, entity name in the first column.
void writeReportsAsCsv(const std::vector<ParsedReport>& reports, const std::string& outDir);
