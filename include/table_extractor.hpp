#pragma once

#include "report.hpp"
#include "slide_extractor.hpp"

#include <array>
#include <string>
#include <vector>

enum class TableShape {
  StatusGrid,    // 3 columns, at least 5 rows
  Register,      // 11 columns, header mentions "raised by"
  TaskBucket,    // 7 columns, header mentions "bucket"
  Unrecognized,
};

// Decided from the column count and text of the first row only.
TableShape classifyTable(const Table& table);

struct StatusGrid {
  std::string overallStatus;
  std::string summary;  // primary narrative, newline-joined
  std::array<std::string, kStatusCategoryCount> categoryStatus;
};

StatusGrid extractStatusGrid(const Table& table);

// Rows without a description are skipped. The kind comes from the header.
std::vector<Risk> extractRegisterRows(const Table& table);

// The bucket column is sticky: a blank cell repeats the bucket above it.
std::vector<Task> extractTaskRows(const Table& table);
