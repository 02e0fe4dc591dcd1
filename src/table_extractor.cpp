#include "table_extractor.hpp"

#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace {

const char* const kOverallStatusMarker = "OVERALL STATUS";
const char* const kSummaryMarker = "STATUS OVERALL";

// Checked in order; "BIG PLAY" also covers "BIG PLAYS".
const std::pair<const char*, StatusCategory> kCategoryMarkers[] = {
  {"OPEN OPPS", StatusCategory::OpenOpportunities},
  {"BIG PLAY", StatusCategory::BigPlays},
  {"ACCOUNT GOALS", StatusCategory::AccountGoals},
  {"RELATIONSHIPS", StatusCategory::Relationships},
  {"RESEARCH", StatusCategory::Research},
};

// Register rows whose description is this header text leaking into the body.
const char* const kRegisterPlaceholder = "people process";

template <typename Record>
struct RowOutcome {
  std::optional<Record> record;
  const char* skipReason = nullptr;

  static RowOutcome accepted(Record r) { return RowOutcome{std::move(r), nullptr}; }
  static RowOutcome skipped(const char* reason) { return RowOutcome{std::nullopt, reason}; }
};

std::string cell(const TableRow& row, size_t i) {
  return i < row.size() ? trim(row[i]) : std::string();
}

bool isBlankRow(const TableRow& row) {
  return std::all_of(row.begin(), row.end(), [](const std::string& c) { return isBlank(c); });
}

bool headerContains(const TableRow& header, const std::string& needle) {
  return std::any_of(header.begin(), header.end(),
                     [&](const std::string& h) { return contains(toLower(h), needle); });
}

bool matchesMarker(const std::string& upper, const std::string& marker) {
  return upper == marker || startsWith(upper, marker);
}

RowOutcome<Risk> readRiskRow(const TableRow& row, RiskKind kind) {
  if (isBlankRow(row)) return RowOutcome<Risk>::skipped("blank row");

  std::string description = cell(row, 1);
  if (description.empty()) return RowOutcome<Risk>::skipped("no description");
  if (toLower(description) == kRegisterPlaceholder) return RowOutcome<Risk>::skipped("placeholder description");

  Risk r;
  r.raisedBy = cell(row, 0);
  r.description = description;
  r.impact = cell(row, 2);
  r.dateBecomesIssue = cell(row, 3);
  r.status = cell(row, 4);
  r.owner = cell(row, 5);
  r.impactRating = cell(row, 6);
  r.likelihood = cell(row, 7);
  r.mitigation = cell(row, 8);
  r.comments = cell(row, 9);
  r.ratingColor = cell(row, 10);
  r.kind = kind;
  return RowOutcome<Risk>::accepted(std::move(r));
}

RowOutcome<Task> readTaskRow(const TableRow& row, std::string& currentBucket) {
  if (isBlankRow(row)) return RowOutcome<Task>::skipped("blank row");

  std::string bucket = cell(row, 0);
  if (!bucket.empty()) currentBucket = bucket;

  std::string taskName = cell(row, 1);
  if (taskName.empty()) return RowOutcome<Task>::skipped("no task name");

  Task t;
  t.bucketName = currentBucket;
  t.taskName = taskName;
  t.progress = cell(row, 2);
  t.dueDate = cell(row, 3);
  t.priority = cell(row, 4);
  t.assignedTo = cell(row, 5);
  t.labels = cell(row, 6);
  return RowOutcome<Task>::accepted(std::move(t));
}

} // namespace

TableShape classifyTable(const Table& table) {
  if (table.empty()) return TableShape::Unrecognized;
  const TableRow& header = table.front();

  if (header.size() == 3 && table.size() >= 5) return TableShape::StatusGrid;
  if (header.size() == 11 && headerContains(header, "raised by")) return TableShape::Register;
  if (header.size() == 7 && headerContains(header, "bucket")) return TableShape::TaskBucket;
  return TableShape::Unrecognized;
}

StatusGrid extractStatusGrid(const Table& table) {
  StatusGrid grid;
  if (table.empty()) return grid;

  grid.overallStatus = findStatusToken(cell(table.front(), 0));

  for (size_t i = 1; i < table.size(); ++i) {
    const TableRow& row = table[i];
    std::string col0 = cell(row, 0);
    std::string col1Upper = toUpper(cell(row, 1));

    if (matchesMarker(col1Upper, kOverallStatusMarker) || startsWith(toUpper(col0), kOverallStatusMarker)) {
      continue;
    }

    if (matchesMarker(col1Upper, kSummaryMarker)) {
      if (grid.summary.empty()) grid.summary = col0;
      continue;
    }

    bool matched = false;
    for (const auto& marker : kCategoryMarkers) {
      if (matchesMarker(col1Upper, marker.first)) {
        std::string token = findStatusToken(col0 + " " + col1Upper + " " + cell(row, 2));
        if (!token.empty()) grid.categoryStatus[static_cast<size_t>(marker.second)] = token;
        matched = true;
        break;
      }
    }

    if (!matched && !col0.empty()) appendLine(grid.summary, col0);
  }

  return grid;
}

std::vector<Risk> extractRegisterRows(const Table& table) {
  std::vector<Risk> risks;
  if (table.size() < 2) return risks;

  RiskKind kind = headerContains(table.front(), "issue rating") ? RiskKind::Issue : RiskKind::Risk;
  for (size_t i = 1; i < table.size(); ++i) {
    RowOutcome<Risk> outcome = readRiskRow(table[i], kind);
    if (outcome.record) {
      risks.push_back(std::move(*outcome.record));
    } else {
      spdlog::debug("register row {} skipped: {}", i, outcome.skipReason);
    }
  }
  return risks;
}

std::vector<Task> extractTaskRows(const Table& table) {
  std::vector<Task> tasks;
  if (table.size() < 2) return tasks;

  std::string currentBucket;
  for (size_t i = 1; i < table.size(); ++i) {
    RowOutcome<Task> outcome = readTaskRow(table[i], currentBucket);
    if (outcome.record) {
      tasks.push_back(std::move(*outcome.record));
    } else {
      spdlog::debug("task row {} skipped: {}", i, outcome.skipReason);
    }
  }
  return tasks;
}
