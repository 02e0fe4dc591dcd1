#pragma once

#include <cstddef>
#include <string>
#include <vector>

enum class RiskKind { Risk, Issue };

const char* riskKindName(RiskKind kind);

struct Risk {
  std::string raisedBy;
  std::string description;
  std::string impact;
  std::string dateBecomesIssue;
  std::string status;
  std::string owner;
  std::string impactRating;
  std::string likelihood;
  std::string mitigation;
  std::string comments;
  std::string ratingColor;
  RiskKind kind = RiskKind::Risk;
};

struct Task {
  std::string bucketName;
  std::string taskName;
  std::string progress;
  std::string dueDate;
  std::string priority;
  std::string assignedTo;
  std::string labels;
};

enum class NarrativeSection {
  Summary,
  OpenOpportunities,
  BigPlays,
  AccountGoals,
  Relationships,
  Research,
  Approach,
  Other,
};

constexpr size_t kNarrativeSectionCount = 8;

enum class StatusCategory {
  OpenOpportunities,
  BigPlays,
  AccountGoals,
  Relationships,
  Research,
};

constexpr size_t kStatusCategoryCount = 5;

struct ParsedReport {
  std::string entityName;
  std::string reportDate;     // YYYY-MM-DD
  std::string overallStatus;  // GREEN, AMBER, RED, N/A or empty

  std::string statusSummary;
  std::string openOppsSummary;
  std::string bigPlays;
  std::string accountGoals;
  std::string relationships;
  std::string research;
  std::string approachToShortfall;
  std::string otherActivities;

  std::string openOppsStatus;
  std::string bigPlaysStatus;
  std::string accountGoalsStatus;
  std::string relationshipsStatus;
  std::string researchStatus;

  std::vector<Risk> risks;
  std::vector<Task> tasks;
};

// First whole-word GREEN, AMBER, RED or N/A in `text` (any case), upper-cased;
// empty when there is none.
std::string findStatusToken(const std::string& text);

// True if the whole of `text` (trimmed, any case) is one status token.
bool isStatusToken(const std::string& text);

std::string& narrativeField(ParsedReport& report, NarrativeSection section);
const std::string& narrativeField(const ParsedReport& report, NarrativeSection section);
std::string& statusField(ParsedReport& report, StatusCategory category);

// "<name>: <n> risks, <m> planner tasks, status: <status|not set>"
std::string reportSummaryLine(const ParsedReport& report);
