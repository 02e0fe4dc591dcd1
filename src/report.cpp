#include "report.hpp"

#include "text_utils.hpp"

#include <regex>

namespace {

std::string ParsedReport::*narrativeMember(NarrativeSection section) {
  switch (section) {
    case NarrativeSection::Summary: return &ParsedReport::statusSummary;
    case NarrativeSection::OpenOpportunities: return &ParsedReport::openOppsSummary;
    case NarrativeSection::BigPlays: return &ParsedReport::bigPlays;
    case NarrativeSection::AccountGoals: return &ParsedReport::accountGoals;
    case NarrativeSection::Relationships: return &ParsedReport::relationships;
    case NarrativeSection::Research: return &ParsedReport::research;
    case NarrativeSection::Approach: return &ParsedReport::approachToShortfall;
    case NarrativeSection::Other: return &ParsedReport::otherActivities;
  }
  return &ParsedReport::otherActivities;
}

} // namespace

const char* riskKindName(RiskKind kind) {
  return kind == RiskKind::Issue ? "issue" : "risk";
}

std::string findStatusToken(const std::string& text) {
  static const std::regex token("(?:^|[^A-Z0-9])(GREEN|AMBER|RED|N/A)(?![A-Z0-9])");
  std::string upper = toUpper(text);
  std::smatch m;
  if (std::regex_search(upper, m, token)) return m[1].str();
  return "";
}

bool isStatusToken(const std::string& text) {
  std::string upper = toUpper(trim(text));
  return upper == "GREEN" || upper == "AMBER" || upper == "RED" || upper == "N/A";
}

std::string& narrativeField(ParsedReport& report, NarrativeSection section) {
  return report.*narrativeMember(section);
}

const std::string& narrativeField(const ParsedReport& report, NarrativeSection section) {
  return report.*narrativeMember(section);
}

std::string& statusField(ParsedReport& report, StatusCategory category) {
  switch (category) {
    case StatusCategory::OpenOpportunities: return report.openOppsStatus;
    case StatusCategory::BigPlays: return report.bigPlaysStatus;
    case StatusCategory::AccountGoals: return report.accountGoalsStatus;
    case StatusCategory::Relationships: return report.relationshipsStatus;
    case StatusCategory::Research: return report.researchStatus;
  }
  return report.researchStatus;
}

std::string reportSummaryLine(const ParsedReport& report) {
  return report.entityName + ": " + std::to_string(report.risks.size()) + " risks, " +
         std::to_string(report.tasks.size()) + " planner tasks, status: " +
         (report.overallStatus.empty() ? std::string("not set") : report.overallStatus);
}
