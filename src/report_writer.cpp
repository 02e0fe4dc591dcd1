#include "report_writer.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace {

void writeCsvRow(std::ofstream& ofs, const std::vector<std::string>& row) {
  for (size_t i = 0; i < row.size(); ++i) {
    const std::string& cell = row[i];
    bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos ||
                      cell.find('\n') != std::string::npos;
    if (needQuotes) {
      std::string escaped;
      for (char ch : cell) {
        if (ch == '"') escaped += '"';
        escaped += ch;
      }
      ofs << '"' << escaped << '"';
    } else {
      ofs << cell;
    }
    if (i + 1 < row.size()) ofs << ',';
  }
  ofs << "\n";
}

std::ofstream openCsv(const std::filesystem::path& path) {
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("Cannot write " + path.string());
  return ofs;
}

void printString(std::ostream& os, const char* key, const std::string& value, bool last = false) {
  os << "\"" << key << "\": \"" << jsonEscape(value) << "\"" << (last ? "" : ", ");
}

void printStringArray(std::ostream& os, const std::vector<std::string>& arr) {
  os << "[";
  for (size_t i = 0; i < arr.size(); ++i) {
    os << "\"" << jsonEscape(arr[i]) << "\"" << (i + 1 == arr.size() ? "" : ", ");
  }
  os << "]";
}

} // namespace

std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(ch));
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  return out;
}

void writeReportsJson(std::ostream& os, const DeckParseResult& result) {
  os << "{\n";
  os << "  \"reports\": [";
  for (size_t r = 0; r < result.reports.size(); ++r) {
    const ParsedReport& rep = result.reports[r];
    os << (r == 0 ? "\n" : ",\n") << "    {\n      ";
    printString(os, "entityName", rep.entityName);
    printString(os, "reportDate", rep.reportDate);
    printString(os, "overallStatus", rep.overallStatus);
    os << "\n      ";
    printString(os, "statusSummary", rep.statusSummary);
    printString(os, "openOppsSummary", rep.openOppsSummary);
    printString(os, "bigPlays", rep.bigPlays);
    printString(os, "accountGoals", rep.accountGoals);
    os << "\n      ";
    printString(os, "relationships", rep.relationships);
    printString(os, "research", rep.research);
    printString(os, "approachToShortfall", rep.approachToShortfall);
    printString(os, "otherActivities", rep.otherActivities);
    os << "\n      ";
    printString(os, "openOppsStatus", rep.openOppsStatus);
    printString(os, "bigPlaysStatus", rep.bigPlaysStatus);
    printString(os, "accountGoalsStatus", rep.accountGoalsStatus);
    printString(os, "relationshipsStatus", rep.relationshipsStatus);
    printString(os, "researchStatus", rep.researchStatus);
    os << "\n      \"risks\": [";
    for (size_t i = 0; i < rep.risks.size(); ++i) {
      const Risk& k = rep.risks[i];
      os << (i == 0 ? "\n" : ",\n") << "        {";
      printString(os, "raisedBy", k.raisedBy);
      printString(os, "description", k.description);
      printString(os, "impact", k.impact);
      printString(os, "dateBecomesIssue", k.dateBecomesIssue);
      printString(os, "status", k.status);
      printString(os, "owner", k.owner);
      printString(os, "impactRating", k.impactRating);
      printString(os, "likelihood", k.likelihood);
      printString(os, "mitigation", k.mitigation);
      printString(os, "comments", k.comments);
      printString(os, "ratingColor", k.ratingColor);
      printString(os, "kind", riskKindName(k.kind), true);
      os << "}";
    }
    os << (rep.risks.empty() ? "]" : "\n      ]") << ",\n      \"tasks\": [";
    for (size_t i = 0; i < rep.tasks.size(); ++i) {
      const Task& t = rep.tasks[i];
      os << (i == 0 ? "\n" : ",\n") << "        {";
      printString(os, "bucketName", t.bucketName);
      printString(os, "taskName", t.taskName);
      printString(os, "progress", t.progress);
      printString(os, "dueDate", t.dueDate);
      printString(os, "priority", t.priority);
      printString(os, "assignedTo", t.assignedTo);
      printString(os, "labels", t.labels, true);
      os << "}";
    }
    os << (rep.tasks.empty() ? "]" : "\n      ]") << "\n    }";
  }
  os << (result.reports.empty() ? "],\n" : "\n  ],\n");

  os << "  \"summary\": \"" << jsonEscape(result.summary) << "\",\n";
  os << "  \"warnings\": [";
  for (size_t i = 0; i < result.warnings.size(); ++i) {
    const ParseWarning& w = result.warnings[i];
    os << "{\"slide\": " << w.slideIndex << ", \"message\": \"" << jsonEscape(w.message) << "\"}"
       << (i + 1 == result.warnings.size() ? "" : ", ");
  }
  os << "]\n";
  os << "}\n";
}

void writeSlidesJson(std::ostream& os, const std::vector<Slide>& slides) {
  os << "{\n  \"slides\": [";
  for (size_t s = 0; s < slides.size(); ++s) {
    const Slide& slide = slides[s];
    os << (s == 0 ? "\n" : ",\n");
    os << "    {\"index\": " << slide.index << ", \"size\": " << slide.byteSize << ",\n";
    os << "     \"paragraphs\": ";
    printStringArray(os, slide.paragraphs);
    os << ",\n     \"tables\": [";
    for (size_t t = 0; t < slide.tables.size(); ++t) {
      os << (t == 0 ? "" : ", ") << "[";
      for (size_t r = 0; r < slide.tables[t].size(); ++r) {
        if (r > 0) os << ", ";
        printStringArray(os, slide.tables[t][r]);
      }
      os << "]";
    }
    os << "]}";
  }
  os << (slides.empty() ? "]\n" : "\n  ]\n");
  os << "}\n";
}

void writeReportsAsCsv(const std::vector<ParsedReport>& reports, const std::string& outDir) {
  if (!std::filesystem::exists(outDir)) {
    std::filesystem::create_directories(outDir);
  }

  std::ofstream risks = openCsv(std::filesystem::path(outDir) / "risks.csv");
  writeCsvRow(risks, {"entity", "kind", "raisedBy", "description", "impact", "dateBecomesIssue", "status",
                      "owner", "impactRating", "likelihood", "mitigation", "comments", "ratingColor"});
  for (const auto& rep : reports) {
    for (const auto& k : rep.risks) {
      writeCsvRow(risks, {rep.entityName, riskKindName(k.kind), k.raisedBy, k.description, k.impact,
                          k.dateBecomesIssue, k.status, k.owner, k.impactRating, k.likelihood,
                          k.mitigation, k.comments, k.ratingColor});
    }
  }

  std::ofstream tasks = openCsv(std::filesystem::path(outDir) / "tasks.csv");
  writeCsvRow(tasks, {"entity", "bucketName", "taskName", "progress", "dueDate", "priority", "assignedTo", "labels"});
  for (const auto& rep : reports) {
    for (const auto& t : rep.tasks) {
      writeCsvRow(tasks, {rep.entityName, t.bucketName, t.taskName, t.progress, t.dueDate, t.priority,
                          t.assignedTo, t.labels});
    }
  }
}
