#include "report_assembler.hpp"

#include "report_date.hpp"
#include "text_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {

const size_t kStatusFallbackParagraphs = 5;
const size_t kTaskTableColumns = 7;

void setIfEmpty(std::string& field, const std::string& value) {
  if (field.empty()) field = value;
}

std::string fallbackOverallStatus(const std::vector<Slide>& contentSlides) {
  for (const auto& slide : contentSlides) {
    size_t n = std::min(kStatusFallbackParagraphs, slide.paragraphs.size());
    for (size_t i = 0; i < n; ++i) {
      std::string token = findStatusToken(slide.paragraphs[i]);
      if (!token.empty()) return token;
    }
  }
  return "";
}

} // namespace

SlideExtraction extractContentSlide(const Slide& slide, const Slide& titleSlide) {
  SlideExtraction out;
  if (auto date = findReportDate(slide.paragraphs, titleSlide.paragraphs)) out.reportDate = *date;

  std::string gridSummary;
  for (const auto& table : slide.tables) {
    switch (classifyTable(table)) {
      case TableShape::StatusGrid: {
        StatusGrid grid = extractStatusGrid(table);
        setIfEmpty(out.overallStatus, grid.overallStatus);
        setIfEmpty(gridSummary, grid.summary);
        for (size_t c = 0; c < kStatusCategoryCount; ++c) {
          setIfEmpty(out.categoryStatus[c], grid.categoryStatus[c]);
        }
        break;
      }
      case TableShape::Register: {
        std::vector<Risk> risks = extractRegisterRows(table);
        out.risks.insert(out.risks.end(), risks.begin(), risks.end());
        break;
      }
      case TableShape::TaskBucket: {
        std::vector<Task> tasks = extractTaskRows(table);
        out.tasks.insert(out.tasks.end(), tasks.begin(), tasks.end());
        break;
      }
      case TableShape::Unrecognized:
        spdlog::debug("slide {}: table with {} columns ignored", slide.index,
                      table.empty() ? 0 : table.front().size());
        break;
    }
  }

  out.narrative = classifyNarrative(slide.paragraphs);
  // The paragraphs of a grid slide repeat the grid's own cells.
  if (!gridSummary.empty()) {
    out.narrative.sections[static_cast<size_t>(NarrativeSection::Summary)] = gridSummary;
  }
  return out;
}

void mergeSlideExtraction(ParsedReport& report, const SlideExtraction& extraction) {
  setIfEmpty(report.reportDate, extraction.reportDate);
  setIfEmpty(report.overallStatus, extraction.overallStatus);
  for (size_t c = 0; c < kStatusCategoryCount; ++c) {
    setIfEmpty(statusField(report, static_cast<StatusCategory>(c)), extraction.categoryStatus[c]);
  }
  for (size_t s = 0; s < kNarrativeSectionCount; ++s) {
    appendLine(narrativeField(report, static_cast<NarrativeSection>(s)), extraction.narrative.sections[s]);
  }
  report.risks.insert(report.risks.end(), extraction.risks.begin(), extraction.risks.end());
  report.tasks.insert(report.tasks.end(), extraction.tasks.begin(), extraction.tasks.end());
}

std::vector<Task> extractStatusUpdateTasks(const Slide& slide) {
  std::vector<Task> tasks;
  for (const auto& table : slide.tables) {
    if (table.empty() || table.front().size() != kTaskTableColumns) continue;
    std::vector<Task> rows = extractTaskRows(table);
    tasks.insert(tasks.end(), rows.begin(), rows.end());
  }
  return tasks;
}

std::string deckReportDate(const std::vector<Slide>& slides) {
  if (slides.empty()) return "";
  return findReportDate(slides.front().paragraphs, {}).value_or("");
}

ParsedReport assembleReport(const EntityGroup& group, const ParserOptions& options,
                            const std::string& deckDate) {
  ParsedReport report;
  report.entityName = group.entityName;

  for (const auto& slide : group.contentSlides) {
    mergeSlideExtraction(report, extractContentSlide(slide, group.titleSlide));
  }

  for (const auto& slide : group.statusUpdateSlides) {
    std::vector<Task> tasks = extractStatusUpdateTasks(slide);
    report.tasks.insert(report.tasks.end(), tasks.begin(), tasks.end());
  }

  if (report.overallStatus.empty()) {
    report.overallStatus = fallbackOverallStatus(group.contentSlides);
  }

  if (report.reportDate.empty()) {
    // A group without content slides can still carry its date on the title slide.
    if (auto date = findReportDate({}, group.titleSlide.paragraphs)) {
      report.reportDate = *date;
    } else if (!deckDate.empty()) {
      report.reportDate = deckDate;
    } else {
      report.reportDate = options.today.empty() ? currentUtcDate() : options.today;
    }
  }

  spdlog::debug("{}: {} content slides, {} status-update slides", report.entityName,
                group.contentSlides.size(), group.statusUpdateSlides.size());
  return report;
}

std::string buildSummary(const std::vector<ParsedReport>& reports) {
  std::string summary;
  for (size_t i = 0; i < reports.size(); ++i) {
    if (i > 0) summary += "; ";
    summary += reportSummaryLine(reports[i]);
  }
  return summary;
}
