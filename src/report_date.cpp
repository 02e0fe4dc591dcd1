#include "report_date.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <regex>

namespace {

struct MonthName {
  const char* name;
  int month;
};

const MonthName kMonths[] = {
  {"JANUARY", 1}, {"FEBRUARY", 2}, {"MARCH", 3}, {"APRIL", 4}, {"MAY", 5}, {"JUNE", 6},
  {"JULY", 7}, {"AUGUST", 8}, {"SEPTEMBER", 9}, {"OCTOBER", 10}, {"NOVEMBER", 11}, {"DECEMBER", 12},
  {"JAN", 1}, {"FEB", 2}, {"MAR", 3}, {"APR", 4}, {"JUN", 6}, {"JUL", 7}, {"AUG", 8},
  {"SEP", 9}, {"SEPT", 9}, {"OCT", 10}, {"NOV", 11}, {"DEC", 12},
};

int monthFromName(const std::string& word) {
  std::string upper = toUpper(word);
  for (const auto& m : kMonths) {
    if (upper == m.name) return m.month;
  }
  return 0;
}

bool isDigitAt(const std::string& s, size_t i) {
  return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]));
}

bool isSpaceAt(const std::string& s, size_t i) {
  return i < s.size() && std::isspace(static_cast<unsigned char>(s[i]));
}

bool isAlphaAt(const std::string& s, size_t i) {
  return i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]));
}

struct TextDateMatch {
  int day = 0;
  std::string month;
  int year = 0;
  size_t end = 0;
};

// Matches "D[D] <letters>[,] YYYY" starting exactly at `start`. A two-digit
// day is tried before a one-digit one.
bool matchTextDate(const std::string& s, size_t start, TextDateMatch& out) {
  for (size_t dayLen = 2; dayLen >= 1; --dayLen) {
    size_t i = start;
    if (!isDigitAt(s, i) || (dayLen == 2 && !isDigitAt(s, i + 1))) continue;
    int day = std::stoi(s.substr(i, dayLen));
    i += dayLen;

    if (!isSpaceAt(s, i)) continue;
    while (isSpaceAt(s, i)) i++;

    size_t wordStart = i;
    while (isAlphaAt(s, i)) i++;
    if (i == wordStart) continue;
    std::string word = s.substr(wordStart, i - wordStart);

    if (i < s.size() && s[i] == ',') i++;
    if (!isSpaceAt(s, i)) continue;
    while (isSpaceAt(s, i)) i++;

    if (!(isDigitAt(s, i) && isDigitAt(s, i + 1) && isDigitAt(s, i + 2) && isDigitAt(s, i + 3))) continue;
    out.day = day;
    out.month = word;
    out.year = std::stoi(s.substr(i, 4));
    out.end = i + 4;
    return true;
  }
  return false;
}

std::string formatIsoDate(int year, int month, int day) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

} // namespace

bool isValidDate(int year, int month, int day) {
  static const int daysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (year < 1 || month < 1 || month > 12 || day < 1) return false;
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  int limit = daysInMonth[month - 1] + (month == 2 && leap ? 1 : 0);
  return day <= limit;
}

std::optional<std::string> parseTextDate(const std::string& text) {
  size_t pos = 0;
  while (pos < text.size()) {
    TextDateMatch m;
    if (!matchTextDate(text, pos, m)) {
      pos++;
      continue;
    }
    int month = monthFromName(m.month);
    if (month != 0 && isValidDate(m.year, month, m.day)) return formatIsoDate(m.year, month, m.day);
    pos = m.end;
  }
  return std::nullopt;
}

std::optional<std::string> parseSlashDate(const std::string& text) {
  static const std::regex slashDate("([0-9]{1,2})/([0-9]{1,2})/([0-9]{4})");
  auto begin = std::sregex_iterator(text.begin(), text.end(), slashDate);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    const std::smatch& m = *it;
    int day = std::stoi(m[1].str());
    int month = std::stoi(m[2].str());
    int year = std::stoi(m[3].str());
    if (isValidDate(year, month, day)) return formatIsoDate(year, month, day);
  }
  return std::nullopt;
}

std::optional<std::string> findReportDate(const std::vector<std::string>& paragraphs,
                                          const std::vector<std::string>& titleParagraphs) {
  std::vector<std::string> candidates(paragraphs.begin(),
                                      paragraphs.begin() + std::min<size_t>(5, paragraphs.size()));
  candidates.insert(candidates.end(), titleParagraphs.begin(), titleParagraphs.end());

  for (const auto& p : candidates) {
    if (auto date = parseTextDate(p)) return date;
    if (auto date = parseSlashDate(p)) return date;
  }
  return std::nullopt;
}

std::string currentUtcDate() {
  std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  return formatIsoDate(utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday);
}
