#pragma once

#include <optional>
#include <string>
#include <vector>

bool isValidDate(int year, int month, int day);

// "15 January 2024", "1 Jul, 2024" -> "2024-01-15", "2024-07-01".
std::optional<std::string> parseTextDate(const std::string& text);

// "15/07/2024" (day first) -> "2024-07-15".
std::optional<std::string> parseSlashDate(const std::string& text);

// Scans the first five `paragraphs`, then `titleParagraphs`; in each one the
// textual form is tried before the slash form.
std::optional<std::string> findReportDate(const std::vector<std::string>& paragraphs,
                                          const std::vector<std::string>& titleParagraphs);

std::string currentUtcDate();
