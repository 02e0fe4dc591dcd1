#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);

// ASCII case folding; multi-byte UTF-8 sequences pass through untouched.
std::string toUpper(const std::string& s);
std::string toLower(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);
bool contains(const std::string& s, const std::string& needle);
bool isBlank(const std::string& s);

std::string joinLines(const std::vector<std::string>& lines);

// Appends `text` to `field` on a new line, or assigns it when `field` is empty.
void appendLine(std::string& field, const std::string& text);
