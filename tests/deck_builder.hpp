#pragma once

#include "slide_extractor.hpp"

#include <string>
#include <utility>
#include <vector>

// Builds presentation packages in memory for tests.
class DeckBuilder {
public:
  DeckBuilder& addEntry(const std::string& name, const std::string& content);
  DeckBuilder& addSlide(int number, const std::string& xml);

  // Zip archive bytes holding every entry in the order they were added.
  std::string build() const;

private:
  std::vector<std::pair<std::string, std::string>> entries_;
};

std::string xmlEscape(const std::string& s);

// A slide with one text shape holding `paragraphs`, followed by `tables`.
std::string slideXml(const std::vector<std::string>& paragraphs, const std::vector<Table>& tables = {});
