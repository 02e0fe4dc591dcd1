#pragma once

#include "archive_reader.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

struct EntityAlias {
  std::string alias;          // upper case
  std::string canonicalName;
};

// Aliases are matched in order; the first hit wins.
std::vector<EntityAlias> defaultEntityAliases();

struct ParserOptions {
  std::vector<EntityAlias> entityAliases = defaultEntityAliases();
  size_t titleSlideMaxParagraphs = 2;
  size_t titleSlideMaxBytes = 3000;
  // Fallback report date as YYYY-MM-DD; the current UTC date when empty.
  std::string today;
  // Parent of the temporary extraction directory; system temp dir when empty.
  std::filesystem::path tempRoot;
  // Slide entries above this uncompressed size fail the parse.
  size_t maxSlideBytes = kDefaultMaxSlideBytes;
};

// Reads "ALIAS = Canonical" lines; '#' starts a comment. Throws std::runtime_error
// if the file cannot be read, a line is malformed, or no alias is defined.
std::vector<EntityAlias> loadEntityAliases(const std::string& path);

// True for a valid calendar date written as YYYY-MM-DD.
bool isIsoDate(const std::string& s);
