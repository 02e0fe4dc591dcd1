#include "parser_options.hpp"

#include "report_date.hpp"
#include "text_utils.hpp"

#include <fstream>
#include <regex>
#include <stdexcept>

std::vector<EntityAlias> defaultEntityAliases() {
  return {
    {"DAFF", "DAFF"},
    {"SAU", "SAU"},
    {"VICGOV", "VICGov"},
    {"VIC GOV", "VICGov"},
    {"DISR", "DISR"},
    {"GROWTH", "Growth"},
    {"P&P", "P&P"},
    {"PLATFORMS AND PARTNERSHIPS", "P&P"},
    {"EMERGING", "Emerging"},
    {"EMERGING ACCOUNTS", "Emerging"},
  };
}

std::vector<EntityAlias> loadEntityAliases(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw std::runtime_error("Cannot open alias file: " + path);
  }

  std::vector<EntityAlias> aliases;
  std::string line;
  int lineNo = 0;
  while (std::getline(ifs, line)) {
    lineNo++;
    size_t hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    line = trim(line);
    if (line.empty()) continue;

    size_t eq = line.find('=');
    std::string alias = eq == std::string::npos ? "" : trim(line.substr(0, eq));
    std::string canonical = eq == std::string::npos ? "" : trim(line.substr(eq + 1));
    if (alias.empty() || canonical.empty()) {
      throw std::runtime_error(path + ":" + std::to_string(lineNo) +
                               ": expected 'ALIAS = Canonical name'");
    }
    aliases.push_back(EntityAlias{toUpper(alias), canonical});
  }

  if (aliases.empty()) {
    throw std::runtime_error("Alias file defines no aliases: " + path);
  }
  return aliases;
}

bool isIsoDate(const std::string& s) {
  static const std::regex iso("^([0-9]{4})-([0-9]{2})-([0-9]{2})$");
  std::smatch m;
  if (!std::regex_match(s, m, iso)) return false;
  return isValidDate(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
}
