#include <catch2/catch_all.hpp>

#include "archive_reader.hpp"
#include "parser_options.hpp"
#include "slide_classifier.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

Slide makeSlide(int index, std::vector<std::string> paragraphs, std::vector<Table> tables = {},
                size_t byteSize = 500) {
  Slide s;
  s.index = index;
  s.paragraphs = std::move(paragraphs);
  s.tables = std::move(tables);
  s.byteSize = byteSize;
  return s;
}

const Table kTaskTable = {
  {"Bucket", "Task", "Progress", "Due", "Priority", "Assigned", "Labels"},
  {"Dev", "Ship", "", "", "", "", ""},
};

} // namespace

TEST_CASE("resolveEntityName maps aliases to canonical names", "[classifier]") {
  auto aliases = defaultEntityAliases();

  REQUIRE(resolveEntityName("DAFF", aliases) == std::string("DAFF"));
  REQUIRE(resolveEntityName("VIC GOV", aliases) == std::string("VICGov"));
  REQUIRE(resolveEntityName("VICGOV", aliases) == std::string("VICGov"));
  REQUIRE(resolveEntityName("Growth", aliases) == std::string("Growth"));
  REQUIRE(resolveEntityName("PLATFORMS AND PARTNERSHIPS", aliases) == std::string("P&P"));
  REQUIRE(resolveEntityName("EMERGING ACCOUNTS", aliases) == std::string("Emerging"));
}

TEST_CASE("resolveEntityName ignores the word VAT and letter case", "[classifier]") {
  auto aliases = defaultEntityAliases();

  REQUIRE(resolveEntityName("DAFF VAT", aliases) == std::string("DAFF"));
  REQUIRE(resolveEntityName("VAT DAFF", aliases) == std::string("DAFF"));
  REQUIRE(resolveEntityName("daff", aliases) == std::string("DAFF"));
  REQUIRE(resolveEntityName("Sau vat", aliases) == std::string("SAU"));
  REQUIRE(resolveEntityName("P&amp;P", aliases) == std::string("P&P"));
  REQUIRE(resolveEntityName("DISR - Industry, Science and Resources", aliases) == std::string("DISR"));
}

TEST_CASE("resolveEntityName returns nothing for unknown names", "[classifier]") {
  auto aliases = defaultEntityAliases();

  REQUIRE_FALSE(resolveEntityName("UNKNOWN", aliases).has_value());
  REQUIRE_FALSE(resolveEntityName("", aliases).has_value());
  REQUIRE_FALSE(resolveEntityName("VAT", aliases).has_value());
  REQUIRE_FALSE(resolveEntityName("RANDOM TEXT", aliases).has_value());
}

TEST_CASE("resolveEntityName honours the order of the alias table", "[classifier]") {
  std::vector<EntityAlias> aliases = {{"EMERGING", "Emerging"}, {"EMERGING ACCOUNTS", "New Accounts"}};

  REQUIRE(resolveEntityName("Emerging Accounts", aliases) == std::string("Emerging"));
}

TEST_CASE("classifySlide recognizes title slides", "[classifier]") {
  ParserOptions options;

  SlideClassification c = classifySlide(makeSlide(2, {"DAFF VAT", "Week ending 5 July 2024"}), options);
  REQUIRE(c.kind == SlideKind::Title);
  REQUIRE(c.entityName == "DAFF");

  SECTION("too many paragraphs") {
    REQUIRE(classifySlide(makeSlide(2, {"DAFF", "a", "b"}), options).kind == SlideKind::Content);
  }
  SECTION("markup too large") {
    REQUIRE(classifySlide(makeSlide(2, {"DAFF"}, {}, 3000), options).kind == SlideKind::Content);
  }
  SECTION("has a table") {
    REQUIRE(classifySlide(makeSlide(2, {"DAFF"}, {Table{{"x"}}}), options).kind == SlideKind::Content);
  }
  SECTION("name does not resolve") {
    REQUIRE(classifySlide(makeSlide(2, {"Agenda"}), options).kind == SlideKind::Content);
  }
}

TEST_CASE("classifySlide uses configurable title thresholds", "[classifier]") {
  ParserOptions options;
  options.titleSlideMaxParagraphs = 3;
  options.titleSlideMaxBytes = 10000;

  REQUIRE(classifySlide(makeSlide(2, {"SAU", "a", "b"}, {}, 5000), options).kind == SlideKind::Title);
}

TEST_CASE("classifySlide needs a table for status-update slides", "[classifier]") {
  ParserOptions options;

  REQUIRE(classifySlide(makeSlide(4, {"Planner Status Update", "x", "y"}, {kTaskTable}), options).kind ==
          SlideKind::StatusUpdate);
  REQUIRE(classifySlide(makeSlide(4, {"PLANNER STATUS - DAFF", "x", "y"}, {kTaskTable}), options).kind ==
          SlideKind::StatusUpdate);
  REQUIRE(classifySlide(makeSlide(4, {"Planner Status Update", "x", "y"}), options).kind == SlideKind::Content);
  REQUIRE(classifySlide(makeSlide(4, {"Weekly planner status", "x"}, {kTaskTable}), options).kind ==
          SlideKind::Content);
}

TEST_CASE("classifySlide skips the deck cover and blank slides", "[classifier]") {
  ParserOptions options;

  REQUIRE(classifySlide(makeSlide(1, {"VAT Report - Sales Committee", "5 July 2024"}), options).kind ==
          SlideKind::DeckTitle);
  // Only the first slide can be the cover.
  REQUIRE(classifySlide(makeSlide(2, {"VAT Report - Sales Committee"}), options).kind == SlideKind::Content);
  REQUIRE(classifySlide(makeSlide(7, {}), options).kind == SlideKind::Blank);
}

TEST_CASE("loadEntityAliases reads an alias file", "[classifier]") {
  ScopedTempDir dir;
  std::string path = (dir.path() / "aliases.txt").string();
  {
    std::ofstream ofs(path);
    ofs << "# account aliases\n"
        << "\n"
        << "nsw gov = NSWGov   # state\n"
        << "DAFF=DAFF\n";
  }

  auto aliases = loadEntityAliases(path);

  REQUIRE(aliases.size() == 2);
  REQUIRE(aliases[0].alias == "NSW GOV");
  REQUIRE(aliases[0].canonicalName == "NSWGov");
  REQUIRE(resolveEntityName("NSW Gov VAT", aliases) == std::string("NSWGov"));
  REQUIRE_FALSE(resolveEntityName("SAU", aliases).has_value());
}

TEST_CASE("loadEntityAliases rejects bad files", "[classifier]") {
  ScopedTempDir dir;
  std::string malformed = (dir.path() / "malformed.txt").string();
  std::string empty = (dir.path() / "empty.txt").string();
  {
    std::ofstream bad(malformed);
    bad << "DAFF\n";
    std::ofstream blank(empty);
    blank << "# nothing here\n";
  }

  REQUIRE_THROWS_AS(loadEntityAliases(malformed), std::runtime_error);
  REQUIRE_THROWS_AS(loadEntityAliases(empty), std::runtime_error);
  REQUIRE_THROWS_AS(loadEntityAliases((dir.path() / "missing.txt").string()), std::runtime_error);
}

TEST_CASE("isIsoDate checks format and calendar", "[classifier]") {
  REQUIRE(isIsoDate("2024-02-29"));
  REQUIRE_FALSE(isIsoDate("2023-02-29"));
  REQUIRE_FALSE(isIsoDate("2024-2-9"));
  REQUIRE_FALSE(isIsoDate("29/02/2024"));
}
