#include <catch2/catch_all.hpp>

#include "deck_builder.hpp"
#include "slide_extractor.hpp"

#include <string>
#include <vector>

TEST_CASE("decodeXmlText handles entities and character references", "[slide]") {
  REQUIRE(decodeXmlText("R&amp;D &lt;tier 1&gt;") == "R&D <tier 1>");
  REQUIRE(decodeXmlText("&quot;quoted&quot; &apos;x&apos;") == "\"quoted\" 'x'");
  REQUIRE(decodeXmlText("&#65;&#x42;") == "AB");
  REQUIRE(decodeXmlText("caf&#233;") == "caf\xC3\xA9");
  REQUIRE(decodeXmlText("&unknown; &amp") == "&unknown; &amp");
}

TEST_CASE("decodeXmlText folds the non-breaking hyphen only", "[slide]") {
  REQUIRE(decodeXmlText("co\xE2\x80\x91" "design") == "co-design");
  REQUIRE(decodeXmlText("co&#8209;design") == "co-design");
  // En dash stays as it is.
  REQUIRE(decodeXmlText("2023\xE2\x80\x93" "24") == "2023\xE2\x80\x93" "24");
}

TEST_CASE("extractParagraphs joins runs and drops blank paragraphs", "[slide]") {
  std::string xml =
    "<p:txBody>"
    "<a:p><a:r><a:t>Pipeline </a:t></a:r><a:r><a:t>is healthy</a:t></a:r></a:p>"
    "<a:p><a:pPr algn=\"l\"/><a:endParaRPr/></a:p>"
    "<a:p><a:r><a:t>   </a:t></a:r></a:p>"
    "<a:p><a:r><a:t>Tom &amp; Jerry</a:t></a:r></a:p>"
    "</p:txBody>";

  auto paragraphs = extractParagraphs(xml);

  REQUIRE(paragraphs == std::vector<std::string>{"Pipeline is healthy", "Tom & Jerry"});
}

TEST_CASE("extractTables reads rows and cells", "[slide]") {
  std::string xml =
    "<a:tbl><a:tr>"
    "<a:tc><a:txBody><a:p><a:r><a:t>Raised</a:t></a:r><a:r><a:t>by</a:t></a:r></a:p></a:txBody></a:tc>"
    "<a:tc><a:txBody><a:p><a:endParaRPr/></a:p></a:txBody></a:tc>"
    "</a:tr><a:tr>"
    "<a:tc><a:txBody><a:p><a:r><a:t> Ann </a:t></a:r></a:p></a:txBody></a:tc>"
    "<a:tc/>"
    "</a:tr></a:tbl>";

  auto tables = extractTables(xml);

  REQUIRE(tables.size() == 1);
  REQUIRE(tables[0].size() == 2);
  REQUIRE(tables[0][0] == TableRow{"Raised by", ""});
  REQUIRE(tables[0][1] == TableRow{"Ann", ""});
}

TEST_CASE("extractSlide collects paragraphs and tables in document order", "[slide]") {
  std::string xml = slideXml({"DAFF VAT Report", "Status"}, {Table{{"RED", "STATUS OVERALL", ""}}});

  Slide slide = extractSlide(4, xml);

  REQUIRE(slide.index == 4);
  REQUIRE(slide.byteSize == xml.size());
  REQUIRE(slide.paragraphs ==
          std::vector<std::string>{"DAFF VAT Report", "Status", "RED", "STATUS OVERALL"});
  REQUIRE(slide.tables.size() == 1);
  REQUIRE(slide.tables[0][0] == TableRow{"RED", "STATUS OVERALL", ""});
}

TEST_CASE("extractSlide rejects payloads that are not XML", "[slide]") {
  REQUIRE_THROWS_AS(extractSlide(2, "PK\x03\x04 binary"), SlideParseError);
  REQUIRE_THROWS_AS(extractSlide(2, ""), SlideParseError);
  REQUIRE_NOTHROW(extractSlide(2, "\xEF\xBB\xBF  <p:sld/>"));
  REQUIRE(extractSlide(2, "<p:sld/>").paragraphs.empty());
}

TEST_CASE("extractSlide survives an unclosed element", "[slide]") {
  Slide slide = extractSlide(1, "<p:sld><a:p><a:r><a:t>Kept</a:t></a:r></a:p><a:p><a:r><a:t>Lost");

  REQUIRE(slide.paragraphs == std::vector<std::string>{"Kept"});
}
