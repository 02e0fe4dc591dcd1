#include "slide_extractor.hpp"

#include "text_utils.hpp"

#include <cctype>
#include <cstdint>
#include <string>
#include <utility>

namespace {

struct ElementSpan {
  size_t innerBegin;
  size_t innerEnd;
  size_t end;  // one past the closing tag
};

bool isTagNameEnd(char c) {
  return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

// Finds the next <tag ...>...</tag> (or <tag/>) starting in [pos, limit).
// Returns false when there is none, or when the element is never closed.
bool findElement(const std::string& xml, const std::string& tag, size_t pos, size_t limit,
                 ElementSpan& span) {
  const std::string open = "<" + tag;
  const std::string close = "</" + tag + ">";
  while (pos < limit) {
    size_t start = xml.find(open, pos);
    if (start == std::string::npos || start + open.size() >= limit) return false;
    size_t after = start + open.size();
    if (!isTagNameEnd(xml[after])) {
      pos = after;
      continue;
    }
    size_t gt = xml.find('>', after);
    if (gt == std::string::npos || gt >= limit) return false;
    if (xml[gt - 1] == '/') {
      span = ElementSpan{gt + 1, gt + 1, gt + 1};
      return true;
    }
    size_t closeAt = xml.find(close, gt + 1);
    if (closeAt == std::string::npos || closeAt + close.size() > limit) return false;
    span = ElementSpan{gt + 1, closeAt, closeAt + close.size()};
    return true;
  }
  return false;
}

std::vector<std::string> collectRuns(const std::string& xml, size_t begin, size_t end) {
  std::vector<std::string> runs;
  ElementSpan span{};
  size_t pos = begin;
  while (findElement(xml, "a:t", pos, end, span)) {
    runs.push_back(xml.substr(span.innerBegin, span.innerEnd - span.innerBegin));
    pos = span.end;
  }
  return runs;
}

void appendUtf8(std::string& out, uint32_t code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

bool decodeCharRef(const std::string& ent, std::string& rep) {
  bool hex = ent.size() > 1 && (ent[1] == 'x' || ent[1] == 'X');
  std::string digits = ent.substr(hex ? 2 : 1);
  if (digits.empty() || digits.size() > 8) return false;
  uint32_t code = 0;
  for (char ch : digits) {
    unsigned char c = static_cast<unsigned char>(ch);
    uint32_t v;
    if (std::isdigit(c)) v = c - '0';
    else if (hex && std::isxdigit(c)) v = static_cast<uint32_t>(std::tolower(c) - 'a' + 10);
    else return false;
    code = code * (hex ? 16 : 10) + v;
  }
  if (code == 0 || code > 0x10FFFF) return false;
  appendUtf8(rep, code);
  return true;
}

// U+2011 NON-BREAKING HYPHEN in UTF-8.
const std::string kNonBreakingHyphen = "\xE2\x80\x91";

} // namespace

std::string decodeXmlText(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos && j - i <= 12) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (!ent.empty() && ent[0] == '#') decodeCharRef(ent, rep);
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  // Runs after entity decoding so that &#8209; is folded as well.
  size_t at;
  while ((at = out.find(kNonBreakingHyphen)) != std::string::npos) {
    out.replace(at, kNonBreakingHyphen.size(), "-");
  }
  return out;
}

std::vector<std::string> extractParagraphs(const std::string& xml) {
  std::vector<std::string> paragraphs;
  ElementSpan para{};
  size_t pos = 0;
  while (findElement(xml, "a:p", pos, xml.size(), para)) {
    std::string joined;
    for (const auto& run : collectRuns(xml, para.innerBegin, para.innerEnd)) joined += run;
    joined = decodeXmlText(joined);
    if (!isBlank(joined)) paragraphs.push_back(joined);
    pos = para.end;
  }
  return paragraphs;
}

std::vector<Table> extractTables(const std::string& xml) {
  std::vector<Table> tables;
  ElementSpan tbl{};
  size_t pos = 0;
  while (findElement(xml, "a:tbl", pos, xml.size(), tbl)) {
    Table table;
    ElementSpan tr{};
    size_t rowPos = tbl.innerBegin;
    while (findElement(xml, "a:tr", rowPos, tbl.innerEnd, tr)) {
      TableRow row;
      ElementSpan tc{};
      size_t cellPos = tr.innerBegin;
      while (findElement(xml, "a:tc", cellPos, tr.innerEnd, tc)) {
        std::string text;
        for (const auto& run : collectRuns(xml, tc.innerBegin, tc.innerEnd)) {
          if (!text.empty()) text += ' ';
          text += run;
        }
        row.push_back(decodeXmlText(trim(text)));
        cellPos = tc.end;
      }
      table.push_back(std::move(row));
      rowPos = tr.end;
    }
    tables.push_back(std::move(table));
    pos = tbl.end;
  }
  return tables;
}

Slide extractSlide(int index, const std::string& xml) {
  size_t first = 0;
  if (xml.compare(0, 3, "\xEF\xBB\xBF") == 0) first = 3;
  while (first < xml.size() && std::isspace(static_cast<unsigned char>(xml[first]))) first++;
  if (first >= xml.size() || xml[first] != '<') {
    throw SlideParseError("slide " + std::to_string(index) + " is not an XML document");
  }

  Slide slide;
  slide.index = index;
  slide.paragraphs = extractParagraphs(xml);
  slide.tables = extractTables(xml);
  slide.byteSize = xml.size();
  return slide;
}
