#include "archive_reader.hpp"

#include <spdlog/spdlog.h>
#include <zip.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace {

struct ZipGuard {
  zip_t* archive;
  ~ZipGuard() { if (archive) zip_discard(archive); }
};

struct ZipFileGuard {
  zip_file_t* file;
  ~ZipFileGuard() { if (file) zip_fclose(file); }
};

struct ZipErrorGuard {
  zip_error_t error;
  ZipErrorGuard() { zip_error_init(&error); }
  ~ZipErrorGuard() { zip_error_fini(&error); }
};

std::string readEntry(zip_t* archive, zip_uint64_t index, const std::string& name, size_t maxBytes) {
  zip_stat_t stat;
  zip_stat_init(&stat);
  if (zip_stat_index(archive, index, 0, &stat) != 0 || !(stat.valid & ZIP_STAT_SIZE)) {
    throw ArchiveError("Failed to stat archive entry '" + name + "'");
  }
  if (stat.size > maxBytes) {
    throw ArchiveError("Archive entry '" + name + "' is too large (" + std::to_string(stat.size) +
                       " bytes, limit " + std::to_string(maxBytes) + ")");
  }

  zip_file_t* file = zip_fopen_index(archive, index, 0);
  if (!file) {
    throw ArchiveError("Failed to open archive entry '" + name + "': " + zip_strerror(archive));
  }
  ZipFileGuard fileGuard{file};

  std::string content;
  content.resize(static_cast<size_t>(stat.size));
  zip_int64_t bytesRead = stat.size == 0 ? 0 : zip_fread(file, &content[0], stat.size);
  if (bytesRead < 0 || static_cast<zip_uint64_t>(bytesRead) != stat.size) {
    throw ArchiveError("Failed to read archive entry '" + name + "'");
  }
  return content;
}

void writeFile(const fs::path& target, const std::string& content) {
  std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw ArchiveError("Failed to create '" + target.string() + "' in extraction directory");
  }
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) {
    throw ArchiveError("Failed to write '" + target.string() + "' in extraction directory");
  }
}

std::string readFile(const fs::path& source) {
  std::ifstream ifs(source, std::ios::binary);
  if (!ifs) {
    throw ArchiveError("Failed to read back extracted entry '" + source.string() + "'");
  }
  std::ostringstream buffer;
  buffer << ifs.rdbuf();
  return buffer.str();
}

// The N of "ppt/slides/slideN.xml", or an empty string for any other entry.
std::string slideNumberDigits(const std::string& name) {
  const std::string prefix = "ppt/slides/slide";
  const std::string suffix = ".xml";
  if (name.size() <= prefix.size() + suffix.size()) return "";
  if (name.compare(0, prefix.size(), prefix) != 0) return "";
  if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return "";

  std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  bool allDigits = std::all_of(digits.begin(), digits.end(),
                               [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
  return allDigits ? digits : "";
}

std::vector<SlideEntry> extractSlides(zip_t* archive, const fs::path& root, size_t maxSlideBytes) {
  std::vector<SlideEntry> slides;
  zip_int64_t total = zip_get_num_entries(archive, 0);
  for (zip_int64_t i = 0; i < total; ++i) {
    const char* rawName = zip_get_name(archive, static_cast<zip_uint64_t>(i), 0);
    if (!rawName) continue;
    std::string name = rawName;

    fs::path target = root / fs::path(name);
    if (!isWithinDirectory(root, target)) {
      throw ArchiveError("Zip Slip detected: entry '" + name + "' resolves outside extraction directory");
    }

    std::string digits = slideNumberDigits(name);
    if (digits.empty()) continue;

    int index = 0;
    try {
      index = std::stoi(digits);
    } catch (const std::out_of_range&) {
      throw ArchiveError("Slide number out of range in entry '" + name + "'");
    }

    std::string content = readEntry(archive, static_cast<zip_uint64_t>(i), name, maxSlideBytes);
    fs::create_directories(target.parent_path());
    writeFile(target, content);

    fs::path resolved = fs::canonical(target);
    if (!isWithinDirectory(root, resolved)) {
      throw ArchiveError("Zip Slip detected: entry '" + name + "' resolves outside extraction directory");
    }

    slides.push_back(SlideEntry{index, readFile(resolved)});
    spdlog::debug("extracted {} ({} bytes)", name, slides.back().xml.size());
  }

  if (slides.empty()) {
    throw ArchiveError("No slides found in the document");
  }

  std::stable_sort(slides.begin(), slides.end(),
                   [](const SlideEntry& a, const SlideEntry& b) { return a.index < b.index; });
  return slides;
}

} // namespace

ScopedTempDir::ScopedTempDir(const fs::path& root) {
  fs::path base = root.empty() ? fs::temp_directory_path() : root;
  std::string pattern = (base / "deckextract-XXXXXX").string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    throw ArchiveError("Failed to create extraction directory under '" + base.string() +
                       "': " + std::strerror(errno));
  }
  path_ = fs::path(buf.data());
  spdlog::debug("created extraction directory {}", path_.string());
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    spdlog::warn("failed to remove extraction directory {}: {}", path_.string(), ec.message());
  }
}

bool isWithinDirectory(const fs::path& root, const fs::path& candidate) {
  fs::path r = root.lexically_normal();
  fs::path c = candidate.lexically_normal();
  auto rit = r.begin();
  auto cit = c.begin();
  for (; rit != r.end(); ++rit) {
    // A trailing separator normalizes to an empty final element.
    if (rit->empty()) continue;
    if (cit == c.end() || *rit != *cit) return false;
    ++cit;
  }
  for (; cit != c.end(); ++cit) {
    if (*cit == "..") return false;
  }
  return true;
}

std::vector<SlideEntry> readSlideEntries(const std::string& packageBytes, const fs::path& tempRoot,
                                         size_t maxSlideBytes) {
  ZipErrorGuard err;
  zip_source_t* source = zip_source_buffer_create(packageBytes.data(), packageBytes.size(), 0, &err.error);
  if (!source) {
    throw ArchiveError(std::string("Failed to read document: ") + zip_error_strerror(&err.error));
  }
  zip_t* archive = zip_open_from_source(source, ZIP_RDONLY, &err.error);
  if (!archive) {
    zip_source_free(source);
    throw ArchiveError(std::string("Failed to open document as a zip archive: ") +
                       zip_error_strerror(&err.error));
  }
  ZipGuard guard{archive};

  try {
    ScopedTempDir extractDir(tempRoot);
    return extractSlides(archive, fs::canonical(extractDir.path()), maxSlideBytes);
  } catch (const fs::filesystem_error& e) {
    throw ArchiveError(std::string("Failed to extract document: ") + e.what());
  }
}

