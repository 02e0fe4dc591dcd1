#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

// Fatal problem with the document package: not a zip archive, no slides, or an
// entry that would be extracted outside the extraction directory.
class ArchiveError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Largest uncompressed slide entry that is extracted.
const size_t kDefaultMaxSlideBytes = 100 * 1024 * 1024;

struct SlideEntry {
  int index;        // N of ppt/slides/slideN.xml
  std::string xml;
};

// Uniquely named directory that is removed, with everything below it, when the
// object goes out of scope.
class ScopedTempDir {
public:
  explicit ScopedTempDir(const std::filesystem::path& root = {});
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// True if `candidate` is `root` or lies below it, compared component-wise
// after lexical normalization.
bool isWithinDirectory(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Extracts the slide XML payloads of a presentation package, ordered by slide
// number. The temporary extraction directory is created under `tempRoot`
// (system temp directory when empty) and is always removed before returning.
// Throws ArchiveError, also for a slide entry larger than `maxSlideBytes`.
std::vector<SlideEntry> readSlideEntries(const std::string& packageBytes,
                                         const std::filesystem::path& tempRoot = {},
                                         size_t maxSlideBytes = kDefaultMaxSlideBytes);
