#pragma once

#include "util/result.hpp"

#include <string>

namespace sysupdate {

// Unpacks any libarchive-readable file (zip, tar, tar.gz, ...) below a
// destination directory, creating it when missing. Every failure is
// reported as ExtractionFailed.
class ArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    Result ExtractFile(const std::string& archive_path, const std::string& dst_dir) const;

  private:
    Options opt_{};
};

} // namespace sysupdate
