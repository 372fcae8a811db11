#pragma once

#include <aarc/file_ops.hpp>
#include <aarc/result.hpp>
#include <filesystem>
#include <functional>
#include <string>

namespace aarc {

// Decides whether an archive member (its path inside the archive) is extracted
using EntryFilter = std::function<bool(const std::string& entry_name)>;

struct ExtractStats {
    size_t extracted = 0;
    size_t skipped = 0;
};

// Extract a zip (or any libarchive-readable) archive below dest_dir.
// Members rejected by the filter are skipped. Absolute member paths and
// members escaping dest_dir through ".." are refused.
//
// Directories are created through ops. Member contents are streamed to disk
// by libarchive itself, so a FileOperations that does not map onto the real
// filesystem cannot observe them.
Result<ExtractStats> extract_archive(FileOperations& ops,
                                     const std::filesystem::path& archive_path,
                                     const std::filesystem::path& dest_dir,
                                     const EntryFilter& filter);

} // namespace aarc
