#pragma once

#include <aarc/artifact.hpp>
#include <aarc/file_ops.hpp>
#include <aarc/worker_pool.hpp>
#include <filesystem>
#include <set>
#include <string>

namespace aarc {

struct UnpackReport {
    size_t unpacked = 0;          // raw entries written this pass
    size_t failed = 0;            // raw entries that failed to unpack
    size_t stray_removed = 0;     // non-raw directories deleted before merging
    size_t merged_libraries = 0;  // merged directories produced
    size_t merged_files = 0;      // files copied into merged directories
    size_t skipped_files = 0;     // files skipped because the destination existed
    size_t copy_failures = 0;
};

// Unzips fetched AARs into raw cache directories and merges every raw
// directory sharing a library key into one <library>_<hash>.mergedaar tree.
//
// Only the res/ tree, R.txt and the manifest of an AAR matter to consumers;
// jars inside the archive are dropped in favour of the externally built jar,
// which is copied to jars/classes_and_libs_merged.jar.
//
// The FileOperations and WorkerPool must outlive any pass that was cancelled,
// since tasks already queued keep running.
class Unpacker {
public:
    Unpacker(FileOperations& ops, WorkerPool& pool);

    // Re-unpack updated_keys, drop stray non-raw directories, then rebuild the
    // merged directories from the full declared set. Per-item failures are
    // logged and counted; only a failed or cancelled batch returns an error.
    Result<UnpackReport> unpack(const WorkItems& to_cache,
                                const std::set<std::string>& updated_keys,
                                const std::filesystem::path& dest_dir,
                                const CancelToken& token);

private:
    FileOperations& ops_;
    WorkerPool& pool_;
};

} // namespace aarc
