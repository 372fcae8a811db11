#pragma once

#include <aarc/file_ops.hpp>
#include <aarc/worker_pool.hpp>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace aarc {

// Cache entry name -> stamp marker path
using CacheStateMap = std::map<std::string, std::filesystem::path>;

// Record of what is currently unpacked under the cache root.
//
// Layout:
//   <root>/<name>_<hash>.aar/{res/, jars/classes_and_libs_merged.jar, aar.timestamp}
//   <root>/<library>_<hash>.mergedaar/...        same shape, rebuilt every pass
//
// The stamp marker carries the source artifact's modification time; the
// directory's own mtime moves whenever a child changes, so it is not used.
// The in-memory state is replaced wholesale by scan() through an atomic
// pointer swap: readers see either the old or the new map, never a mix.
class AarCache {
public:
    AarCache(std::filesystem::path cache_dir, FileOperations& ops, WorkerPool& pool);

    const std::filesystem::path& cache_dir() const { return cache_dir_; }

    // Ensure the cache root exists
    Status create_cache_dir();

    // Rebuild the state from the root's immediate children. The stamp path
    // is computed, not checked. Returns an empty map if the root cannot be
    // listed.
    CacheStateMap scan();

    // Schedule deletion of every tracked raw entry not in keep. Other
    // entries (merged directories) belong to whoever regenerates them.
    // One future per removed entry.
    std::vector<std::future<void>> remove_entries_not_in(const std::set<std::string>& keep);

    // Delete the whole root (failures are logged) and forget the state
    void clear();

    // Path of a cache entry, or nothing when no scan has populated the state
    std::optional<std::filesystem::path> lookup(const std::string& name) const;

    std::shared_ptr<const CacheStateMap> snapshot() const;
    std::set<std::string> cached_keys() const;

private:
    void replace_state(std::shared_ptr<const CacheStateMap> next);

    std::filesystem::path cache_dir_;
    FileOperations& ops_;
    WorkerPool& pool_;
    std::shared_ptr<const CacheStateMap> state_;
};

} // namespace aarc
