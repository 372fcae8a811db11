#pragma once

#include <aarc/aar_cache.hpp>
#include <aarc/differ.hpp>
#include <aarc/library.hpp>
#include <aarc/snapshot_store.hpp>
#include <aarc/unpacker.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace aarc {

enum class SyncMode { Startup, Incremental, Partial, Full, NoBuild };

const char* sync_mode_name(SyncMode mode);
bool parse_sync_mode(const std::string& name, SyncMode& out);

// Per-pass context: cancellation and user-facing output lines
class SyncContext {
public:
    SyncContext() = default;
    explicit SyncContext(CancelToken token) : token_(std::move(token)) {}

    const CancelToken& token() const { return token_; }

    void output(std::string line);
    const std::vector<std::string>& outputs() const { return outputs_; }

    void set_cancelled() { cancelled_ = true; }
    bool is_cancelled() const { return cancelled_; }

private:
    CancelToken token_;
    std::vector<std::string> outputs_;
    bool cancelled_ = false;
};

struct SyncReport {
    size_t declared = 0;
    size_t updated = 0;
    size_t fetched = 0;
    size_t removed = 0;
    UnpackReport unpack;
    bool completed = false;  // fetch, unpack and pruning all ran to the end
};

// Keeps the local AAR cache of one project in step with the libraries it
// declares, and answers where a library's jar and res/ directory live.
//
// Passes must not run concurrently against the same cache directory.
class UnpackedAars {
public:
    UnpackedAars(std::string project_name,
                 std::filesystem::path cache_dir,
                 FileOperations& ops,
                 WorkerPool& pool,
                 const LibraryCollector& collector,
                 const ArtifactResolver& resolver,
                 ArtifactFetcher& fetcher,
                 SnapshotStore* store = nullptr);

    // Read the current cache state and the stored remote snapshot
    void initialize();

    // Full passes clear the cache and the remote snapshot first; only
    // incremental passes prune
    // entries that are no longer declared. Returns an error only when the
    // pass was cancelled.
    Result<SyncReport> on_sync(SyncContext& ctx, SyncMode mode);

    // Lightweight refresh without pruning. Skipped for projects with remote
    // outputs, which only refresh during sync.
    Result<SyncReport> refresh_files(SyncContext& ctx);

    // Merged jar of the library, or the jar itself when the library is not
    // cached and the jar is local. Config error for an uncached remote jar.
    Result<std::filesystem::path> class_jar(const AarLibrary& library) const;

    std::optional<std::filesystem::path> resource_directory(const AarLibrary& library) const;
    std::optional<std::filesystem::path> aar_dir(const AarLibrary& library) const;

    const std::filesystem::path& cache_dir() const { return cache_.cache_dir(); }
    const AarCache& cache() const { return cache_; }
    const RemoteSnapshot& previous_remote_outputs() const { return previous_remote_; }

    // Declared work items keyed by raw cache entry name
    WorkItems artifacts_to_cache() const;

private:
    Result<SyncReport> refresh(SyncContext& ctx, const WorkItems& items,
                               bool remove_missing);
    Status run_pass(SyncContext& ctx, const WorkItems& items,
                    const std::set<std::string>& updated_keys,
                    bool remove_missing, SyncReport& report);
    Status fetch(SyncContext& ctx, const WorkItems& items,
                 const std::set<std::string>& updated_keys, SyncReport& report);
    void record_remote_outputs(const WorkItems& items);
    void forget_remote_outputs();

    std::string project_name_;
    FileOperations& ops_;
    const LibraryCollector& collector_;
    const ArtifactResolver& resolver_;
    ArtifactFetcher& fetcher_;
    SnapshotStore* store_;
    AarCache cache_;
    Unpacker unpacker_;
    RemoteSnapshot previous_remote_;
};

} // namespace aarc
