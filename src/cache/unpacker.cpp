#include <aarc/unpacker.hpp>
#include <aarc/archive.hpp>
#include <aarc/log.hpp>
#include <aarc/naming.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace aarc {

namespace {

// Shared with queued tasks, which may outlive a cancelled unpack() call
struct Counters {
    std::atomic<size_t> unpacked{0};
    std::atomic<size_t> failed{0};
    std::atomic<size_t> stray_removed{0};
    std::atomic<size_t> merged_files{0};
    std::atomic<size_t> skipped_files{0};
    std::atomic<size_t> copy_failures{0};
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Stamp failures are logged only: a missing or wrong stamp just makes the
// next diff treat the entry as stale again.
void create_stamp_file(FileOperations& ops, const fs::path& aar_dir, const Artifact& aar) {
    fs::path stamp = naming::stamp_file(aar_dir);
    auto created = ops.create_file(stamp);
    if (created.is_err()) {
        log::warn("failed to set AAR cache timestamp for %s: %s",
                  aar.describe().c_str(), created.error().message.c_str());
        return;
    }
    // Remote artifacts have no meaningful local timestamp
    if (!aar.is_local()) return;

    auto source_time = ops.modified_time(aar.file());
    if (source_time.is_err()) {
        log::warn("failed to set AAR cache timestamp for %s: %s",
                  aar.describe().c_str(), source_time.error().message.c_str());
        return;
    }
    auto set = ops.set_modified_time(stamp, source_time.value());
    if (set.is_err()) {
        log::warn("failed to set AAR cache timestamp for %s: %s",
                  aar.describe().c_str(), set.error().message.c_str());
    }
}

Status unpack_one(FileOperations& ops, const AarAndJar& item, const fs::path& dest_dir) {
    fs::path aar_dir = dest_dir / naming::aar_dir_name(item.aar);

    if (ops.exists(aar_dir)) {
        AARC_TRY(ops.delete_recursively(aar_dir));
    }
    AARC_TRY(ops.mkdirs(aar_dir));

    if (!ops.exists(item.aar.file())) {
        return AarcError{AarcError::IO,
            "no local copy of " + item.aar.describe() + " at " + item.aar.file().string(),
            item.aar.is_remote() ? "remote artifacts must be fetched before unpacking" : ""};
    }

    auto extracted = extract_archive(ops, item.aar.file(), aar_dir,
        [](const std::string& name) { return !ends_with(name, naming::DOT_JAR); });
    if (extracted.is_err()) return std::move(extracted).error();

    create_stamp_file(ops, aar_dir, item.aar);

    if (item.jar) {
        fs::path dest = naming::jar_file(aar_dir);
        AARC_TRY(ops.mkdirs(dest.parent_path()));
        AARC_TRY(ops.copy(item.jar->file(), dest, /*overwrite=*/true));
    }

    log::debug("unpacked %s -> %s (%zu files)", item.aar.describe().c_str(),
               aar_dir.c_str(), extracted.value().extracted);
    return ok_status();
}

// Copy every file below src into dest keeping relative paths. Existing
// destination files win; only unexpected collisions are reported.
void copy_files(FileOperations& ops, const fs::path& src, const fs::path& dest,
                Counters& counters) {
    for (const auto& src_file : ops.list_files_recursively(src)) {
        fs::path dest_file = dest / src_file.lexically_relative(src);

        auto made = ops.mkdirs(dest_file.parent_path());
        if (made.is_err()) {
            log::warn("failed to copy %s to merged directory %s: %s", src_file.c_str(),
                      dest_file.c_str(), made.error().message.c_str());
            counters.copy_failures++;
            continue;
        }

        if (ops.exists(dest_file)) {
            counters.skipped_files++;
            std::string name = dest_file.filename().string();
            // Every member carries its own stamp and manifest
            if (name != naming::STAMP_FILE_NAME && name != naming::MANIFEST_FILE_NAME) {
                // Same-named resource files are not merged; the first member's copy is kept
                log::info("not copying %s to merged directory %s: file already exists",
                          src_file.c_str(), dest_file.c_str());
            }
            continue;
        }

        auto copied = ops.copy(src_file, dest_file, /*overwrite=*/false);
        if (copied.is_err()) {
            log::warn("failed to copy %s to merged directory %s: %s", src_file.c_str(),
                      dest_file.c_str(), copied.error().message.c_str());
            counters.copy_failures++;
            continue;
        }
        counters.merged_files++;
    }
}

} // namespace

Unpacker::Unpacker(FileOperations& ops, WorkerPool& pool)
    : ops_(ops), pool_(pool) {}

Result<UnpackReport> Unpacker::unpack(const WorkItems& to_cache,
                                      const std::set<std::string>& updated_keys,
                                      const fs::path& dest_dir,
                                      const CancelToken& token) {
    auto counters = std::make_shared<Counters>();
    FileOperations* ops = &ops_;

    // 1. Unpack updated AARs, each in isolation
    {
        TaskGroup group(pool_, token);
        for (const auto& key : updated_keys) {
            auto it = to_cache.find(key);
            if (it == to_cache.end()) {
                log::warn("updated key %s is not declared, skipping", key.c_str());
                continue;
            }
            AarAndJar item = it->second;
            group.spawn([ops, item, dest_dir, counters] {
                auto s = unpack_one(*ops, item, dest_dir);
                if (s.is_err()) {
                    log::warn("failed to extract AAR %s to %s: %s", item.aar.describe().c_str(),
                              dest_dir.c_str(), s.error().message.c_str());
                    counters->failed++;
                    return;
                }
                counters->unpacked++;
            });
        }
        AARC_TRY(group.wait());
    }

    // 2. Everything that is not a raw entry was produced by an earlier merge
    //    and is regenerated below
    {
        TaskGroup group(pool_, token);
        auto children = ops_.list_files(dest_dir);
        if (children.is_ok()) {
            for (const auto& child : children.value()) {
                if (naming::is_raw_entry(child.filename().string())) continue;
                group.spawn([ops, child, counters] {
                    auto s = ops->delete_recursively(child);
                    if (s.is_err()) {
                        log::warn("%s", s.error().message.c_str());
                        return;
                    }
                    counters->stray_removed++;
                });
            }
        }
        AARC_TRY(group.wait());
    }

    // 3. Merge raw directories per library key, over the full declared set so
    //    the merged output is complete even when only some members changed.
    //    Members of one library are copied in entry-name order by a single
    //    task, which makes the first writer deterministic.
    auto started = std::chrono::steady_clock::now();
    std::map<std::string, std::vector<std::string>> by_library;
    for (const auto& [name, item] : to_cache) {
        by_library[item.library_key].push_back(name);
    }
    {
        TaskGroup group(pool_, token);
        for (const auto& [library_key, members] : by_library) {
            fs::path merged = dest_dir / naming::merged_dir_name(library_key);
            std::vector<fs::path> sources;
            for (const auto& m : members) sources.push_back(dest_dir / m);
            group.spawn([ops, merged, sources, counters] {
                for (const auto& src : sources) {
                    copy_files(*ops, src, merged, *counters);
                }
            });
        }
        AARC_TRY(group.wait());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    log::info("merged %zu AARs into %zu libraries in %lld ms", to_cache.size(),
              by_library.size(), static_cast<long long>(elapsed.count()));

    UnpackReport report;
    report.unpacked = counters->unpacked.load();
    report.failed = counters->failed.load();
    report.stray_removed = counters->stray_removed.load();
    report.merged_libraries = by_library.size();
    report.merged_files = counters->merged_files.load();
    report.skipped_files = counters->skipped_files.load();
    report.copy_failures = counters->copy_failures.load();
    return Result<UnpackReport>::ok(report);
}

} // namespace aarc
