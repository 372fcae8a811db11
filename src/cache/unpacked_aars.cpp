#include <aarc/unpacked_aars.hpp>
#include <aarc/log.hpp>
#include <aarc/naming.hpp>

namespace fs = std::filesystem;

namespace aarc {

const char* sync_mode_name(SyncMode mode) {
    switch (mode) {
        case SyncMode::Startup:     return "startup";
        case SyncMode::Incremental: return "incremental";
        case SyncMode::Partial:     return "partial";
        case SyncMode::Full:        return "full";
        case SyncMode::NoBuild:     return "no-build";
    }
    return "unknown";
}

bool parse_sync_mode(const std::string& name, SyncMode& out) {
    static const SyncMode all[] = {SyncMode::Startup, SyncMode::Incremental,
                                   SyncMode::Partial, SyncMode::Full, SyncMode::NoBuild};
    for (SyncMode m : all) {
        if (name == sync_mode_name(m)) {
            out = m;
            return true;
        }
    }
    return false;
}

void SyncContext::output(std::string line) {
    log::info("%s", line.c_str());
    outputs_.push_back(std::move(line));
}

UnpackedAars::UnpackedAars(std::string project_name,
                           fs::path cache_dir,
                           FileOperations& ops,
                           WorkerPool& pool,
                           const LibraryCollector& collector,
                           const ArtifactResolver& resolver,
                           ArtifactFetcher& fetcher,
                           SnapshotStore* store)
    : project_name_(std::move(project_name)),
      ops_(ops),
      collector_(collector),
      resolver_(resolver),
      fetcher_(fetcher),
      store_(store),
      cache_(std::move(cache_dir), ops, pool),
      unpacker_(ops, pool) {}

void UnpackedAars::initialize() {
    cache_.scan();
    if (store_ && store_->is_open()) {
        auto loaded = store_->load(project_name_);
        if (loaded.is_ok()) {
            previous_remote_ = std::move(loaded).value();
        } else {
            log::warn("cannot load remote output snapshot: %s",
                      loaded.error().message.c_str());
        }
    }
}

WorkItems UnpackedAars::artifacts_to_cache() const {
    WorkItems items;
    for (const auto& library : collector_.collect()) {
        Artifact aar = resolver_.resolve(library.aar);
        std::optional<Artifact> jar;
        if (library.jar) jar = resolver_.resolve(*library.jar);
        std::string name = naming::aar_dir_name(aar);
        items.insert_or_assign(name, AarAndJar{std::move(aar), std::move(jar), library.key});
    }
    return items;
}

Result<SyncReport> UnpackedAars::on_sync(SyncContext& ctx, SyncMode mode) {
    log::debug("AAR cache sync (%s) for %s", sync_mode_name(mode), project_name_.c_str());
    if (mode == SyncMode::Full) {
        cache_.clear();
        forget_remote_outputs();
    }
    // Partial syncs may not declare every library, so they never prune
    bool remove_missing = mode == SyncMode::Incremental;
    return refresh(ctx, artifacts_to_cache(), remove_missing);
}

Result<SyncReport> UnpackedAars::refresh_files(SyncContext& ctx) {
    WorkItems items = artifacts_to_cache();
    if (!RemoteSnapshot::from_work_items(items).empty()) {
        log::debug("project has remote outputs, AARs refresh only during sync");
        return Result<SyncReport>::ok(SyncReport{});
    }
    return refresh(ctx, items, /*remove_missing=*/false);
}

Result<SyncReport> UnpackedAars::refresh(SyncContext& ctx, const WorkItems& items,
                                         bool remove_missing) {
    SyncReport report;
    report.declared = items.size();

    auto created = cache_.create_cache_dir();
    if (created.is_err()) {
        log::warn("could not create unpacked AAR directory %s: %s",
                  cache_.cache_dir().c_str(), created.error().message.c_str());
        return Result<SyncReport>::ok(report);
    }

    CacheStateMap cached = cache_.scan();
    std::map<std::string, Artifact> aar_outputs;
    for (const auto& [name, item] : items) aar_outputs.emplace(name, item.aar);

    std::set<std::string> updated_keys =
        find_updated_outputs(aar_outputs, cached, previous_remote_, ops_);
    report.updated = updated_keys.size();

    Status outcome = run_pass(ctx, items, updated_keys, remove_missing, report);

    // Keep the in-memory record in line with disk whatever happened above
    cache_.scan();

    if (is_cancelled(outcome)) {
        ctx.set_cancelled();
        return std::move(outcome).error();
    }
    if (outcome.is_err()) {
        log::warn("unpacked AAR synchronization didn't complete: %s",
                  outcome.error().format().c_str());
    }
    return Result<SyncReport>::ok(report);
}

Status UnpackedAars::run_pass(SyncContext& ctx, const WorkItems& items,
                              const std::set<std::string>& updated_keys,
                              bool remove_missing, SyncReport& report) {
    AARC_TRY(fetch(ctx, items, updated_keys, report));

    auto unpacked = unpacker_.unpack(items, updated_keys, cache_.cache_dir(), ctx.token());
    if (unpacked.is_err()) return std::move(unpacked).error();
    report.unpack = unpacked.value();
    if (!updated_keys.empty()) {
        ctx.output("Copied " + std::to_string(report.unpack.unpacked) + " AARs");
    }
    if (report.unpack.failed > 0) {
        ctx.output("Failed to unpack " + std::to_string(report.unpack.failed) + " AARs");
    }

    if (remove_missing) {
        std::set<std::string> keep;
        for (const auto& kv : items) keep.insert(kv.first);
        auto removed = cache_.remove_entries_not_in(keep);
        AARC_TRY(await_all(removed, ctx.token()));
        report.removed = removed.size();
        if (!removed.empty()) {
            ctx.output("Removed " + std::to_string(removed.size()) + " AARs");
        }
    }

    record_remote_outputs(items);
    report.completed = true;
    return ok_status();
}

Status UnpackedAars::fetch(SyncContext& ctx, const WorkItems& items,
                           const std::set<std::string>& updated_keys, SyncReport& report) {
    // The jar is a separate artifact from the aar; it is only fetched when
    // its aar needs updating.
    std::set<Artifact> to_download;
    for (const auto& key : updated_keys) {
        auto it = items.find(key);
        if (it == items.end()) continue;
        to_download.insert(it->second.aar);
        if (it->second.jar) to_download.insert(*it->second.jar);
    }

    std::vector<Artifact> remote;
    for (const auto& a : to_download) {
        if (a.is_remote()) remote.push_back(a);
    }
    report.fetched = remote.size();

    std::future<Status> done = fetcher_.download(project_name_, remote);
    if (!wait_ready(done, ctx.token())) {
        return AarcError{AarcError::Cancelled, "fetching AAR files was cancelled"};
    }
    try {
        return done.get();
    } catch (const std::exception& e) {
        return AarcError{AarcError::Execution,
            std::string("fetching AAR files failed: ") + e.what()};
    }
}

void UnpackedAars::record_remote_outputs(const WorkItems& items) {
    previous_remote_ = RemoteSnapshot::from_work_items(items);
    if (!store_ || !store_->is_open()) return;
    auto saved = store_->save(project_name_, previous_remote_);
    if (saved.is_err()) {
        log::warn("cannot persist remote output snapshot: %s", saved.error().message.c_str());
    }
}

void UnpackedAars::forget_remote_outputs() {
    previous_remote_ = RemoteSnapshot();
    if (!store_ || !store_->is_open()) return;
    auto cleared = store_->clear(project_name_);
    if (cleared.is_err()) {
        log::warn("cannot clear remote output snapshot: %s", cleared.error().message.c_str());
    }
}

std::optional<fs::path> UnpackedAars::aar_dir(const AarLibrary& library) const {
    return cache_.lookup(naming::merged_dir_name(library.key));
}

std::optional<fs::path> UnpackedAars::resource_directory(const AarLibrary& library) const {
    auto dir = aar_dir(library);
    if (!dir) return std::nullopt;
    return naming::res_dir(*dir);
}

Result<fs::path> UnpackedAars::class_jar(const AarLibrary& library) const {
    if (!library.jar) {
        return AarcError{AarcError::NotFound, "library " + library.key + " has no jar"};
    }
    Artifact jar = resolver_.resolve(*library.jar);

    auto dir = aar_dir(library);
    if (dir) return Result<fs::path>::ok(naming::jar_file(*dir));

    if (jar.is_remote()) {
        // A synced remote library is always in the cache state
        log::warn("fail to look up %s from cache state for library [aar = %s, jar = %s]",
                  naming::merged_dir_name(library.key).c_str(),
                  resolver_.resolve(library.aar).describe().c_str(),
                  jar.describe().c_str());
        std::string keys;
        for (const auto& k : cache_.cached_keys()) {
            if (!keys.empty()) keys += ", ";
            keys += k;
        }
        log::debug("cache state contains the following keys: %s", keys.c_str());
        return AarcError{AarcError::Config,
            "the AAR cache must be enabled when syncing remotely",
            "no local fallback exists for " + jar.describe()};
    }
    return Result<fs::path>::ok(jar.file());
}

} // namespace aarc
