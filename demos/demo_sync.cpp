// demo_sync.cpp
//
// Runs one AAR cache pass for the project described by a TOML config and
// prints what changed:
//
//     ./demo_sync aarc.toml                  # incremental pass
//     ./demo_sync aarc.toml full             # clear and rebuild the cache
//     ./demo_sync aarc.toml refresh          # lightweight refresh, no pruning
//
// Only local artifacts can be synced here; the demo has no remote transport.

#include <aarc/config.hpp>
#include <aarc/file_ops.hpp>
#include <aarc/log.hpp>
#include <aarc/snapshot_store.hpp>
#include <aarc/unpacked_aars.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace aarc;

static Result<Config> parse_args(int argc, char** argv) {
    if (argc < 2) {
        return AarcError{
            AarcError::InvalidArg,
            "no config file specified",
            "usage: demo_sync <aarc.toml> [incremental|full|partial|refresh]"
        };
    }
    return Config::load(argv[1]);
}

int main(int argc, char** argv) {
    auto cfg = parse_args(argc, argv);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    const Config& config = cfg.value();
    log::set_level(config.log_level);

    std::string mode_name = argc > 2 ? argv[2] : "incremental";
    bool refresh_only = mode_name == "refresh";
    SyncMode mode = SyncMode::Incremental;
    if (!refresh_only && !parse_sync_mode(mode_name, mode)) {
        AarcError err{AarcError::InvalidArg, "unknown sync mode '" + mode_name + "'",
                      "expected incremental, full, partial or refresh"};
        std::cerr << err.format() << "\n";
        return 1;
    }

    std::string exec_root = config.execution_root.empty()
        ? fs::current_path().string() : config.execution_root;

    LocalFileOperations ops;
    WorkerPool pool(config.workers);
    DeclaredLibraryCollector collector(config.libraries);
    ExecRootResolver resolver(exec_root, config.download_dir());
    LocalOnlyFetcher fetcher;

    SnapshotStore store;
    auto opened = store.open(config.effective_state_db());
    if (opened.is_err()) {
        log::warn("continuing without remote snapshot history: %s",
                  opened.error().message.c_str());
    }

    UnpackedAars aars(config.project_name, config.effective_cache_root(), ops, pool,
                      collector, resolver, fetcher, store.is_open() ? &store : nullptr);
    aars.initialize();

    SyncContext ctx;
    auto report = refresh_only ? aars.refresh_files(ctx) : aars.on_sync(ctx, mode);
    if (report.is_err()) {
        std::cerr << report.error().format() << "\n";
        return 2;
    }

    const SyncReport& r = report.value();
    std::cout << "cache:     " << aars.cache_dir().string() << "\n"
              << "declared:  " << r.declared << "\n"
              << "updated:   " << r.updated << "\n"
              << "unpacked:  " << r.unpack.unpacked << " (" << r.unpack.failed << " failed)\n"
              << "merged:    " << r.unpack.merged_libraries << " libraries, "
              << r.unpack.merged_files << " files, " << r.unpack.skipped_files << " skipped\n"
              << "removed:   " << r.removed << "\n"
              << "completed: " << (r.completed ? "yes" : "no") << "\n";

    for (const auto& lib : config.libraries) {
        auto res = aars.resource_directory(lib);
        std::cout << "  " << lib.key << " -> "
                  << (res ? res->string() : std::string("(not cached)")) << "\n";
    }
    return r.completed ? 0 : 3;
}
