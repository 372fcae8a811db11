#include <aarc/aar_cache.hpp>
#include <aarc/log.hpp>
#include <aarc/naming.hpp>

namespace fs = std::filesystem;

namespace aarc {

AarCache::AarCache(fs::path cache_dir, FileOperations& ops, WorkerPool& pool)
    : cache_dir_(std::move(cache_dir)), ops_(ops), pool_(pool),
      state_(std::make_shared<const CacheStateMap>()) {}

Status AarCache::create_cache_dir() {
    if (ops_.is_directory(cache_dir_)) return ok_status();
    return ops_.mkdirs(cache_dir_);
}

void AarCache::replace_state(std::shared_ptr<const CacheStateMap> next) {
    std::atomic_store(&state_, std::move(next));
}

std::shared_ptr<const CacheStateMap> AarCache::snapshot() const {
    return std::atomic_load(&state_);
}

CacheStateMap AarCache::scan() {
    auto children = ops_.list_files(cache_dir_);
    if (children.is_err()) {
        log::debug("cache root not readable: %s", children.error().message.c_str());
        return {};
    }

    auto next = std::make_shared<CacheStateMap>();
    for (const auto& dir : children.value()) {
        (*next)[dir.filename().string()] = naming::stamp_file(dir);
    }
    CacheStateMap result = *next;
    replace_state(std::move(next));
    return result;
}

std::vector<std::future<void>> AarCache::remove_entries_not_in(const std::set<std::string>& keep) {
    auto state = snapshot();
    std::vector<std::future<void>> pending;
    for (const auto& [name, stamp] : *state) {
        if (keep.count(name) || !naming::is_raw_entry(name)) continue;
        fs::path dir = cache_dir_ / name;
        FileOperations* ops = &ops_;
        pending.push_back(pool_.submit([ops, dir] {
            auto s = ops->delete_recursively(dir);
            if (s.is_err()) log::warn("%s", s.error().message.c_str());
        }));
    }
    return pending;
}

void AarCache::clear() {
    if (ops_.exists(cache_dir_)) {
        auto s = ops_.delete_recursively(cache_dir_);
        if (s.is_err()) {
            log::warn("failed to clear unpacked AAR directory %s: %s",
                      cache_dir_.c_str(), s.error().message.c_str());
        }
    }
    replace_state(std::make_shared<const CacheStateMap>());
}

std::optional<fs::path> AarCache::lookup(const std::string& name) const {
    auto state = snapshot();
    if (state->empty()) {
        log::warn("cache state is empty, looked up %s before the first scan", name.c_str());
        return std::nullopt;
    }
    return cache_dir_ / name;
}

std::set<std::string> AarCache::cached_keys() const {
    std::set<std::string> keys;
    for (const auto& kv : *snapshot()) keys.insert(kv.first);
    return keys;
}

} // namespace aarc
