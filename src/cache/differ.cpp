#include <aarc/differ.hpp>
#include <aarc/log.hpp>

namespace aarc {

RemoteSnapshot RemoteSnapshot::from_work_items(const WorkItems& items) {
    std::map<std::string, std::string> digests;
    for (const auto& [name, item] : items) {
        if (item.aar.is_remote()) digests[item.aar.key()] = item.aar.digest();
        if (item.jar && item.jar->is_remote()) digests[item.jar->key()] = item.jar->digest();
    }
    return RemoteSnapshot(std::move(digests));
}

const std::string* RemoteSnapshot::find(const std::string& key) const {
    auto it = digests_.find(key);
    return it == digests_.end() ? nullptr : &it->second;
}

static bool local_is_stale(const Artifact& artifact,
                           const std::filesystem::path& stamp,
                           const FileOperations& ops) {
    auto stamp_time = ops.modified_time(stamp);
    if (stamp_time.is_err()) return true;
    auto source_time = ops.modified_time(artifact.file());
    if (source_time.is_err()) {
        // Nothing to compare against; the unpack will report the real failure
        log::debug("cannot stat %s", artifact.key().c_str());
        return true;
    }
    return source_time.value() != stamp_time.value();
}

static bool remote_is_stale(const Artifact& artifact,
                            const std::filesystem::path& stamp,
                            const RemoteSnapshot& previous,
                            const FileOperations& ops) {
    // An unpack that failed after the digest was recorded leaves no stamp
    if (!ops.exists(stamp)) return true;
    const std::string* old_digest = previous.find(artifact.key());
    return !old_digest || *old_digest != artifact.digest();
}

std::set<std::string> find_updated_outputs(const std::map<std::string, Artifact>& outputs,
                                           const CacheStateMap& cached,
                                           const RemoteSnapshot& previous,
                                           const FileOperations& ops) {
    std::set<std::string> updated;
    for (const auto& [key, artifact] : outputs) {
        auto it = cached.find(key);
        if (it == cached.end()) {
            updated.insert(key);
            continue;
        }
        bool stale = artifact.is_remote()
            ? remote_is_stale(artifact, it->second, previous, ops)
            : local_is_stale(artifact, it->second, ops);
        if (stale) updated.insert(key);
    }
    return updated;
}

} // namespace aarc
