#pragma once

#include <aarc/aar_cache.hpp>
#include <aarc/artifact.hpp>
#include <aarc/file_ops.hpp>
#include <map>
#include <set>
#include <string>

namespace aarc {

// Remote outputs known from a previous pass: output key -> content digest
class RemoteSnapshot {
public:
    RemoteSnapshot() = default;
    explicit RemoteSnapshot(std::map<std::string, std::string> digests)
        : digests_(std::move(digests)) {}

    // Snapshot of every remote artifact among the declared items (aars and jars)
    static RemoteSnapshot from_work_items(const WorkItems& items);

    const std::string* find(const std::string& key) const;
    bool empty() const { return digests_.empty(); }
    size_t size() const { return digests_.size(); }
    const std::map<std::string, std::string>& digests() const { return digests_; }

    bool operator==(const RemoteSnapshot& o) const { return digests_ == o.digests_; }

private:
    std::map<std::string, std::string> digests_;
};

// Keys whose cached copy is missing or stale. A key is updated when it has no
// cache entry or no stamp marker. A local artifact is also updated when its
// mtime differs from the stamp's, and a remote one when the previous snapshot
// lacks it or recorded another digest. Reads timestamps, writes nothing.
std::set<std::string> find_updated_outputs(const std::map<std::string, Artifact>& outputs,
                                           const CacheStateMap& cached,
                                           const RemoteSnapshot& previous,
                                           const FileOperations& ops);

} // namespace aarc
