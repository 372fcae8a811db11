#pragma once

#include <aarc/differ.hpp>
#include <aarc/result.hpp>
#include <memory>
#include <string>

namespace aarc {

// SQLite-backed record of the remote outputs seen by the last completed
// pass, so a restarted session diffs remote artifacts against real history
// instead of treating every one of them as new.
class SnapshotStore {
public:
    SnapshotStore();
    ~SnapshotStore();
    SnapshotStore(SnapshotStore&&) noexcept;
    SnapshotStore& operator=(SnapshotStore&&) noexcept;

    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Empty snapshot when nothing was stored for the project yet
    Result<RemoteSnapshot> load(const std::string& project);

    // Replace the stored snapshot for the project in one transaction
    Status save(const std::string& project, const RemoteSnapshot& snapshot);

    Status clear(const std::string& project);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aarc
