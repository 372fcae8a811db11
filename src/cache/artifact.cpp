#include <aarc/artifact.hpp>
#include <aarc/naming.hpp>

namespace fs = std::filesystem;

namespace aarc {

Artifact Artifact::local(fs::path file) {
    Artifact a;
    a.kind_ = Local;
    a.key_ = file.string();
    a.file_ = std::move(file);
    return a;
}

Artifact Artifact::remote(std::string key, std::string digest, fs::path local_copy) {
    Artifact a;
    a.kind_ = Remote;
    a.key_ = std::move(key);
    a.digest_ = std::move(digest);
    a.file_ = std::move(local_copy);
    return a;
}

std::string Artifact::describe() const {
    if (is_local()) return "local:" + key_;
    return "remote:" + key_ + "@" + digest_;
}

bool Artifact::operator==(const Artifact& o) const {
    return kind_ == o.kind_ && key_ == o.key_ && digest_ == o.digest_;
}

bool Artifact::operator<(const Artifact& o) const {
    if (kind_ != o.kind_) return kind_ < o.kind_;
    if (key_ != o.key_) return key_ < o.key_;
    return digest_ < o.digest_;
}

ExecRootResolver::ExecRootResolver(fs::path execution_root, fs::path download_dir)
    : execution_root_(std::move(execution_root)),
      download_dir_(std::move(download_dir)) {}

Artifact ExecRootResolver::resolve(const ArtifactLocation& location) const {
    if (location.is_remote()) {
        // Keep downloads apart even when two outputs share a file name
        std::string file = naming::generate_dir_name(
            fs::path(location.path).filename().string(),
            naming::string_hash(location.path));
        return Artifact::remote(location.path, location.remote_digest,
                                download_dir_ / file);
    }
    fs::path p(location.path);
    if (p.is_relative()) p = execution_root_ / p;
    return Artifact::local(p.lexically_normal());
}

} // namespace aarc
