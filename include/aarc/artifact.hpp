#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace aarc {

// Handle to archive or jar content. Local artifacts are read straight from
// their file; remote artifacts are identified by an output key and can only
// be read from local_copy() once the fetch collaborator has materialised it.
class Artifact {
public:
    enum Kind { Local, Remote };

    static Artifact local(std::filesystem::path file);
    static Artifact remote(std::string key, std::string digest,
                           std::filesystem::path local_copy);

    Kind kind() const { return kind_; }
    bool is_local() const { return kind_ == Local; }
    bool is_remote() const { return kind_ == Remote; }

    // Identity key: file path for local artifacts, output key for remote ones
    const std::string& key() const { return key_; }

    // Readable location of the content (the fetched copy for remote artifacts)
    const std::filesystem::path& file() const { return file_; }

    // Content signature of a remote artifact; empty for local artifacts
    const std::string& digest() const { return digest_; }

    std::string describe() const;

    bool operator==(const Artifact& o) const;
    bool operator!=(const Artifact& o) const { return !(*this == o); }
    bool operator<(const Artifact& o) const;

private:
    Artifact() = default;

    Kind kind_ = Local;
    std::string key_;
    std::string digest_;
    std::filesystem::path file_;
};

// One declared AAR plus the externally built jar that replaces the jars
// inside it, grouped under the library key it merges into.
struct AarAndJar {
    Artifact aar;
    std::optional<Artifact> jar;
    std::string library_key;
};

// Declared work items keyed by raw cache entry name
using WorkItems = std::map<std::string, AarAndJar>;

// Reference to an artifact as the library collector reports it
struct ArtifactLocation {
    std::string path;
    std::string remote_digest;  // non-empty marks a remote output

    bool is_remote() const { return !remote_digest.empty(); }
};

// Maps artifact references onto concrete artifacts
class ArtifactResolver {
public:
    virtual ~ArtifactResolver() = default;
    virtual Artifact resolve(const ArtifactLocation& location) const = 0;
};

// Local paths are resolved against an execution root; remote outputs are
// assigned a download location under download_dir keyed by their output key.
class ExecRootResolver : public ArtifactResolver {
public:
    ExecRootResolver(std::filesystem::path execution_root,
                     std::filesystem::path download_dir);

    Artifact resolve(const ArtifactLocation& location) const override;

private:
    std::filesystem::path execution_root_;
    std::filesystem::path download_dir_;
};

} // namespace aarc
