#pragma once

#include <aarc/artifact.hpp>
#include <aarc/result.hpp>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace aarc {

// An AAR library as declared by the project: the archive, the optional jar
// built for it, and the key of the logical library it merges into.
struct AarLibrary {
    std::string key;
    ArtifactLocation aar;
    std::optional<ArtifactLocation> jar;
};

// Source of the libraries a project declares
class LibraryCollector {
public:
    virtual ~LibraryCollector() = default;
    virtual std::vector<AarLibrary> collect() const = 0;
};

// Collector over a fixed list, e.g. the [[library]] tables of a config file
class DeclaredLibraryCollector : public LibraryCollector {
public:
    explicit DeclaredLibraryCollector(std::vector<AarLibrary> libraries)
        : libraries_(std::move(libraries)) {}

    std::vector<AarLibrary> collect() const override { return libraries_; }
    void set_libraries(std::vector<AarLibrary> libraries) { libraries_ = std::move(libraries); }

private:
    std::vector<AarLibrary> libraries_;
};

// Transport that materialises remote artifacts at their local_copy() path.
// The returned future must be ready before any of them is read.
class ArtifactFetcher {
public:
    virtual ~ArtifactFetcher() = default;
    virtual std::future<Status> download(const std::string& project_name,
                                         const std::vector<Artifact>& remote) = 0;
};

// Fetcher for purely local projects: succeeds on an empty request and
// rejects anything remote.
class LocalOnlyFetcher : public ArtifactFetcher {
public:
    std::future<Status> download(const std::string& project_name,
                                 const std::vector<Artifact>& remote) override;
};

} // namespace aarc
