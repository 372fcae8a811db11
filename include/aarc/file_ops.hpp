#pragma once

#include <aarc/result.hpp>
#include <filesystem>
#include <vector>

namespace aarc {

// The only filesystem surface the cache engine touches. Implementations
// must be safe to call concurrently from worker threads.
class FileOperations {
public:
    virtual ~FileOperations() = default;

    virtual bool exists(const std::filesystem::path& p) const = 0;
    virtual bool is_directory(const std::filesystem::path& p) const = 0;

    // Create a directory and any missing parents; ok if it already exists
    virtual Status mkdirs(const std::filesystem::path& dir) = 0;

    // Immediate children of dir, sorted by name
    virtual Result<std::vector<std::filesystem::path>>
    list_files(const std::filesystem::path& dir) const = 0;

    // All regular files below dir, at any depth
    virtual std::vector<std::filesystem::path>
    list_files_recursively(const std::filesystem::path& dir) const = 0;

    virtual Status copy(const std::filesystem::path& from,
                        const std::filesystem::path& to,
                        bool overwrite) = 0;

    // Removing a path that does not exist is not an error
    virtual Status delete_recursively(const std::filesystem::path& p) = 0;

    // Create an empty file if it does not exist yet
    virtual Status create_file(const std::filesystem::path& p) = 0;

    virtual Result<std::filesystem::file_time_type>
    modified_time(const std::filesystem::path& p) const = 0;

    virtual Status set_modified_time(const std::filesystem::path& p,
                                     std::filesystem::file_time_type t) = 0;
};

// std::filesystem-backed implementation
class LocalFileOperations : public FileOperations {
public:
    bool exists(const std::filesystem::path& p) const override;
    bool is_directory(const std::filesystem::path& p) const override;
    Status mkdirs(const std::filesystem::path& dir) override;
    Result<std::vector<std::filesystem::path>>
    list_files(const std::filesystem::path& dir) const override;
    std::vector<std::filesystem::path>
    list_files_recursively(const std::filesystem::path& dir) const override;
    Status copy(const std::filesystem::path& from,
                const std::filesystem::path& to,
                bool overwrite) override;
    Status delete_recursively(const std::filesystem::path& p) override;
    Status create_file(const std::filesystem::path& p) override;
    Result<std::filesystem::file_time_type>
    modified_time(const std::filesystem::path& p) const override;
    Status set_modified_time(const std::filesystem::path& p,
                             std::filesystem::file_time_type t) override;
};

} // namespace aarc
