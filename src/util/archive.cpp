#include <aarc/archive.hpp>
#include <aarc/log.hpp>

#include <archive.h>
#include <archive_entry.h>

namespace fs = std::filesystem;

namespace aarc {

namespace {

constexpr size_t kReadBlockSize = 16384;

// Owns an archive_read handle
class ArchiveReader {
public:
    ArchiveReader() : archive_(archive_read_new()) {
        archive_read_support_filter_all(archive_);
        archive_read_support_format_all(archive_);
    }
    ~ArchiveReader() {
        if (archive_) archive_read_free(archive_);
    }
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    struct archive* get() { return archive_; }

    std::string error_string() {
        const char* msg = archive_error_string(archive_);
        return msg ? msg : "unknown libarchive error";
    }

private:
    struct archive* archive_;
};

bool escapes_root(const std::string& entry_name) {
    fs::path p(entry_name);
    if (p.is_absolute()) return true;
    for (const auto& part : p) {
        if (part == "..") return true;
    }
    return false;
}

} // namespace

Result<ExtractStats> extract_archive(FileOperations& ops,
                                     const fs::path& archive_path,
                                     const fs::path& dest_dir,
                                     const EntryFilter& filter) {
    ArchiveReader reader;
    struct archive* a = reader.get();
    if (!a) {
        return AarcError{AarcError::Archive, "cannot allocate archive reader"};
    }

    if (archive_read_open_filename(a, archive_path.c_str(), kReadBlockSize) != ARCHIVE_OK) {
        return AarcError{AarcError::Archive,
            "cannot open archive " + archive_path.string() + ": " + reader.error_string()};
    }

    const int flags = ARCHIVE_EXTRACT_TIME |
                      ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                      ARCHIVE_EXTRACT_SECURE_NODOTDOT;

    ExtractStats stats;
    for (;;) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            return AarcError{AarcError::Archive,
                "corrupt archive " + archive_path.string() + ": " + reader.error_string()};
        }
        if (r == ARCHIVE_WARN) {
            log::warn("%s: %s", archive_path.c_str(), reader.error_string().c_str());
        }

        const char* raw_name = archive_entry_pathname(entry);
        if (!raw_name) {
            return AarcError{AarcError::Archive,
                "cannot read member name in " + archive_path.string()};
        }
        std::string name(raw_name);

        if (escapes_root(name)) {
            return AarcError{AarcError::Archive,
                "refusing member outside destination: " + name,
                "archive " + archive_path.string() + " may be malicious"};
        }

        if (filter && !filter(name)) {
            archive_read_data_skip(a);
            stats.skipped++;
            continue;
        }

        fs::path target = dest_dir / name;
        if (archive_entry_filetype(entry) == AE_IFDIR) {
            AARC_TRY(ops.mkdirs(target));
            archive_read_data_skip(a);
            continue;
        }
        AARC_TRY(ops.mkdirs(target.parent_path()));

        archive_entry_copy_pathname(entry, target.c_str());
        if (const char* link = archive_entry_hardlink(entry)) {
            archive_entry_copy_hardlink(entry, (dest_dir / link).c_str());
        }

        r = archive_read_extract(a, entry, flags);
        if (r < ARCHIVE_WARN) {
            return AarcError{AarcError::Archive,
                "cannot extract " + name + " from " + archive_path.string()
                + ": " + reader.error_string()};
        }
        stats.extracted++;
    }

    if (archive_read_close(a) != ARCHIVE_OK) {
        return AarcError{AarcError::Archive,
            "cannot close archive " + archive_path.string() + ": " + reader.error_string()};
    }
    return Result<ExtractStats>::ok(stats);
}

} // namespace aarc
