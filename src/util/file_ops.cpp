#include <aarc/file_ops.hpp>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace aarc {

static AarcError io_error(const std::string& what, const fs::path& p,
                          const std::error_code& ec) {
    return AarcError{AarcError::IO, what + " " + p.string() + ": " + ec.message()};
}

bool LocalFileOperations::exists(const fs::path& p) const {
    std::error_code ec;
    return fs::exists(p, ec);
}

bool LocalFileOperations::is_directory(const fs::path& p) const {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

Status LocalFileOperations::mkdirs(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return io_error("cannot create directory", dir, ec);
    if (!fs::is_directory(dir, ec)) {
        return AarcError{AarcError::IO, "not a directory: " + dir.string()};
    }
    return ok_status();
}

Result<std::vector<fs::path>> LocalFileOperations::list_files(const fs::path& dir) const {
    std::error_code ec;
    std::vector<fs::path> out;
    fs::directory_iterator it(dir, ec);
    if (ec) return io_error("cannot list", dir, ec);
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return io_error("cannot list", dir, ec);
        out.push_back(it->path());
    }
    if (ec) return io_error("cannot list", dir, ec);
    std::sort(out.begin(), out.end());
    return Result<std::vector<fs::path>>::ok(std::move(out));
}

std::vector<fs::path> LocalFileOperations::list_files_recursively(const fs::path& dir) const {
    std::vector<fs::path> out;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) out.push_back(it->path());
    }
    return out;
}

Status LocalFileOperations::copy(const fs::path& from, const fs::path& to, bool overwrite) {
    std::error_code ec;
    auto opts = overwrite ? fs::copy_options::overwrite_existing
                          : fs::copy_options::none;
    fs::copy_file(from, to, opts, ec);
    if (ec) return io_error("cannot copy " + from.string() + " to", to, ec);
    return ok_status();
}

Status LocalFileOperations::delete_recursively(const fs::path& p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec) return io_error("cannot delete", p, ec);
    return ok_status();
}

Status LocalFileOperations::create_file(const fs::path& p) {
    if (exists(p)) return ok_status();
    std::ofstream out(p, std::ios::binary);
    if (!out) {
        return AarcError{AarcError::IO, "cannot create file: " + p.string()};
    }
    return ok_status();
}

Result<fs::file_time_type> LocalFileOperations::modified_time(const fs::path& p) const {
    std::error_code ec;
    auto t = fs::last_write_time(p, ec);
    if (ec) return io_error("cannot stat", p, ec);
    return Result<fs::file_time_type>::ok(t);
}

Status LocalFileOperations::set_modified_time(const fs::path& p, fs::file_time_type t) {
    std::error_code ec;
    fs::last_write_time(p, t, ec);
    if (ec) return io_error("cannot set modified time of", p, ec);
    return ok_status();
}

} // namespace aarc
