#include <aarc/naming.hpp>
#include <cstdio>

namespace fs = std::filesystem;

namespace aarc::naming {

static bool ends_with(const std::string& s, const char* suffix) {
    std::string suf(suffix);
    return s.size() >= suf.size() &&
           s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

// File name of the last path component with its final extension removed
static std::string name_without_extension(const std::string& key) {
    std::string file = key;
    auto slash = file.find_last_of("/\\");
    if (slash != std::string::npos) file = file.substr(slash + 1);
    auto dot = file.rfind('.');
    if (dot != std::string::npos) file = file.substr(0, dot);
    return file;
}

int32_t string_hash(const std::string& s) {
    uint32_t h = 0;
    for (unsigned char c : s) {
        h = 31 * h + c;
    }
    return static_cast<int32_t>(h);
}

std::string generate_dir_name(const std::string& name, int32_t hash) {
    char hex[9];
    std::snprintf(hex, sizeof(hex), "%x", static_cast<uint32_t>(hash));
    return name + "_" + hex;
}

std::string aar_dir_name(const Artifact& aar) {
    const std::string& key = aar.key();
    return generate_dir_name(name_without_extension(key), string_hash(key)) + DOT_AAR;
}

std::string merged_dir_name(const std::string& library_key) {
    return generate_dir_name(library_key, string_hash(library_key)) + DOT_MERGED_AAR;
}

bool is_raw_entry(const std::string& name) {
    return ends_with(name, DOT_AAR);
}

fs::path jar_file(const fs::path& aar_dir) {
    // The source jar name is not kept; the fixed name records that it
    // was merged from classes.jar and libs/*.jar.
    return aar_dir / JARS_DIR / MERGED_JAR_NAME;
}

fs::path res_dir(const fs::path& aar_dir) {
    return aar_dir / RES_DIR;
}

fs::path stamp_file(const fs::path& aar_dir) {
    return aar_dir / STAMP_FILE_NAME;
}

} // namespace aarc::naming
