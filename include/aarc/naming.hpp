#pragma once

#include <aarc/artifact.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace aarc::naming {

inline constexpr char DOT_AAR[] = ".aar";
inline constexpr char DOT_MERGED_AAR[] = ".mergedaar";
inline constexpr char DOT_JAR[] = ".jar";
inline constexpr char STAMP_FILE_NAME[] = "aar.timestamp";
inline constexpr char MANIFEST_FILE_NAME[] = "AndroidManifest.xml";
inline constexpr char JARS_DIR[] = "jars";
inline constexpr char RES_DIR[] = "res";
inline constexpr char MERGED_JAR_NAME[] = "classes_and_libs_merged.jar";

// 32-bit polynomial string hash (h = 31*h + c), stable across runs
int32_t string_hash(const std::string& s);

// <name>_<unsigned lowercase hex of hash>
std::string generate_dir_name(const std::string& name, int32_t hash);

// Raw entry: <basename-without-extension(key)>_<hash(key)>.aar
std::string aar_dir_name(const Artifact& aar);

// Merged entry: <library_key>_<hash(library_key)>.mergedaar
std::string merged_dir_name(const std::string& library_key);

// True for names carrying the raw-entry suffix
bool is_raw_entry(const std::string& name);

std::filesystem::path jar_file(const std::filesystem::path& aar_dir);
std::filesystem::path res_dir(const std::filesystem::path& aar_dir);
std::filesystem::path stamp_file(const std::filesystem::path& aar_dir);

} // namespace aarc::naming
