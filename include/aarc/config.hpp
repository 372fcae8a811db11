#pragma once

#include <aarc/library.hpp>
#include <aarc/log.hpp>
#include <aarc/result.hpp>
#include <string>
#include <vector>

namespace aarc {

// Settings for one project's AAR cache, read from TOML:
//
//   [project]  name, data-dir, execution-root
//   [cache]    root, workers, state-db
//   [log]      level
//   [[library]] key, aar, jar, aar-digest, jar-digest
//
// Empty paths fall back to defaults derived from the project data dir.
struct Config {
    std::string project_name = "default";
    std::string data_dir;
    std::string execution_root;
    std::string cache_root;
    std::string state_db;
    unsigned int workers = 0;
    log::Level log_level = log::Info;
    std::vector<AarLibrary> libraries;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    std::string effective_data_dir() const;
    std::string effective_cache_root() const;
    std::string effective_state_db() const;
    std::string download_dir() const;
};

// ~/.aarc/<project>
std::string default_data_dir(const std::string& project_name);

} // namespace aarc
