#include <aarc/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace aarc {

static Result<ArtifactLocation> parse_location(const toml::table& tbl,
                                               const char* path_field,
                                               const char* digest_field,
                                               const std::string& library) {
    auto path = tbl[path_field].value<std::string>();
    if (!path || path->empty()) {
        return AarcError{AarcError::Config,
            "library '" + library + "' is missing '" + path_field + "'"};
    }
    ArtifactLocation loc;
    loc.path = *path;
    if (auto digest = tbl[digest_field].value<std::string>()) {
        loc.remote_digest = *digest;
    }
    return Result<ArtifactLocation>::ok(std::move(loc));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return AarcError{AarcError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [project] section
    if (auto project = doc["project"].as_table()) {
        if (auto v = (*project)["name"].value<std::string>()) cfg.project_name = *v;
        if (auto v = (*project)["data-dir"].value<std::string>()) cfg.data_dir = *v;
        if (auto v = (*project)["execution-root"].value<std::string>()) cfg.execution_root = *v;
    }
    if (cfg.project_name.empty()) {
        return AarcError{AarcError::Config, "project name must not be empty"};
    }

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["root"].value<std::string>()) cfg.cache_root = *v;
        if (auto v = (*cache)["state-db"].value<std::string>()) cfg.state_db = *v;
        if (auto v = (*cache)["workers"].value<int64_t>()) {
            if (*v < 0 || *v > 1024) {
                return AarcError{AarcError::Config,
                    "cache.workers out of range: " + std::to_string(*v),
                    "use 0 for one worker per hardware thread"};
            }
            cfg.workers = static_cast<unsigned int>(*v);
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return AarcError{AarcError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
        }
    }

    // [[library]] tables
    if (auto libs = doc["library"].as_array()) {
        for (const auto& node : *libs) {
            auto tbl = node.as_table();
            if (!tbl) {
                return AarcError{AarcError::Config, "[[library]] entries must be tables"};
            }
            AarLibrary lib;
            if (auto v = (*tbl)["key"].value<std::string>()) lib.key = *v;
            if (lib.key.empty()) {
                return AarcError{AarcError::Config, "library is missing 'key'"};
            }

            auto aar = parse_location(*tbl, "aar", "aar-digest", lib.key);
            if (aar.is_err()) return std::move(aar).error();
            lib.aar = std::move(aar).value();

            if (tbl->contains("jar")) {
                auto jar = parse_location(*tbl, "jar", "jar-digest", lib.key);
                if (jar.is_err()) return std::move(jar).error();
                lib.jar = std::move(jar).value();
            }
            cfg.libraries.push_back(std::move(lib));
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return AarcError{AarcError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

std::string Config::effective_data_dir() const {
    if (!data_dir.empty()) return data_dir;
    return default_data_dir(project_name);
}

std::string Config::effective_cache_root() const {
    if (!cache_root.empty()) return cache_root;
    return effective_data_dir() + "/aar_libraries";
}

std::string Config::effective_state_db() const {
    if (!state_db.empty()) return state_db;
    return effective_data_dir() + "/aarc_state.db";
}

std::string Config::download_dir() const {
    return effective_data_dir() + "/downloads";
}

std::string default_data_dir(const std::string& project_name) {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) home = "/tmp";
    return std::string(home) + "/.aarc/" + project_name;
}

} // namespace aarc
