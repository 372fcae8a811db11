#include <catch2/catch.hpp>
#include <aarc/config.hpp>
#include "test_support.hpp"

using namespace aarc;

// ===== Parsing =====

TEST_CASE("parse config with project and cache sections", "[config]") {
    auto r = Config::parse(R"(
[project]
name = "app"
data-dir = "/data/app"
execution-root = "/work/execroot"

[cache]
root = "/data/app/aars"
workers = 6
state-db = "/data/app/state.db"

[log]
level = "debug"
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.project_name == "app");
    REQUIRE(cfg.execution_root == "/work/execroot");
    REQUIRE(cfg.effective_cache_root() == "/data/app/aars");
    REQUIRE(cfg.effective_state_db() == "/data/app/state.db");
    REQUIRE(cfg.workers == 6);
    REQUIRE(cfg.log_level == log::Debug);
}

TEST_CASE("paths default under the data dir", "[config]") {
    auto r = Config::parse(R"(
[project]
name = "app"
data-dir = "/data/app"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().effective_cache_root() == "/data/app/aar_libraries");
    REQUIRE(r.value().effective_state_db() == "/data/app/aarc_state.db");
    REQUIRE(r.value().download_dir() == "/data/app/downloads");
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().project_name == "default");
    REQUIRE(r.value().libraries.empty());
    REQUIRE(r.value().workers == 0);
}

TEST_CASE("parse library tables", "[config]") {
    auto r = Config::parse(R"(
[[library]]
key = "com.example.widgets"
aar = "out/widgets.aar"
jar = "out/widgets.jar"

[[library]]
key = "com.example.remote"
aar = "out/remote.aar"
aar-digest = "abc123"
)");
    REQUIRE(r.is_ok());
    const auto& libs = r.value().libraries;
    REQUIRE(libs.size() == 2);
    REQUIRE(libs[0].key == "com.example.widgets");
    REQUIRE(libs[0].aar.path == "out/widgets.aar");
    REQUIRE_FALSE(libs[0].aar.is_remote());
    REQUIRE(libs[0].jar.has_value());
    REQUIRE(libs[0].jar->path == "out/widgets.jar");
    REQUIRE(libs[1].aar.is_remote());
    REQUIRE(libs[1].aar.remote_digest == "abc123");
    REQUIRE_FALSE(libs[1].jar.has_value());
}

TEST_CASE("library without aar is a config error", "[config]") {
    auto r = Config::parse(R"(
[[library]]
key = "broken"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AarcError::Config);
    REQUIRE(r.error().message.find("broken") != std::string::npos);
}

TEST_CASE("unknown log level is a config error", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "loud"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AarcError::Config);
}

TEST_CASE("negative worker count is rejected", "[config]") {
    auto r = Config::parse(R"(
[cache]
workers = -2
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AarcError::Config);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AarcError::Parse);
}

// ===== Loading =====

TEST_CASE("load reads a config file", "[config]") {
    aarc_test::TempDir tmp;
    aarc_test::write_file(tmp / "aarc.toml", "[project]\nname = \"disk\"\n");
    auto r = Config::load((tmp / "aarc.toml").string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().project_name == "disk");
}

TEST_CASE("load reports the file on parse errors", "[config]") {
    aarc_test::TempDir tmp;
    aarc_test::write_file(tmp / "bad.toml", "[project\n");
    auto r = Config::load((tmp / "bad.toml").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AarcError::Parse);
    REQUIRE(r.error().file == (tmp / "bad.toml").string());
}

TEST_CASE("load missing file is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/aarc.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AarcError::IO);
}
