#include <catch2/catch.hpp>
#include <aarc/naming.hpp>

using namespace aarc;

TEST_CASE("string_hash matches the 31-multiplier polynomial", "[naming]") {
    REQUIRE(naming::string_hash("") == 0);
    REQUIRE(naming::string_hash("a") == 97);
    REQUIRE(naming::string_hash("ab") == 97 * 31 + 98);
    // Wraps like a 32-bit signed integer
    REQUIRE(naming::string_hash("hello world") == 1794106052);
    REQUIRE(naming::string_hash("libA") == 3321436);
}

TEST_CASE("generate_dir_name renders the hash as unsigned hex", "[naming]") {
    REQUIRE(naming::generate_dir_name("foo", 255) == "foo_ff");
    REQUIRE(naming::generate_dir_name("foo", 0) == "foo_0");
    REQUIRE(naming::generate_dir_name("neg", -1) == "neg_ffffffff");
}

TEST_CASE("aar_dir_name uses the basename of the key", "[naming]") {
    auto aar = Artifact::local("/out/bin/java/libA.aar");
    std::string key = "/out/bin/java/libA.aar";
    REQUIRE(naming::aar_dir_name(aar) ==
            naming::generate_dir_name("libA", naming::string_hash(key)) + ".aar");
}

TEST_CASE("aar_dir_name is deterministic for equal keys", "[naming]") {
    auto a = Artifact::remote("bazel-out/k8/libA.aar", "d1", "/tmp/x");
    auto b = Artifact::remote("bazel-out/k8/libA.aar", "d2", "/tmp/y");
    REQUIRE(naming::aar_dir_name(a) == naming::aar_dir_name(b));
}

TEST_CASE("same basename in different directories gives different names", "[naming]") {
    auto a = Artifact::local("/out/one/res.aar");
    auto b = Artifact::local("/out/two/res.aar");
    REQUIRE(naming::aar_dir_name(a) != naming::aar_dir_name(b));
    REQUIRE(naming::aar_dir_name(a).rfind("res_", 0) == 0);
}

TEST_CASE("merged_dir_name uses the whole library key", "[naming]") {
    REQUIRE(naming::merged_dir_name("pkg") == "pkg_1b1cc.mergedaar");
}

TEST_CASE("is_raw_entry distinguishes raw and merged entries", "[naming]") {
    REQUIRE(naming::is_raw_entry("libA_1f.aar"));
    REQUIRE_FALSE(naming::is_raw_entry("pkg_1f.mergedaar"));
    REQUIRE_FALSE(naming::is_raw_entry("aar"));
}

TEST_CASE("well-known locations beneath an entry", "[naming]") {
    std::filesystem::path dir = "/cache/libA_1f.aar";
    REQUIRE(naming::jar_file(dir) == "/cache/libA_1f.aar/jars/classes_and_libs_merged.jar");
    REQUIRE(naming::res_dir(dir) == "/cache/libA_1f.aar/res");
    REQUIRE(naming::stamp_file(dir) == "/cache/libA_1f.aar/aar.timestamp");
}
