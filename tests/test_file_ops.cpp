#include <catch2/catch.hpp>
#include <aarc/file_ops.hpp>
#include "test_support.hpp"

using namespace aarc;
using aarc_test::TempDir;

TEST_CASE("mkdirs creates nested directories", "[file_ops]") {
    TempDir tmp;
    LocalFileOperations ops;
    REQUIRE(ops.mkdirs(tmp / "a/b/c").is_ok());
    REQUIRE(ops.is_directory(tmp / "a/b/c"));
    // Idempotent
    REQUIRE(ops.mkdirs(tmp / "a/b/c").is_ok());
}

TEST_CASE("mkdirs below a regular file fails", "[file_ops]") {
    TempDir tmp;
    LocalFileOperations ops;
    aarc_test::write_file(tmp / "plain", "x");
    auto s = ops.mkdirs(tmp / "plain/sub");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == AarcError::IO);
}

TEST_CASE("list_files returns sorted immediate children", "[file_ops]") {
    TempDir tmp;
    LocalFileOperations ops;
    aarc_test::write_file(tmp / "b.txt", "");
    aarc_test::write_file(tmp / "a/deep.txt", "");
    auto r = ops.list_files(tmp.path());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 2);
    REQUIRE(r.value()[0].filename() == "a");
    REQUIRE(r.value()[1].filename() == "b.txt");

    REQUIRE(ops.list_files(tmp / "missing").is_err());
}

TEST_CASE("list_files_recursively returns regular files only", "[file_ops]") {
    TempDir tmp;
    LocalFileOperations ops;
    aarc_test::write_file(tmp / "x/y/z.txt", "z");
    aarc_test::write_file(tmp / "top.txt", "t");
    fs::create_directories(tmp / "empty");
    auto files = ops.list_files_recursively(tmp.path());
    REQUIRE(files.size() == 2);
    REQUIRE(ops.list_files_recursively(tmp / "missing").empty());
}

TEST_CASE("copy honours the overwrite flag", "[file_ops]") {
    TempDir tmp;
    LocalFileOperations ops;
    aarc_test::write_file(tmp / "src", "new");
    aarc_test::write_file(tmp / "dst", "old");

    REQUIRE(ops.copy(tmp / "src", tmp / "dst", false).is_err());
    REQUIRE(aarc_test::read_file(tmp / "dst") == "old");

    REQUIRE(ops.copy(tmp / "src", tmp / "dst", true).is_ok());
    REQUIRE(aarc_test::read_file(tmp / "dst") == "new");
}

TEST_CASE("delete_recursively removes trees and tolerates missing paths", "[file_ops]") {
    TempDir tmp;
    LocalFileOperations ops;
    aarc_test::write_file(tmp / "tree/a/b.txt", "b");
    REQUIRE(ops.delete_recursively(tmp / "tree").is_ok());
    REQUIRE_FALSE(ops.exists(tmp / "tree"));
    REQUIRE(ops.delete_recursively(tmp / "tree").is_ok());
}

TEST_CASE("modified time can be read back after setting it", "[file_ops]") {
    TempDir tmp;
    LocalFileOperations ops;
    REQUIRE(ops.create_file(tmp / "stamp").is_ok());
    auto t = ops.modified_time(tmp / "stamp").value() - std::chrono::hours(5);
    REQUIRE(ops.set_modified_time(tmp / "stamp", t).is_ok());
    REQUIRE(ops.modified_time(tmp / "stamp").value() == t);

    REQUIRE(ops.modified_time(tmp / "missing").is_err());
}

TEST_CASE("create_file keeps existing content", "[file_ops]") {
    TempDir tmp;
    LocalFileOperations ops;
    aarc_test::write_file(tmp / "f", "keep");
    REQUIRE(ops.create_file(tmp / "f").is_ok());
    REQUIRE(aarc_test::read_file(tmp / "f") == "keep");
}
