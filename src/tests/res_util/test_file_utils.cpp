#include <filesystem>

#include <catch2/catch.hpp>

#include <clustersub/res_util/file_utils.hpp>

#include "../tmpdir.hpp"

TEST_CASE("make_path creates missing parents", "[res_util]") {
    WITH_TMPDIR;
    make_path("a/b/c");
    REQUIRE(fs::is_directory("a/b/c"));
}

TEST_CASE("make_path accepts an existing directory", "[res_util]") {
    WITH_TMPDIR;
    fs::create_directories("results/sample");
    REQUIRE_NOTHROW(make_path("results/sample"));
    REQUIRE_NOTHROW(make_path("results/sample"));
    REQUIRE(fs::is_directory("results/sample"));
}

TEST_CASE("make_path fails when a file is in the way", "[res_util]") {
    TmpDir tmpdir;
    tmpdir.write_file("results", "not a directory");
    REQUIRE_THROWS_AS(make_path("results/sample"), fs::filesystem_error);
}

TEST_CASE("parent_directory is absolute", "[res_util]") {
    WITH_TMPDIR;
    auto cwd = fs::current_path();
    auto dir = parent_directory("out/sample/file.bam");
    REQUIRE(dir.is_absolute());
    REQUIRE(dir.string() == (cwd / "out" / "sample").string());
    REQUIRE(parent_directory("file.bam").string() == cwd.string());
    REQUIRE(parent_directory("out/../file.bam").string() == cwd.string());
}

TEST_CASE("parent_directory of a directory with trailing slash", "[res_util]") {
    WITH_TMPDIR;
    auto cwd = fs::current_path();
    REQUIRE(parent_directory("mapped/").string() == cwd.string());
    REQUIRE(parent_directory("out/mapped//").string() ==
            (cwd / "out").string());
    REQUIRE(parent_directory("out/mapped").string() == (cwd / "out").string());
}

TEST_CASE("read_file returns the whole file", "[res_util]") {
    TmpDir tmpdir;
    tmpdir.write_file("script.sh", "#!/bin/sh\necho hello\n");
    REQUIRE(read_file("script.sh") == "#!/bin/sh\necho hello\n");
    REQUIRE_THROWS_AS(read_file("missing.sh"), std::runtime_error);
}
