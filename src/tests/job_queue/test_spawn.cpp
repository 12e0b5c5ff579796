#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/spawn.hpp>

#include "../tmpdir.hpp"

TEST_CASE("spawn_blocking_captures_stdout", "[spawn]") {
    auto result = spawn_blocking(std::vector<std::string>{"echo", "hello"});
    REQUIRE(result.exited_ok());
    REQUIRE(result.output == "hello\n");
}

TEST_CASE("spawn_shell_blocking_merges_stderr", "[spawn]") {
    auto result = spawn_shell_blocking("echo out; echo err >&2");
    REQUIRE(result.exited_ok());
    REQUIRE(result.output == "out\nerr\n");
}

TEST_CASE("spawn_shell_blocking_reports_exit_status", "[spawn]") {
    auto result = spawn_shell_blocking("echo failed; exit 3");
    REQUIRE_FALSE(result.exited_ok());
    REQUIRE(WIFEXITED(result.status));
    REQUIRE(WEXITSTATUS(result.status) == 3);
    REQUIRE(result.output == "failed\n");
}

TEST_CASE("spawn_blocking_runs_script_by_path", "[spawn]") {
    TmpDir tmpdir;
    auto script = tmpdir.write_script("mock.sh", "#!/bin/sh\necho \"$@\"\n");
    auto result =
        spawn_blocking(std::vector<std::string>{script.string(), "a", "b c"});
    REQUIRE(result.exited_ok());
    REQUIRE(result.output == "a b c\n");
}

TEST_CASE("spawn_blocking_large_output", "[spawn]") {
    auto result = spawn_shell_blocking("i=0; while [ $i -lt 2000 ]; do echo "
                                       "0123456789; i=$((i+1)); done");
    REQUIRE(result.exited_ok());
    REQUIRE(result.output.size() == 2000 * 11);
}

TEST_CASE("spawn_blocking_missing_executable", "[spawn]") {
    REQUIRE_THROWS_AS(spawn_blocking(std::vector<std::string>{
                          "/no/such/clustersub-executable"}),
                      exc::runtime_error);
}
