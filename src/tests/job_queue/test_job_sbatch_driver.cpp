#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/sbatch_driver.hpp>
#include <clustersub/job_queue/submit_driver.hpp>

namespace {
job_descriptor_type make_job(std::vector<std::string> output,
                             std::vector<std::string> dependencies = {}) {
    job_descriptor_type job;
    job.script_path = "/proj/.snakemake/tmp.y/snakejob.haplotype_caller.9.sh";
    job.rule = "haplotype_caller";
    job.output = std::move(output);
    job.dependencies = std::move(dependencies);
    return job;
}

resource_record make_record() {
    resource_record record;
    record.key = "schedule_haplotype_caller";
    record.partition = "core";
    record.cores = 16;
    record.days = 1;
    record.hours = 12;
    record.minutes = 30;
    return record;
}

general_settings make_general() {
    general_settings general;
    general.wrapper_script = "/opt/cluster/sbatch_wrapper.sh";
    general.account = "b2016001";
    return general;
}
} // namespace

TEST_CASE("job_sbatch_encode_no_dependencies", "[job_sbatch]") {
    REQUIRE(sbatch_driver_encode_dependencies({}) == "");
}

TEST_CASE("job_sbatch_encode_dependencies", "[job_sbatch]") {
    REQUIRE(sbatch_driver_encode_dependencies({"5"}) == "-d afterok:5");
    REQUIRE(sbatch_driver_encode_dependencies({"5", "7"}) ==
            "-d afterok:5,afterok:7");
}

TEST_CASE("job_sbatch_build_command", "[job_sbatch]") {
    auto cmd = sbatch_driver_build_command(
        make_job({"calls/sample1.vcf"}, {"5", "7"}), make_record(),
        make_general());
    REQUIRE(cmd == "sbatch --output=calls/sample1.vcf-slurm.out "
                   "-d afterok:5,afterok:7 -A b2016001 -p core -n 16 "
                   "-t 1-12:30:00 -J snakemake_haplotype_caller "
                   "/opt/cluster/sbatch_wrapper.sh "
                   "'/proj/.snakemake/tmp.y/snakejob.haplotype_caller.9.sh'");
}

TEST_CASE("job_sbatch_build_command_without_output", "[job_sbatch]") {
    auto record = make_record();
    record.extra_parameters = "--mem=64G";
    auto cmd = sbatch_driver_build_command(make_job({}), record, make_general());
    REQUIRE(cmd == "sbatch --output=snakemake-haplotype_caller-slurm.out "
                   "-A b2016001 -p core -n 16 -t 1-12:30:00 "
                   "-J snakemake_haplotype_caller --mem=64G "
                   "/opt/cluster/sbatch_wrapper.sh "
                   "'/proj/.snakemake/tmp.y/snakejob.haplotype_caller.9.sh'");
}

TEST_CASE("job_sbatch_build_command_missing_resources", "[job_sbatch]") {
    auto record = make_record();
    record.minutes.reset();
    REQUIRE_THROWS_WITH(
        sbatch_driver_build_command(make_job({}), record, make_general()),
        "schedule_haplotype_caller: missing required field 'minutes'");

    auto general = make_general();
    general.account.reset();
    REQUIRE_THROWS_AS(
        sbatch_driver_build_command(make_job({}), make_record(), general),
        exc::config_error);
}

TEST_CASE("job_sbatch_parse_job_id", "[job_sbatch]") {
    REQUIRE(sbatch_driver_parse_job_id("Submitted batch job 98765") == 98765L);
    REQUIRE(sbatch_driver_parse_job_id(
                "sbatch: Warning: can't honor --ntasks-per-node\n"
                "Submitted batch job 98765\n") == 98765L);
}

TEST_CASE("job_sbatch_parse_job_id_failure", "[job_sbatch]") {
    REQUIRE_FALSE(sbatch_driver_parse_job_id("").has_value());
    REQUIRE_FALSE(sbatch_driver_parse_job_id(
                      "sbatch: error: Batch job submission failed: Invalid "
                      "account or account/partition combination specified")
                      .has_value());
}

TEST_CASE("job_sbatch_driver_table", "[job_sbatch]") {
    const auto &driver = submit_driver_get(SBATCH_DRIVER);
    REQUIRE(driver.type == SBATCH_DRIVER);
    REQUIRE(std::string(driver.name) == "sbatch");
    REQUIRE(std::string(driver.log_suffix) == "slurm");
    REQUIRE((driver.build_command == sbatch_driver_build_command));
    REQUIRE_THROWS_AS(submit_driver_get(NULL_DRIVER), std::invalid_argument);
}

TEST_CASE("job_sbatch_driver_table_builds_with_dependencies", "[job_sbatch]") {
    const auto &driver = submit_driver_get(SBATCH_DRIVER);
    auto job = make_job({}, {"41"});
    auto after = driver.encode_dependencies(job.dependencies);
    REQUIRE(after == "-d afterok:41");

    auto cmd = driver.build_command(job, make_record(), make_general());
    REQUIRE_THAT(cmd,
                 Catch::StartsWith(
                     "sbatch --output=snakemake-haplotype_caller-slurm.out " +
                     after + " -A b2016001"));
}
