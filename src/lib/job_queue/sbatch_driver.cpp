#include <string>
#include <vector>

#include <fmt/format.h>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/sbatch_driver.hpp>
#include <clustersub/job_queue/string_utils.hpp>
#include <clustersub/job_queue/submit_driver.hpp>
#include <clustersub/logging.hpp>

static auto logger = clustersub::get_logger("job_queue.sbatch_driver");

/**
   Slurm wants the dependency type in front of every job id:

     -d afterok:5,afterok:7

   With afterok the job is only released when every listed job has
   completed successfully. If one of them fails the job stays pending, what
   happens then is up to the slurm configuration.
*/
std::string sbatch_driver_encode_dependencies(
    const std::vector<std::string> &dependencies) {
    if (dependencies.empty())
        return "";

    std::vector<std::string> items;
    for (const auto &dependency : dependencies)
        items.push_back(fmt::format("{}:{}", SBATCH_DEPENDENCY_TYPE, dependency));
    return "-d " + join_nonempty(items, ",");
}

/*
  Slurm sends stderr to the --output file when no --error is given, so
  only the log file is passed.
*/
std::string sbatch_driver_build_command(const job_descriptor_type &job,
                                        const resource_record &record,
                                        const general_settings &general) {
    const auto &driver = submit_driver_get(SBATCH_DRIVER);
    if (!general.wrapper_script.has_value())
        throw exc::config_error("{}{}: missing required field '{}'",
                                SBATCH_DRIVER_NAME, GENERAL_KEY_SUFFIX,
                                GENERAL_WRAPPER_SCRIPT_KEY);
    if (!general.account.has_value())
        throw exc::config_error("{}{}: missing required field '{}'",
                                SBATCH_DRIVER_NAME, GENERAL_KEY_SUFFIX,
                                GENERAL_ACCOUNT_KEY);

    const auto &partition = resource_record_require(record, record.partition,
                                                    RESOURCE_PARTITION_KEY);
    int cores =
        resource_record_require(record, record.cores, RESOURCE_CORES_KEY);
    int days = resource_record_require(record, record.days, RESOURCE_DAYS_KEY);
    int hours =
        resource_record_require(record, record.hours, RESOURCE_HOURS_KEY);
    int minutes =
        resource_record_require(record, record.minutes, RESOURCE_MINUTES_KEY);

    std::vector<std::string> argv = {
        submit_driver_submit_cmd(driver, general),
        "--output=" + submit_driver_log_file(driver, job),
        driver.encode_dependencies(job.dependencies),
        "-A " + *general.account,
        "-p " + partition,
        fmt::format("-n {}", cores),
        fmt::format("-t {}-{}:{}:00", days, hours, minutes),
        "-J " + submit_driver_job_name(job),
        record.extra_parameters,
        *general.wrapper_script,
        shell_quote(job.script_path)};

    return join_nonempty(argv, " ");
}

/* sbatch reports "Submitted batch job 98765"; the job id is the last word. */
std::optional<long>
sbatch_driver_parse_job_id(const std::string &sbatch_output) {
    auto tokens = split_whitespace(sbatch_output);
    if (tokens.empty()) {
        logger->debug("sbatch output is empty");
        return std::nullopt;
    }

    long job_id;
    if (!sscanf_long(tokens.back().c_str(), &job_id)) {
        logger->debug("sbatch output word '{}' is not a job id", tokens.back());
        return std::nullopt;
    }
    return job_id;
}
