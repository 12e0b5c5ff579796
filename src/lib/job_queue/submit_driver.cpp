#include <string>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/qsub_driver.hpp>
#include <clustersub/job_queue/sbatch_driver.hpp>
#include <clustersub/job_queue/submit_driver.hpp>
#include <clustersub/logging.hpp>

static auto logger = clustersub::get_logger("job_queue.submit_driver");

/*
   This file implements the datatype submit_driver_type, which collects the
   functions that differ between the batch systems: how dependencies are
   written, how the submit command is put together and where the job id is
   found in the output of the submit command.

   The two drivers are constant tables of function pointers, selected with
   submit_driver_get() when the adapter starts. Everything the driver needs
   - the job, the resources and the general settings - is passed as
   arguments, the drivers hold no state.
*/

namespace {
submit_driver_type make_qsub_driver() {
    submit_driver_type driver;
    driver.type = QSUB_DRIVER;
    driver.name = QSUB_DRIVER_NAME;
    driver.log_suffix = QSUB_LOG_SUFFIX;
    driver.default_submit_cmd = QSUB_DEFAULT_SUBMIT_CMD;
    driver.default_config_file = QSUB_DEFAULT_CONFIG_FILE;
    driver.encode_dependencies = qsub_driver_encode_dependencies;
    driver.build_command = qsub_driver_build_command;
    driver.parse_job_id = qsub_driver_parse_job_id;
    return driver;
}

submit_driver_type make_sbatch_driver() {
    submit_driver_type driver;
    driver.type = SBATCH_DRIVER;
    driver.name = SBATCH_DRIVER_NAME;
    driver.log_suffix = SBATCH_LOG_SUFFIX;
    driver.default_submit_cmd = SBATCH_DEFAULT_SUBMIT_CMD;
    driver.default_config_file = SBATCH_DEFAULT_CONFIG_FILE;
    driver.encode_dependencies = sbatch_driver_encode_dependencies;
    driver.build_command = sbatch_driver_build_command;
    driver.parse_job_id = sbatch_driver_parse_job_id;
    return driver;
}
} // namespace

const submit_driver_type &submit_driver_get(job_driver_type type) {
    static const submit_driver_type qsub_driver = make_qsub_driver();
    static const submit_driver_type sbatch_driver = make_sbatch_driver();

    switch (type) {
    case QSUB_DRIVER:
        return qsub_driver;
    case SBATCH_DRIVER:
        return sbatch_driver;
    default:
        throw exc::invalid_argument("{}: unrecognized driver type:{}",
                                    __func__, static_cast<int>(type));
    }
}

long submit_driver_parse_job_id(const submit_driver_type &driver,
                                const std::string &submit_output) {
    auto job_id = driver.parse_job_id(submit_output);
    if (!job_id.has_value())
        throw exc::unparseable_job_id("Not a submitted job: {}", submit_output);

    logger->debug("{} job id: {}", driver.name, *job_id);
    return *job_id;
}

/*
  The job output goes next to the first output file of the job, or in the
  current directory when the job has no output files.
*/
std::string submit_driver_log_file(const submit_driver_type &driver,
                                   const job_descriptor_type &job) {
    if (!job.output.empty())
        return fmt::format("{}-{}.out", job.output.front(), driver.log_suffix);
    return fmt::format("snakemake-{}-{}.out", job.rule, driver.log_suffix);
}

std::string submit_driver_err_file(const submit_driver_type &driver,
                                   const job_descriptor_type &job) {
    if (!job.output.empty())
        return fmt::format("{}-{}.err", job.output.front(), driver.log_suffix);
    return fmt::format("snakemake-{}-{}.err", job.rule, driver.log_suffix);
}

std::string submit_driver_job_name(const job_descriptor_type &job) {
    return "snakemake_" + job.rule;
}

std::string submit_driver_submit_cmd(const submit_driver_type &driver,
                                     const general_settings &general) {
    return general.submit_cmd.value_or(driver.default_submit_cmd);
}
