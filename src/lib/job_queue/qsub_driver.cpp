#include <string>
#include <vector>

#include <fmt/format.h>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/qsub_driver.hpp>
#include <clustersub/job_queue/string_utils.hpp>
#include <clustersub/job_queue/submit_driver.hpp>
#include <clustersub/logging.hpp>

static auto logger = clustersub::get_logger("job_queue.qsub_driver");

/**
   Grid engine takes all the dependencies as one comma separated list:

     -hold_jid 5,7

   The job is held until all of them have finished.
*/
std::string qsub_driver_encode_dependencies(
    const std::vector<std::string> &dependencies) {
    if (dependencies.empty())
        return "";

    return "-hold_jid " + join_nonempty(dependencies, ",");
}

std::string qsub_driver_build_command(const job_descriptor_type &job,
                                      const resource_record &record,
                                      const general_settings &general) {
    const auto &driver = submit_driver_get(QSUB_DRIVER);
    if (!general.wrapper_script.has_value())
        throw exc::config_error("{}{}: missing required field '{}'",
                                QSUB_DRIVER_NAME, GENERAL_KEY_SUFFIX,
                                GENERAL_WRAPPER_SCRIPT_KEY);

    const auto &queue =
        resource_record_require(record, record.queue, RESOURCE_QUEUE_KEY);
    int threads =
        resource_record_require(record, record.threads, RESOURCE_THREADS_KEY);

    std::vector<std::string> argv = {
        submit_driver_submit_cmd(driver, general),
        "-o " + submit_driver_log_file(driver, job),
        "-e " + submit_driver_err_file(driver, job),
        driver.encode_dependencies(job.dependencies),
        "-q " + queue,
        fmt::format("-pe {} {}", QSUB_PARALLEL_ENVIRONMENT, threads),
        "-N " + submit_driver_job_name(job),
        record.extra_parameters,
        *general.wrapper_script,
        shell_quote(job.script_path)};

    return join_nonempty(argv, " ");
}

std::optional<long> qsub_driver_parse_job_id(const std::string &qsub_output) {
    auto tokens = split_whitespace(qsub_output);
    if (tokens.size() <= QSUB_JOB_ID_TOKEN) {
        logger->debug("qsub output has only {} words", tokens.size());
        return std::nullopt;
    }

    long job_id;
    if (!sscanf_long(tokens[QSUB_JOB_ID_TOKEN].c_str(), &job_id)) {
        logger->debug("qsub output word '{}' is not a job id",
                      tokens[QSUB_JOB_ID_TOKEN]);
        return std::nullopt;
    }
    return job_id;
}
