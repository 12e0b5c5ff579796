#pragma once
#include <optional>
#include <string>
#include <vector>

#include <clustersub/job_queue/job_descriptor.hpp>
#include <clustersub/job_queue/resource_config.hpp>

#define QSUB_DRIVER_NAME "qsub"
#define QSUB_LOG_SUFFIX "qsub"
#define QSUB_DEFAULT_SUBMIT_CMD "qsub"
#define QSUB_DEFAULT_CONFIG_FILE "config_qsub.json"
#define QSUB_PARALLEL_ENVIRONMENT "smp"

/** The job id is the third word of "Your job 12345 ("name") has been submitted" */
#define QSUB_JOB_ID_TOKEN 2

std::string qsub_driver_encode_dependencies(
    const std::vector<std::string> &dependencies);
std::string qsub_driver_build_command(const job_descriptor_type &job,
                                      const resource_record &record,
                                      const general_settings &general);
std::optional<long> qsub_driver_parse_job_id(const std::string &qsub_output);
