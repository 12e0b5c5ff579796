#pragma once
#include <optional>
#include <string>
#include <vector>

#include <clustersub/job_queue/job_descriptor.hpp>
#include <clustersub/job_queue/resource_config.hpp>

#define SBATCH_DRIVER_NAME "sbatch"
#define SBATCH_LOG_SUFFIX "slurm"
#define SBATCH_DEFAULT_SUBMIT_CMD "sbatch"
#define SBATCH_DEFAULT_CONFIG_FILE "config_sbatch.json"

/* Each dependency gets its own afterok: - the job is released when all of
   them have completed successfully. */
#define SBATCH_DEPENDENCY_TYPE "afterok"

std::string sbatch_driver_encode_dependencies(
    const std::vector<std::string> &dependencies);
std::string sbatch_driver_build_command(const job_descriptor_type &job,
                                        const resource_record &record,
                                        const general_settings &general);
std::optional<long> sbatch_driver_parse_job_id(const std::string &sbatch_output);
