#pragma once
#include <optional>
#include <string>
#include <vector>

#include <clustersub/job_queue/job_descriptor.hpp>
#include <clustersub/job_queue/resource_config.hpp>

typedef enum { NULL_DRIVER = 0, QSUB_DRIVER = 1, SBATCH_DRIVER = 2 } job_driver_type;

using encode_dependencies_ftype = std::string(const std::vector<std::string> &);
using build_command_ftype = std::string(const job_descriptor_type &,
                                        const resource_record &,
                                        const general_settings &);
using parse_job_id_ftype = std::optional<long>(const std::string &);

/**
   The submit driver is the fixed set of functions which differ between the
   supported batch systems. There is one constant instance per batch system,
   selected once when the adapter starts; the rest of the adapter only talks
   to the batch system through these function pointers.
*/
struct submit_driver_type {
    job_driver_type type = NULL_DRIVER;
    /** Name of the <name>_general configuration section. */
    const char *name = nullptr;
    /** Suffix of the default log files, e.g. out/file-slurm.out */
    const char *log_suffix = nullptr;
    const char *default_submit_cmd = nullptr;
    const char *default_config_file = nullptr;

    encode_dependencies_ftype *encode_dependencies = nullptr;
    build_command_ftype *build_command = nullptr;
    parse_job_id_ftype *parse_job_id = nullptr;
};

const submit_driver_type &submit_driver_get(job_driver_type type);

long submit_driver_parse_job_id(const submit_driver_type &driver,
                                const std::string &submit_output);

/* The log files used for the job stdout and stderr. */
std::string submit_driver_log_file(const submit_driver_type &driver,
                                   const job_descriptor_type &job);
std::string submit_driver_err_file(const submit_driver_type &driver,
                                   const job_descriptor_type &job);
std::string submit_driver_job_name(const job_descriptor_type &job);
std::string submit_driver_submit_cmd(const submit_driver_type &driver,
                                     const general_settings &general);
