#pragma once
#include <functional>
#include <string>

#include <clustersub/job_queue/job_descriptor.hpp>
#include <clustersub/job_queue/resource_config.hpp>
#include <clustersub/job_queue/spawn.hpp>
#include <clustersub/job_queue/submit_driver.hpp>

/* Exit status for jobs which could not be submitted, or whose job id could
   not be recovered from the submit output. */
#define SUBMIT_EXIT_FAILURE 2

using shell_runner_type = std::function<spawn_result(const std::string &)>;

/**
   Resolve the resources of the job, make sure the directory of the first
   output file exists and return the complete submit command. Nothing is
   submitted.
*/
std::string job_submit_prepare(const submit_driver_type &driver,
                               const job_descriptor_type &job,
                               const resource_config_type &config);

/**
   Prepare, run and parse: returns the job id assigned by the batch system.
   The command is echoed on stderr before it is run.
*/
long job_submit(const submit_driver_type &driver,
                const job_descriptor_type &job,
                const resource_config_type &config,
                const shell_runner_type &runner = spawn_shell_blocking);

/** The main() of the clustersub-<backend> executables. */
int job_submit_main(job_driver_type type, int argc, char **argv);
