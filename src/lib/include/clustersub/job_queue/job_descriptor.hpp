#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/* The workflow engine embeds a json document with the job properties in the
   generated job script, on a line starting with this prefix. */
#define JOB_PROPERTIES_PREFIX "# properties = "

#define JOB_PROPERTY_RULE "rule"
#define JOB_PROPERTY_INPUT "input"
#define JOB_PROPERTY_OUTPUT "output"
#define JOB_PROPERTY_JOBID "jobid"

/**
   Everything the adapter knows about one job; read once from the job script
   and the command line, and not modified afterwards.
*/
struct job_descriptor_type {
    std::string script_path;
    std::string rule;
    std::vector<std::string> input;
    std::vector<std::string> output;
    /** Empty means the job does not depend on anything. */
    std::vector<std::string> dependencies;
    /** The engine internal job number, when the metadata has one. */
    std::optional<long> jobid;

    bool has_dependencies() const { return !dependencies.empty(); }
};

job_descriptor_type
job_descriptor_load(const std::filesystem::path &script_path,
                    const std::vector<std::string> &dependencies);

job_descriptor_type
job_descriptor_parse(const std::string &script_path,
                     const std::string &script_content,
                     const std::vector<std::string> &dependencies);
