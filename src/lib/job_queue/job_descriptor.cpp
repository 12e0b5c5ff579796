#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/job_descriptor.hpp>
#include <clustersub/logging.hpp>
#include <clustersub/res_util/file_utils.hpp>

static auto logger = clustersub::get_logger("job_queue.job_descriptor");

namespace {
nlohmann::json find_properties(const std::string &script_path,
                               const std::string &script_content) {
    const std::string prefix = JOB_PROPERTIES_PREFIX;
    std::istringstream stream(script_content);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.compare(0, prefix.size(), prefix) != 0)
            continue;

        try {
            return nlohmann::json::parse(line.substr(prefix.size()));
        } catch (const nlohmann::json::parse_error &err) {
            throw exc::metadata_error("Malformed job properties in {}: {}",
                                      script_path, err.what());
        }
    }
    throw exc::metadata_error("No job properties found in {}", script_path);
}

std::vector<std::string> string_list(const std::string &script_path,
                                     const nlohmann::json &properties,
                                     const char *key) {
    auto iter = properties.find(key);
    if (iter == properties.end())
        throw exc::metadata_error("Job properties in {} have no '{}'",
                                  script_path, key);

    if (!iter->is_array())
        throw exc::metadata_error("Job property '{}' in {} is not a list",
                                  key, script_path);

    std::vector<std::string> files;
    for (const auto &item : *iter) {
        if (!item.is_string())
            throw exc::metadata_error(
                "Job property '{}' in {} contains a non-string entry: {}", key,
                script_path, item.dump());
        files.push_back(item.get<std::string>());
    }
    return files;
}
} // namespace

/**
   The workflow engine writes the properties of the job as a json document
   on a single line of the job script:

     # properties = {"rule": "align", "input": [...], "output": [...], ...}

   Only the first such line is used. Everything else in the script is
   ignored.
*/
job_descriptor_type
job_descriptor_parse(const std::string &script_path,
                     const std::string &script_content,
                     const std::vector<std::string> &dependencies) {
    auto properties = find_properties(script_path, script_content);
    if (!properties.is_object())
        throw exc::metadata_error("Job properties in {} are not an object",
                                  script_path);

    job_descriptor_type job;
    job.script_path = script_path;

    auto rule = properties.find(JOB_PROPERTY_RULE);
    if (rule == properties.end() || !rule->is_string())
        throw exc::metadata_error("Job properties in {} have no rule name",
                                  script_path);
    job.rule = rule->get<std::string>();

    job.input = string_list(script_path, properties, JOB_PROPERTY_INPUT);
    job.output = string_list(script_path, properties, JOB_PROPERTY_OUTPUT);

    auto jobid = properties.find(JOB_PROPERTY_JOBID);
    if (jobid != properties.end() && jobid->is_number_integer())
        job.jobid = jobid->get<long>();

    for (const auto &dependency : dependencies) {
        if (dependency.find_first_not_of(" \t\n") == std::string::npos)
            continue;
        job.dependencies.push_back(dependency);
    }

    logger->debug("Job {} rule:{} inputs:{} outputs:{} dependencies:{}",
                  script_path, job.rule, job.input.size(), job.output.size(),
                  job.dependencies.size());
    return job;
}

job_descriptor_type
job_descriptor_load(const std::filesystem::path &script_path,
                    const std::vector<std::string> &dependencies) {
    std::string content;
    try {
        content = read_file(script_path);
    } catch (const std::runtime_error &err) {
        throw exc::metadata_error("Unable to read job script {}: {}",
                                  script_path.string(), err.what());
    }
    return job_descriptor_parse(script_path.string(), content, dependencies);
}
