#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/job_submit.hpp>
#include <clustersub/logging.hpp>
#include <clustersub/res_util/file_utils.hpp>

static auto logger = clustersub::get_logger("job_queue.job_submit");

#define CONFIG_FILE_ENV "CLUSTERSUB_CONFIG"

std::string job_submit_prepare(const submit_driver_type &driver,
                               const job_descriptor_type &job,
                               const resource_config_type &config) {
    // Resolve first: an unknown rule must fail before anything is created
    const auto &record = resource_config_resolve(config, job.rule);
    const auto &general = resource_config_get_general(config, driver.name);

    // The batch system writes the job log next to the first output file
    if (!job.output.empty()) {
        auto output_dir = parent_directory(job.output.front());
        logger->debug("Creating output directory {}", output_dir.string());
        make_path(output_dir);
    }

    return driver.build_command(job, record, general);
}

long job_submit(const submit_driver_type &driver,
                const job_descriptor_type &job,
                const resource_config_type &config,
                const shell_runner_type &runner) {
    auto submit_cmd = job_submit_prepare(driver, job, config);

    fmt::print(stderr, "{}\n", submit_cmd);
    std::fflush(stderr);

    auto result = runner(submit_cmd);
    if (!result.exited_ok())
        logger->warning("Submit command for job {} returned non zero "
                        "status: {}",
                        job.script_path, result.status);

    return submit_driver_parse_job_id(driver, result.output);
}

namespace {
struct submit_options {
    std::vector<std::string> args;
    std::string config_file;
    std::string log_level;
    bool dry_run = false;
};

std::string default_config_file(const submit_driver_type &driver) {
    if (const char *env = std::getenv(CONFIG_FILE_ENV); env && *env)
        return env;
    return driver.default_config_file;
}

int run(const submit_driver_type &driver, const submit_options &options) {
    if (!options.log_level.empty()) {
        auto level = clustersub::parse_log_level(options.log_level);
        if (!level.has_value())
            throw exc::invalid_argument("Unknown log level: {}",
                                        options.log_level);
        clustersub::set_log_level(*level);
    }

    std::vector<std::string> dependencies(options.args.begin(),
                                          options.args.end() - 1);
    const std::string &script = options.args.back();

    auto job = job_descriptor_load(script, dependencies);
    auto config = resource_config_load(options.config_file);

    if (options.dry_run) {
        fmt::print(stderr, "{}\n", job_submit_prepare(driver, job, config));
        return EXIT_SUCCESS;
    }

    long job_id = job_submit(driver, job, config);

    // The workflow engine reads the job id from stdout, nothing else may go
    // there.
    fmt::print("{}\n", job_id);
    std::fflush(stdout);
    return EXIT_SUCCESS;
}
} // namespace

int job_submit_main(job_driver_type type, int argc, char **argv) {
    const auto &driver = submit_driver_get(type);

    CLI::App app{fmt::format("Submit a workflow job script with {} and print "
                             "the id of the submitted job",
                             driver.default_submit_cmd)};
    app.footer(fmt::format("\nExample:\n"
                           "  snakemake --immediate-submit --cluster "
                           "'clustersub-{} {{dependencies}}'",
                           driver.name));

    submit_options options;
    options.config_file = default_config_file(driver);
    app.add_option("args", options.args,
                   "Ids of the jobs this job depends on, followed by the job "
                   "script")
        ->required();
    app.add_option("-c,--config", options.config_file,
                   "Resource configuration (json)")
        ->capture_default_str();
    app.add_option("--log-level", options.log_level,
                   "debug|info|warning|error|critical");
    app.add_flag("--dry-run", options.dry_run,
                 "Print the submit command without submitting");

    CLI11_PARSE(app, argc, argv);

    try {
        return run(driver, options);
    } catch (const exc::metadata_error &err) {
        fmt::print(stderr, "{}\n", err.what());
        return SUBMIT_EXIT_FAILURE;
    } catch (const exc::config_error &err) {
        fmt::print(stderr, "{}\n", err.what());
        return SUBMIT_EXIT_FAILURE;
    } catch (const exc::unparseable_job_id &err) {
        fmt::print(stderr, "{}\n", err.what());
        return SUBMIT_EXIT_FAILURE;
    } catch (const std::exception &err) {
        logger->critical("{}", err.what());
        return EXIT_FAILURE;
    }
}
