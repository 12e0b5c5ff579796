#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

#include <nlohmann/json.hpp>

#define SCHEDULE_KEY_PREFIX "schedule_"
#define GENERAL_KEY_SUFFIX "_general"

/* Keys of a schedule_<rule> record. */
#define RESOURCE_QUEUE_KEY "queue"
#define RESOURCE_THREADS_KEY "threads"
#define RESOURCE_PARTITION_KEY "partition"
#define RESOURCE_CORES_KEY "cores"
#define RESOURCE_DAYS_KEY "days"
#define RESOURCE_HOURS_KEY "hours"
#define RESOURCE_MINUTES_KEY "minutes"
#define RESOURCE_EXTRA_PARAMETERS_KEY "extra_parameters"

/* Keys of a <backend>_general section. */
#define GENERAL_WRAPPER_SCRIPT_KEY "wrapper_script"
#define GENERAL_ACCOUNT_KEY "account"
#define GENERAL_SUBMIT_CMD_KEY "submit_cmd"

/**
   The resources of one rule. Which fields are required depends on the
   backend: the grid engine driver needs queue and threads, the slurm driver
   needs partition, cores, days, hours and minutes. Missing fields are only
   reported when a driver asks for them.
*/
struct resource_record {
    /** The key this record was loaded from, e.g. "schedule_align". */
    std::string key;
    std::optional<std::string> queue;
    std::optional<int> threads;
    std::optional<std::string> partition;
    std::optional<int> cores;
    std::optional<int> days;
    std::optional<int> hours;
    std::optional<int> minutes;
    std::string extra_parameters;

    bool operator==(const resource_record &other) const;
};

/** A schedule_<rule> entry naming another schedule_<rule> entry. */
struct redirect_key {
    std::string target;
};

using resource_entry = std::variant<resource_record, redirect_key>;

struct general_settings {
    std::optional<std::string> wrapper_script;
    std::optional<std::string> account;
    std::optional<std::string> submit_cmd;
};

struct resource_config_type {
    std::unordered_map<std::string, resource_entry> schedules;
    /** Keyed by backend name, e.g. "qsub" for the "qsub_general" section. */
    std::unordered_map<std::string, general_settings> general;
    /** Error messages of the entries which could not be loaded. */
    std::unordered_map<std::string, std::string> invalid;
};

std::string resource_config_schedule_key(const std::string &rule);

resource_config_type resource_config_from_json(const nlohmann::json &json);
resource_config_type
resource_config_load(const std::filesystem::path &config_file);

const resource_record &
resource_config_resolve(const resource_config_type &config,
                        const std::string &rule);

const general_settings &
resource_config_get_general(const resource_config_type &config,
                            const std::string &backend);

/* Typed access to the record fields; throw exc::config_error naming the
   record and the field when the value is missing. */
const std::string &resource_record_require(const resource_record &record,
                                           const std::optional<std::string> &,
                                           const char *field);
int resource_record_require(const resource_record &record,
                            const std::optional<int> &, const char *field);
