#include <climits>
#include <fstream>
#include <string>

#include <clustersub/except.hpp>
#include <clustersub/job_queue/resource_config.hpp>
#include <clustersub/job_queue/string_utils.hpp>
#include <clustersub/logging.hpp>

using json = nlohmann::json;

static auto logger = clustersub::get_logger("job_queue.resource_config");

static bool starts_with(const std::string &s, const std::string &prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool resource_record::operator==(const resource_record &other) const {
    return key == other.key && queue == other.queue &&
           threads == other.threads && partition == other.partition &&
           cores == other.cores && days == other.days &&
           hours == other.hours && minutes == other.minutes &&
           extra_parameters == other.extra_parameters;
}

std::string resource_config_schedule_key(const std::string &rule) {
    return SCHEDULE_KEY_PREFIX + rule;
}

namespace {
std::optional<std::string> string_field(const std::string &section,
                                        const json &object, const char *key) {
    auto iter = object.find(key);
    if (iter == object.end() || iter->is_null())
        return std::nullopt;

    if (!iter->is_string())
        throw exc::config_error("{}: '{}' must be a string, got {}", section,
                                key, iter->dump());
    return iter->get<std::string>();
}

/* Integers may be given as json numbers or as decimal strings. */
std::optional<int> int_field(const std::string &section, const json &object,
                             const char *key) {
    auto iter = object.find(key);
    if (iter == object.end() || iter->is_null())
        return std::nullopt;

    if (iter->is_number_unsigned()) {
        auto value = iter->get<unsigned long long>();
        if (value <= static_cast<unsigned long long>(INT_MAX))
            return static_cast<int>(value);
    } else if (iter->is_number_integer()) {
        auto value = iter->get<long long>();
        if (value >= INT_MIN && value <= INT_MAX)
            return static_cast<int>(value);
    }

    int value;
    if (iter->is_string() && sscanf_int(iter->get_ref<const std::string &>().c_str(), &value))
        return value;

    throw exc::config_error("{}: '{}' must be an integer, got {}", section, key,
                            iter->dump());
}

resource_record load_record(const std::string &key, const json &object) {
    resource_record record;
    record.key = key;
    record.queue = string_field(key, object, RESOURCE_QUEUE_KEY);
    record.threads = int_field(key, object, RESOURCE_THREADS_KEY);
    record.partition = string_field(key, object, RESOURCE_PARTITION_KEY);
    record.cores = int_field(key, object, RESOURCE_CORES_KEY);
    record.days = int_field(key, object, RESOURCE_DAYS_KEY);
    record.hours = int_field(key, object, RESOURCE_HOURS_KEY);
    record.minutes = int_field(key, object, RESOURCE_MINUTES_KEY);
    record.extra_parameters =
        string_field(key, object, RESOURCE_EXTRA_PARAMETERS_KEY).value_or("");
    return record;
}

general_settings load_general(const std::string &key, const json &object) {
    general_settings general;
    general.wrapper_script =
        string_field(key, object, GENERAL_WRAPPER_SCRIPT_KEY);
    general.account = string_field(key, object, GENERAL_ACCOUNT_KEY);
    general.submit_cmd = string_field(key, object, GENERAL_SUBMIT_CMD_KEY);
    return general;
}

/*
  A malformed entry is kept as an error message instead of failing the whole
  configuration; it is only reported when a job needs that entry.
*/
void load_entry(resource_config_type &config, const std::string &key,
                const json &value) {
    if (starts_with(key, SCHEDULE_KEY_PREFIX)) {
        if (value.is_object()) {
            config.schedules.emplace(key, load_record(key, value));
        } else if (value.is_string() &&
                   starts_with(value.get<std::string>(), SCHEDULE_KEY_PREFIX)) {
            config.schedules.emplace(key,
                                     redirect_key{value.get<std::string>()});
        } else
            throw exc::config_error(
                "{}: expected a resource record or the name of another "
                "{}<rule> entry, got {}",
                key, SCHEDULE_KEY_PREFIX, value.dump());
    } else if (ends_with(key, GENERAL_KEY_SUFFIX)) {
        if (!value.is_object())
            throw exc::config_error("{}: must be a json object", key);
        auto backend =
            key.substr(0, key.size() - std::string(GENERAL_KEY_SUFFIX).size());
        config.general.emplace(backend, load_general(key, value));
    } else
        logger->debug("Ignoring configuration key: {}", key);
}

/* The entry stored under key; nullptr when there is no such entry. */
const resource_entry *find_entry(const resource_config_type &config,
                                 const std::string &key) {
    auto invalid = config.invalid.find(key);
    if (invalid != config.invalid.end())
        throw exc::config_error("{}", invalid->second);

    auto iter = config.schedules.find(key);
    if (iter == config.schedules.end())
        return nullptr;
    return &iter->second;
}
} // namespace

resource_config_type resource_config_from_json(const json &config_json) {
    if (!config_json.is_object())
        throw exc::config_error("The resource configuration must be a json "
                                "object");

    resource_config_type config;
    for (const auto &[key, value] : config_json.items()) {
        try {
            load_entry(config, key, value);
        } catch (const exc::config_error &err) {
            logger->warning("Invalid configuration entry: {}", err.what());
            config.invalid.emplace(key, err.what());
        }
    }
    return config;
}

resource_config_type
resource_config_load(const std::filesystem::path &config_file) {
    std::ifstream stream(config_file);
    if (!stream)
        throw exc::config_error("Unable to open configuration file: {}",
                                config_file.string());

    json config_json;
    try {
        stream >> config_json;
    } catch (const json::parse_error &err) {
        throw exc::config_error("Unable to parse configuration file {}: {}",
                                config_file.string(), err.what());
    }

    logger->debug("Loaded configuration from {}", config_file.string());
    return resource_config_from_json(config_json);
}

/**
   Looks up schedule_<rule>. The entry is either the resources themselves, or
   the name of another schedule_ entry whose resources should be used
   instead. Only one such redirect is followed: the target must be a resource
   record.
*/
const resource_record &
resource_config_resolve(const resource_config_type &config,
                        const std::string &rule) {
    auto key = resource_config_schedule_key(rule);
    const auto *entry = find_entry(config, key);
    if (entry == nullptr)
        throw exc::undefined_job_rule("No schedule config found for {}", key);

    if (const auto *record = std::get_if<resource_record>(entry))
        return *record;

    const auto &target = std::get<redirect_key>(*entry).target;
    logger->debug("{} redirects to {}", key, target);

    const auto *target_entry = find_entry(config, target);
    if (target_entry == nullptr)
        throw exc::undefined_job_rule("No schedule config found for {}",
                                      target);

    if (const auto *record = std::get_if<resource_record>(target_entry))
        return *record;

    throw exc::config_error(
        "{} redirects to {}, which redirects to {}: only one level of "
        "redirection is supported",
        key, target, std::get<redirect_key>(*target_entry).target);
}

const general_settings &
resource_config_get_general(const resource_config_type &config,
                            const std::string &backend) {
    auto invalid = config.invalid.find(backend + GENERAL_KEY_SUFFIX);
    if (invalid != config.invalid.end())
        throw exc::config_error("{}", invalid->second);

    auto iter = config.general.find(backend);
    if (iter == config.general.end())
        throw exc::config_error("No {}{} section in the configuration",
                                backend, GENERAL_KEY_SUFFIX);
    return iter->second;
}

const std::string &resource_record_require(const resource_record &record,
                                           const std::optional<std::string> &value,
                                           const char *field) {
    if (!value.has_value())
        throw exc::config_error("{}: missing required field '{}'", record.key,
                                field);
    return *value;
}

int resource_record_require(const resource_record &record,
                            const std::optional<int> &value,
                            const char *field) {
    if (!value.has_value())
        throw exc::config_error("{}: missing required field '{}'", record.key,
                                field);
    return *value;
}
