#include <cstdio>
#include <cstdlib>
#include <unordered_map>

#include <fmt/format.h>

#include <clustersub/logging.hpp>

using namespace std::string_literals;

// Controls the prefix of the logger names:
//   clustersub.job_queue.submit_driver
#define LOGGER_NAMESPACE "clustersub"s
#define LOG_LEVEL_ENV "CLUSTERSUB_LOG_LEVEL"

namespace {
const char *level_name(clustersub::ILogger::Level level) {
    switch (level) {
    case clustersub::ILogger::Level::debug:
        return "debug";
    case clustersub::ILogger::Level::info:
        return "info";
    case clustersub::ILogger::Level::warning:
        return "warning";
    case clustersub::ILogger::Level::error:
        return "error";
    case clustersub::ILogger::Level::critical:
        return "critical";
    }
    return "unknown";
}

clustersub::ILogger::Level initial_level() {
    const char *env = std::getenv(LOG_LEVEL_ENV);
    if (env != nullptr) {
        auto level = clustersub::parse_log_level(env);
        if (level.has_value())
            return *level;
    }
    return clustersub::ILogger::Level::warning;
}

/*
 * Function local static so the threshold is initialised before the first
 * file-static logger is used, whatever the order of dynamic initialisation
 * across translation units.
 */
clustersub::ILogger::Level &threshold() {
    static clustersub::ILogger::Level level = initial_level();
    return level;
}

class StderrLogger : public clustersub::ILogger {
    std::string m_name;

public:
    explicit StderrLogger(const std::string &name)
        : m_name(name.empty() ? LOGGER_NAMESPACE
                              : LOGGER_NAMESPACE + "."s + name) {}

protected:
    void log(Level level, fmt::string_view f, fmt::format_args args) final {
        if (level < threshold())
            return;

        auto payload = fmt::vformat(f, args);
        fmt::print(stderr, "[{}] {}: {}\n", level_name(level), m_name,
                   payload);
        std::fflush(stderr);
    }
};

auto &loggers() {
    static std::unordered_map<std::string, std::shared_ptr<StderrLogger>> map;
    return map;
}
} // namespace

std::optional<clustersub::ILogger::Level>
clustersub::parse_log_level(const std::string &name) {
    for (auto level : {ILogger::Level::debug, ILogger::Level::info,
                       ILogger::Level::warning, ILogger::Level::error,
                       ILogger::Level::critical}) {
        if (name == level_name(level))
            return level;
    }
    return std::nullopt;
}

void clustersub::set_log_level(ILogger::Level level) { threshold() = level; }

clustersub::ILogger::Level clustersub::get_log_level() { return threshold(); }

/* Declare weak so it's possible to override in tests */
[[gnu::weak]] std::shared_ptr<clustersub::ILogger>
clustersub::get_logger(const std::string &name) {
    auto it = loggers().find(name);
    if (it != loggers().end())
        return it->second;

    auto logger = std::make_shared<StderrLogger>(name);
    loggers()[name] = logger;
    return logger;
}
