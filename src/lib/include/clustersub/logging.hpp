#pragma once
/**
 * Contains the clustersub::ILogger "interface"
 */
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace clustersub {
/**
 * The ILogger is used by all components of the adapter. The default
 * implementation writes to stderr, because stdout is reserved for the job id
 * read by the workflow engine. Other implementations, like in unit-tests, can
 * be installed by overriding get_logger().
 */
class ILogger {
public:
    enum struct Level { debug, info, warning, error, critical };
    virtual ~ILogger() = default;

    template <typename... Args> void debug(fmt::string_view f, Args &&...args) {
        this->log(Level::debug, f,
                  fmt::make_format_args(std::forward<Args>(args)...));
    }

    template <typename... Args> void info(fmt::string_view f, Args &&...args) {
        this->log(Level::info, f,
                  fmt::make_format_args(std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warning(fmt::string_view f, Args &&...args) {
        this->log(Level::warning, f,
                  fmt::make_format_args(std::forward<Args>(args)...));
    }

    template <typename... Args> void error(fmt::string_view f, Args &&...args) {
        this->log(Level::error, f,
                  fmt::make_format_args(std::forward<Args>(args)...));
    }

    template <typename... Args>
    void critical(fmt::string_view f, Args &&...args) {
        this->log(Level::critical, f,
                  fmt::make_format_args(std::forward<Args>(args)...));
    }

protected:
    virtual void log(Level level, fmt::string_view f,
                     fmt::format_args args) = 0;
};

/**
 * Creates (or fetches) the logger with the given name, prefixed with the
 * "clustersub" namespace. Safe to call during static initialisation.
 */
std::shared_ptr<ILogger> get_logger(const std::string &name);

/**
 * Messages below this level are dropped by the stderr loggers. The default
 * is Level::warning, or the value of the CLUSTERSUB_LOG_LEVEL environment
 * variable when that is set to a valid level name.
 */
void set_log_level(ILogger::Level level);
ILogger::Level get_log_level();

/** Parse "debug", "info", "warning", "error" or "critical". */
std::optional<ILogger::Level> parse_log_level(const std::string &name);

} // namespace clustersub
