#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <stdexcept>

/**
 * Convenience exception classes that accept arguments for fmtlib formatting
 */
namespace exc {

#define STDEXCEPT(_Name)                                                       \
    class _Name : public ::std::_Name {                                        \
    public:                                                                    \
        using ::std::_Name::_Name;                                             \
        template <typename... T>                                               \
        _Name(::fmt::format_string<T...> fmt, T &&...args)                     \
            : _Name(::fmt::format(fmt, ::std::forward<T>(args)...)) {}         \
    }

STDEXCEPT(invalid_argument);
STDEXCEPT(runtime_error);

#undef STDEXCEPT

#define SUBMITEXCEPT(_Name, _Base)                                             \
    class _Name : public _Base {                                               \
        using base_type = _Base;                                               \
                                                                               \
    public:                                                                    \
        using base_type::base_type;                                            \
        template <typename... T>                                               \
        _Name(::fmt::format_string<T...> fmt, T &&...args)                     \
            : _Name(::fmt::format(fmt, ::std::forward<T>(args)...)) {}         \
    }

/** The job script lacks the embedded rule/input/output metadata. */
SUBMITEXCEPT(metadata_error, ::std::runtime_error);

/** The resource configuration is malformed or cannot serve the request. */
SUBMITEXCEPT(config_error, ::std::runtime_error);

/** No resource configuration could be resolved for a rule. */
SUBMITEXCEPT(undefined_job_rule, config_error);

/**
 * The output of the submission tool did not contain a job id. The job may
 * still have been accepted by the scheduler.
 */
SUBMITEXCEPT(unparseable_job_id, ::std::runtime_error);

#undef SUBMITEXCEPT
} // namespace exc
