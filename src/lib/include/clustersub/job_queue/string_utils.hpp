#pragma once

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>
#include <vector>

/// Join the non-empty strings with sep.
template <typename C>
static std::string join_nonempty(const C &strings, const std::string &sep) {
    std::string result;
    for (const auto &s : strings) {
        if (s.empty())
            continue;
        if (!result.empty())
            result += sep;
        result += s;
    }
    return result;
}

/// Split on any whitespace, dropping empty items.
static inline std::vector<std::string>
split_whitespace(const std::string &string_value) {
    const char *space = " \t\n\r\f\v";
    std::vector<std::string> strings;
    std::size_t offset = string_value.find_first_not_of(space);
    while (offset != std::string::npos) {
        auto item_end = string_value.find_first_of(space, offset);
        strings.push_back(string_value.substr(offset, item_end - offset));
        offset = string_value.find_first_not_of(space, item_end);
    }
    return strings;
}

/**
   Takes a char buffer as input, and parses it as an integer. Returns
   true if the parsing succeeded, and false otherwise. If parsing
   succeeded, the integer value is returned by reference.
*/
static inline bool sscanf_long(const char *buffer, long *value) {
    if (!buffer)
        return false;

    // Skip leading white-space
    while (isspace(static_cast<unsigned char>(buffer[0])))
        buffer++;
    if (buffer[0] == '\0')
        return false;

    char *error_ptr;
    errno = 0;
    long tmp_value = strtol(buffer, &error_ptr, 10);
    if (errno == ERANGE || error_ptr == buffer)
        return false;

    // Skip trailing white-space
    while (error_ptr[0] != '\0' &&
           isspace(static_cast<unsigned char>(error_ptr[0])))
        error_ptr++;

    if (error_ptr[0] != '\0')
        return false;

    if (value != nullptr)
        *value = tmp_value;
    return true;
}

static inline bool sscanf_int(const char *buffer, int *value) {
    long tmp_value;
    if (!sscanf_long(buffer, &tmp_value))
        return false;
    if (tmp_value < INT_MIN || tmp_value > INT_MAX)
        return false;
    if (value != nullptr)
        *value = static_cast<int>(tmp_value);
    return true;
}

/// Single quote a word for /bin/sh, escaping embedded single quotes.
static inline std::string shell_quote(const std::string &word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}
