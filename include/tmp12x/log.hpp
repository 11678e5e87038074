#pragma once

namespace tmp12x {

/// Log layers provide static debug(const char *) and warn(const char *).
/// null_log is the default so that firmware builds carry no output code.
struct null_log {
    static constexpr void debug(const char *) noexcept {}
    static constexpr void warn(const char *) noexcept {}
};

/// Writes prefixed lines to stderr, for host builds.
struct stdio_log {
    static void debug(const char *msg) noexcept;
    static void warn(const char *msg) noexcept;
};

}
