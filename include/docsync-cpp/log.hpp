/// @file log.hpp
/// @brief Named verbose-logging switches.
///
/// Diagnostics are written with Abseil logging and guarded by a VerboseFlag:
///
/// @code
/// ABSL_CONST_INIT VerboseFlag mutation_logging("mutation");
/// ABSL_LOG_IF(INFO, mutation_logging) << "applied " << key.to_string();
/// @endcode
///
/// Flags are off by default. The environment variable
/// `DOCSYNC_VERBOSE_LOGGING` enables them on first use: a comma-separated
/// list of flag names, or `all`. set_verbose_logging() overrides it at
/// runtime.

#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

namespace docsync_cpp {

/// A named on/off switch for verbose diagnostics.
class VerboseFlag {
public:
    explicit constexpr VerboseFlag(const char* name) : name_{name} {}

    VerboseFlag(const VerboseFlag&) = delete;
    auto operator=(const VerboseFlag&) -> VerboseFlag& = delete;

    auto name() const -> std::string_view { return name_; }

    /// Whether this flag is currently enabled.
    auto enabled() const -> bool;

    explicit operator bool() const { return enabled(); }

private:
    const char* name_;
    // (configuration generation << 1) | enabled; generation 0 is never current.
    mutable std::atomic<std::uint64_t> cached_{0};
};

/// Enable or disable the flag called `name` ("all" addresses every flag).
void set_verbose_logging(std::string_view name, bool enabled);

/// Re-read `DOCSYNC_VERBOSE_LOGGING`, discarding set_verbose_logging() calls.
void reset_verbose_logging();

}  // namespace docsync_cpp
