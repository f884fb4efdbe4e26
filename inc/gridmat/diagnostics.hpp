#pragma once

#include <cstdio>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#ifndef GRIDMAT_DIAGNOSTICS
#define GRIDMAT_DIAGNOSTICS 1
#endif

/**
 * @brief Side channel for notes about rejected or suspicious operations
 *
 * Notes go to stderr by default. The channel is process-wide and not
 * synchronised; configure it before sharing matrices between threads.
 */
namespace gridmat::diagnostics {

using Sink = std::function<void(std::string_view)>;

namespace detail {
inline void stderr_sink(std::string_view message) {
    fmt::print(stderr, "gridmat: {}\n", message);
}

inline bool& enabled_flag() {
    static bool enabled = true;
    return enabled;
}

inline Sink& current_sink() {
    static Sink sink = stderr_sink;
    return sink;
}
} // namespace detail

inline void set_enabled(bool enabled) {
    detail::enabled_flag() = enabled;
}

[[nodiscard]] inline bool enabled() {
    return GRIDMAT_DIAGNOSTICS != 0 && detail::enabled_flag();
}

/**
 * @brief Replace the destination of notes (an empty sink restores stderr)
 */
inline void set_sink(Sink sink) {
    detail::current_sink() = sink ? std::move(sink) : Sink{detail::stderr_sink};
}

inline void reset_sink() {
    detail::current_sink() = detail::stderr_sink;
}

template<typename... Args>
void note(fmt::format_string<Args...> format, Args&&... args) {
#if GRIDMAT_DIAGNOSTICS
    if (!detail::enabled_flag()) {
        return;
    }
    const std::string message = fmt::format(format, std::forward<Args>(args)...);
    detail::current_sink()(message);
#else
    (void)format;
    ((void)args, ...);
#endif
}

} // namespace gridmat::diagnostics
