#pragma once

#include <optional>
#include <sstream>
#include <string>

// Tagged console logging. Lines look like "[tag] message" and go to stderr so
// stdout stays free for the final summary.
namespace logging {

enum class level {
    silent = 0,
    error,
    warn,
    info,
    debug,
    trace,
};

void set_level(level lvl);
level current_level();

inline bool enabled(level lvl) {
    return lvl != level::silent && static_cast<int>(lvl) <= static_cast<int>(current_level());
}

// Accepts SILENT|ERROR|WARN|INFO|DEBUG|TRACE in any case.
std::optional<level> parse_level(const std::string& name);

class line {
public:
    line(level lvl, const char* tag);
    ~line();

    line(const line&) = delete;
    line& operator=(const line&) = delete;

    template <typename T>
    line& operator<<(const T& value) {
        if (m_enabled)
            m_buffer << value;
        return *this;
    }

private:
    bool m_enabled;
    std::ostringstream m_buffer;
};

} // namespace logging

#define SWREPO_LOG_AT(lvl, tag)                                                                    \
    if (!logging::enabled(lvl)) {                                                                  \
    } else                                                                                         \
        logging::line(lvl, tag)

#define LOG_ERROR(tag) SWREPO_LOG_AT(logging::level::error, tag)
#define LOG_WARN(tag) SWREPO_LOG_AT(logging::level::warn, tag)
#define LOG_INFO(tag) SWREPO_LOG_AT(logging::level::info, tag)
#define LOG_DEBUG(tag) SWREPO_LOG_AT(logging::level::debug, tag)
#define LOG_TRACE(tag) SWREPO_LOG_AT(logging::level::trace, tag)
