#include "util/log.hpp"

#include <algorithm>
#include <cctype>
#include <atomic>
#include <iostream>
#include <mutex>

namespace logging {

namespace {
std::atomic<level> g_level{level::info};
std::mutex g_output_mutex;

const char* level_prefix(level lvl) {
    switch (lvl) {
    case level::error:
        return "ERROR ";
    case level::warn:
        return "WARN ";
    default:
        return "";
    }
}
} // namespace

void set_level(level lvl) {
    g_level.store(lvl, std::memory_order_relaxed);
}

level current_level() {
    return g_level.load(std::memory_order_relaxed);
}

std::optional<level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "silent")
        return level::silent;
    if (lower == "error")
        return level::error;
    if (lower == "warn" || lower == "warning")
        return level::warn;
    if (lower == "info")
        return level::info;
    if (lower == "debug")
        return level::debug;
    if (lower == "trace")
        return level::trace;
    return std::nullopt;
}

line::line(level lvl, const char* tag) : m_enabled(enabled(lvl)) {
    if (m_enabled)
        m_buffer << level_prefix(lvl) << "[" << tag << "] ";
}

line::~line() {
    if (!m_enabled)
        return;
    std::lock_guard<std::mutex> lk(g_output_mutex);
    std::cerr << m_buffer.str() << std::endl;
}

} // namespace logging
