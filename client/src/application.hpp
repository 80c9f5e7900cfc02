#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "upload/multi_file_coordinator.hpp"
#include "upload/progress_aggregator.hpp"

// Renders progress snapshots as one status line on stderr, at most every
// `min_interval` unless the status changes.
class console_progress {
public:
    explicit console_progress(bool interactive,
                              std::chrono::milliseconds min_interval = std::chrono::milliseconds(200));

    void operator()(const progress_snapshot& snapshot);
    void finish_line();

    static std::string render(const progress_snapshot& snapshot);

private:
    bool m_interactive;
    std::chrono::milliseconds m_min_interval;
    std::mutex m_mutex;
    std::chrono::steady_clock::time_point m_last_draw;
    std::string m_last_status;
    std::size_t m_last_file = 0;
    bool m_line_open = false;
};

class application {
public:
    application() = default;

    application(const application&) = delete;
    application& operator=(const application&) = delete;

    // 0 when every file uploaded, 1 when any failed, 2 for usage errors.
    int run(int argc, char** argv);

    static void print_summary(const std::vector<file_upload_result>& results,
                              const batch_summary& summary);

private:
    int run_uploads(const app_config& config);
};
