#include "application.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include "net/api_client.hpp"
#include "net/errors.hpp"
#include "net/http.hpp"
#include "net/token_provider.hpp"
#include "upload/upload_orchestrator.hpp"
#include "util/byte_utils.hpp"
#include "util/log.hpp"

constexpr long API_TIMEOUT_SECONDS = 60;

console_progress::console_progress(bool interactive, std::chrono::milliseconds min_interval)
    : m_interactive(interactive), m_min_interval(min_interval) {}

std::string console_progress::render(const progress_snapshot& s) {
    std::ostringstream oss;
    if (s.file_count > 1)
        oss << "[" << s.file_index << "/" << s.file_count << "] ";
    oss << s.label << " " << s.status;
    if (s.total_chunks > 0)
        oss << " chunk " << s.current_chunk << "/" << s.total_chunks;
    oss << "  " << byte_utils::format_bytes(s.file_bytes_uploaded) << " / "
        << byte_utils::format_bytes(s.file_total_bytes) << " ("
        << byte_utils::format_percent(s.file_percent) << ")  "
        << byte_utils::format_mbps(s.bytes_per_second);
    if (s.file_count > 1)
        oss << "  overall " << byte_utils::format_percent(s.overall_percent);
    return oss.str();
}

void console_progress::operator()(const progress_snapshot& snapshot) {
    if (!logging::enabled(logging::level::info))
        return;

    std::lock_guard<std::mutex> lk(m_mutex);
    auto now = std::chrono::steady_clock::now();
    bool changed = snapshot.status != m_last_status || snapshot.file_index != m_last_file;
    if (!changed && now - m_last_draw < m_min_interval)
        return;
    m_last_draw = now;
    m_last_status = snapshot.status;
    m_last_file = snapshot.file_index;

    if (m_interactive) {
        std::cerr << "\r\033[K" << render(snapshot) << std::flush;
        m_line_open = true;
        if (snapshot.status == "complete" || snapshot.status == "failed") {
            std::cerr << std::endl;
            m_line_open = false;
        }
    } else if (changed) {
        // Non-terminal output only gets status transitions.
        std::cerr << render(snapshot) << std::endl;
    }
}

void console_progress::finish_line() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_line_open) {
        std::cerr << std::endl;
        m_line_open = false;
    }
}

int application::run(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "swrepo-upload";

    app_config config;
    try {
        config = parse_arguments(argc, argv, process_environment());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage_text(program);
        return 2;
    }

    if (config.show_help) {
        std::cout << usage_text(program);
        return 0;
    }

    logging::set_level(config.log_level);
    LOG_INFO("app") << "API Base: " << config.creds.base_uri;

    try {
        return run_uploads(config);
    } catch (const authentication_error& e) {
        LOG_ERROR("app") << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("app") << "Unexpected failure: " << e.what();
        return 1;
    }
}

int application::run_uploads(const app_config& config) {
    console_progress renderer(isatty(STDERR_FILENO) == 1);
    progress_aggregator progress(
        [&renderer](const progress_snapshot& snapshot) { renderer(snapshot); });

    auto api_transports = make_curl_transport_factory(API_TIMEOUT_SECONDS);
    token_provider tokens(config.creds, api_transports());
    api_client api(tokens, api_transports());

    // Fail fast on bad credentials before touching any file.
    tokens.get_token();

    upload_orchestrator orchestrator(api,
                                     make_curl_transport_factory(config.chunk_timeout_minutes * 60),
                                     config.make_upload_options(), &progress);
    multi_file_coordinator coordinator(orchestrator, &progress);

    auto results = coordinator.upload_all(config.files, config.target);
    renderer.finish_line();

    print_summary(results, coordinator.summary());
    return coordinator.summary().failed == 0 ? 0 : 1;
}

void application::print_summary(const std::vector<file_upload_result>& results,
                                const batch_summary& summary) {
    std::cout << "\n=== Upload summary ===" << std::endl;
    for (const auto& r : results) {
        std::cout << (r.success ? "  OK    " : "  FAIL  ") << std::left << std::setw(18)
                  << to_string(r.target_platform) << " " << r.file_path;
        if (r.success) {
            std::cout << " (" << byte_utils::format_bytes(r.bytes);
            if (r.detail)
                std::cout << ", " << r.detail->chunks_sent << "/" << r.detail->total_chunks
                          << " chunks, " << to_string(r.detail->strategy);
            std::cout << ")";
        } else {
            std::cout << "\n        " << r.error_message;
        }
        std::cout << std::endl;
    }
    std::cout << summary.succeeded << " succeeded, " << summary.failed << " failed" << std::endl;
}
