#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "net/api_client.hpp"
#include "net/http.hpp"
#include "upload/chunk_planner.hpp"
#include "upload/chunk_transmitter.hpp"
#include "upload/progress_aggregator.hpp"
#include "upload/upload_session.hpp"
#include "upload/upload_target.hpp"

enum class upload_strategy {
    sequential,
    parallel,
};

const char* to_string(upload_strategy strategy);

struct upload_options {
    std::uint64_t chunk_size;        // bytes per chunk
    std::size_t max_parallel;        // throttle limit of the parallel strategy
    bool allow_parallel;             // false forces the sequential strategy
    std::size_t parallel_threshold;  // fewer chunks than this stay sequential
    bool require_completion_status;  // treat a loop without any 2xx as a failure
    std::chrono::milliseconds poll_interval; // progress estimation and monitor tick

    upload_options();
};

struct upload_result {
    upload_strategy strategy = upload_strategy::sequential;
    std::string file_name;
    std::string session_url;
    std::size_t total_chunks = 0;
    std::size_t chunks_sent = 0;
    bool completion_confirmed = false; // some chunk answered 200/201/204
    nlohmann::json finalize_response;
};

// Drives one file through initialize -> chunk loop -> finalize.
class upload_orchestrator {
public:
    upload_orchestrator(api_client& api, transport_factory transports,
                        upload_options options = upload_options(),
                        progress_aggregator* progress = nullptr);

    upload_orchestrator(const upload_orchestrator&) = delete;
    upload_orchestrator& operator=(const upload_orchestrator&) = delete;

    // Throws upload_init_error, chunk_upload_error (sequential),
    // aggregate_chunk_failure (parallel), authentication_error, api_error or
    // upload_error. Nothing is retried.
    upload_result upload(const file_descriptor& file, const upload_target& target);

    upload_strategy choose_strategy(std::size_t total_chunks) const;

    const upload_options& options() const {
        return m_options;
    }

private:
    api_client& m_api;
    transport_factory m_transports;
    upload_options m_options;
    progress_aggregator* m_progress;

    void upload_sequential(const file_descriptor& file, const upload_session_info& session,
                           const std::vector<chunk_range>& plan, upload_result& result);
    void upload_parallel(const file_descriptor& file, const upload_session_info& session,
                         const std::vector<chunk_range>& plan, upload_result& result);
    void finalize(const file_descriptor& file, const upload_session_info& session,
                  upload_result& result);
};
