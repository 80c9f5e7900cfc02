#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

struct progress_snapshot {
    std::size_t file_index;   // 1-based, 0 before the first file
    std::size_t file_count;
    std::string label;        // display name of the current file
    std::string status;       // initializing, uploading, finalizing, complete, failed
    std::size_t current_chunk;
    std::size_t chunks_complete;
    std::size_t total_chunks;
    std::uint64_t file_bytes_uploaded;
    std::uint64_t file_total_bytes;
    double file_percent;
    double bytes_per_second;
    std::uint64_t overall_bytes_uploaded;
    std::uint64_t overall_total_bytes;
    double overall_percent;
};

// Turns chunk events into byte counters, percentages and throughput. The
// transport cannot report bytes while a PUT is in flight, so the bytes of an
// in-flight chunk are extrapolated from elapsed time and the throughput seen
// so far, kept inside [1%, 99%] of the chunk, and replaced by the real length
// once the chunk's response arrives.
//
// All methods are thread-safe; snapshots are pushed to the callback.
class progress_aggregator {
public:
    using callback = std::function<void(const progress_snapshot&)>;
    using clock = std::chrono::steady_clock;
    using now_function = std::function<clock::time_point()>;

    // Assumed throughput until the first chunk of a file has been confirmed.
    static constexpr double BASELINE_BYTES_PER_SECOND = 2.0 * 1024.0 * 1024.0;
    static constexpr double MIN_IN_FLIGHT_FRACTION = 0.01;
    static constexpr double MAX_IN_FLIGHT_FRACTION = 0.99;

    explicit progress_aggregator(callback on_update = nullptr, now_function now = nullptr);

    progress_aggregator(const progress_aggregator&) = delete;
    progress_aggregator& operator=(const progress_aggregator&) = delete;

    void begin_batch(std::uint64_t total_bytes, std::size_t file_count);
    // Pins the 1-based batch position of the next begin_file. Without it the
    // position advances by one per begun file.
    void select_file(std::size_t file_index);
    void begin_file(const std::string& label, std::uint64_t file_size, std::size_t total_chunks);
    void set_status(const std::string& status);

    void chunk_started(std::size_t chunk_number, std::uint64_t length);
    void chunk_in_flight(std::size_t chunk_number, std::chrono::milliseconds elapsed);
    void chunk_finished(std::size_t chunk_number, std::uint64_t length);
    void chunk_failed(std::size_t chunk_number);

    // Successful files add their size to the batch offset.
    void file_finished(bool success);

    void publish();
    progress_snapshot snapshot() const;

    // Fraction of a chunk assumed sent after `elapsed_seconds`.
    static double estimate_fraction(double elapsed_seconds, std::uint64_t chunk_bytes,
                                    double bytes_per_second);

private:
    struct in_flight_chunk {
        std::uint64_t length;
        std::uint64_t estimated_bytes;
    };

    callback m_on_update;
    now_function m_now;

    mutable std::mutex m_mutex;
    std::mutex m_publish_mutex;

    std::uint64_t m_batch_total = 0;
    std::uint64_t m_batch_offset = 0;
    std::size_t m_file_count = 0;
    std::size_t m_file_index = 0;
    std::size_t m_selected_index = 0;

    std::string m_label;
    std::string m_status = "idle";
    std::uint64_t m_file_size = 0;
    std::size_t m_total_chunks = 0;
    std::size_t m_chunks_complete = 0;
    std::size_t m_current_chunk = 0;
    std::uint64_t m_confirmed_bytes = 0;
    std::map<std::size_t, in_flight_chunk> m_in_flight;
    clock::time_point m_file_started;

    double speed_locked(clock::time_point now) const;
    progress_snapshot snapshot_locked(clock::time_point now) const;
};
