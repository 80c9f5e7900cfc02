#include "upload/progress_aggregator.hpp"

#include <algorithm>

constexpr double progress_aggregator::BASELINE_BYTES_PER_SECOND;
constexpr double progress_aggregator::MIN_IN_FLIGHT_FRACTION;
constexpr double progress_aggregator::MAX_IN_FLIGHT_FRACTION;

namespace {
double percent_of(std::uint64_t part, std::uint64_t whole) {
    if (whole == 0)
        return 0.0;
    return 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}
} // namespace

progress_aggregator::progress_aggregator(callback on_update, now_function now)
    : m_on_update(std::move(on_update)), m_now(std::move(now)) {
    if (!m_now)
        m_now = [] { return clock::now(); };
    m_file_started = m_now();
}

double progress_aggregator::estimate_fraction(double elapsed_seconds, std::uint64_t chunk_bytes,
                                              double bytes_per_second) {
    if (chunk_bytes == 0 || bytes_per_second <= 0.0)
        return MIN_IN_FLIGHT_FRACTION;
    double expected_seconds = static_cast<double>(chunk_bytes) / bytes_per_second;
    double fraction = elapsed_seconds / expected_seconds;
    return std::clamp(fraction, MIN_IN_FLIGHT_FRACTION, MAX_IN_FLIGHT_FRACTION);
}

void progress_aggregator::begin_batch(std::uint64_t total_bytes, std::size_t file_count) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_batch_total = total_bytes;
    m_batch_offset = 0;
    m_file_count = file_count;
    m_file_index = 0;
    m_selected_index = 0;
}

void progress_aggregator::select_file(std::size_t file_index) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_selected_index = file_index;
}

void progress_aggregator::begin_file(const std::string& label, std::uint64_t file_size,
                                     std::size_t total_chunks) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_file_index = m_selected_index != 0 ? m_selected_index : m_file_index + 1;
        m_selected_index = 0;
        if (m_file_count < m_file_index)
            m_file_count = m_file_index;
        m_label = label;
        m_status = "initializing";
        m_file_size = file_size;
        m_total_chunks = total_chunks;
        m_chunks_complete = 0;
        m_current_chunk = 0;
        m_confirmed_bytes = 0;
        m_in_flight.clear();
        m_file_started = m_now();
    }
    publish();
}

void progress_aggregator::set_status(const std::string& status) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_status = status;
    }
    publish();
}

void progress_aggregator::chunk_started(std::size_t chunk_number, std::uint64_t length) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_status = "uploading";
        m_current_chunk = std::max(m_current_chunk, chunk_number);
        m_in_flight[chunk_number] = {length, 0};
    }
    publish();
}

void progress_aggregator::chunk_in_flight(std::size_t chunk_number,
                                          std::chrono::milliseconds elapsed) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        auto it = m_in_flight.find(chunk_number);
        if (it == m_in_flight.end())
            return;
        // Concurrent chunks share the measured throughput.
        double per_chunk_speed =
            speed_locked(m_now()) / static_cast<double>(std::max<std::size_t>(1, m_in_flight.size()));
        double fraction = estimate_fraction(std::chrono::duration<double>(elapsed).count(),
                                            it->second.length, per_chunk_speed);
        it->second.estimated_bytes =
            static_cast<std::uint64_t>(fraction * static_cast<double>(it->second.length));
    }
    publish();
}

void progress_aggregator::chunk_finished(std::size_t chunk_number, std::uint64_t length) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_in_flight.erase(chunk_number);
        m_confirmed_bytes += length;
        ++m_chunks_complete;
    }
    publish();
}

void progress_aggregator::chunk_failed(std::size_t chunk_number) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_in_flight.erase(chunk_number);
    }
    publish();
}

void progress_aggregator::file_finished(bool success) {
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_in_flight.clear();
        m_status = success ? "complete" : "failed";
        if (success) {
            m_confirmed_bytes = m_file_size;
            m_batch_offset += m_file_size;
        }
    }
    publish();
}

double progress_aggregator::speed_locked(clock::time_point now) const {
    double seconds = std::chrono::duration<double>(now - m_file_started).count();
    if (m_confirmed_bytes == 0 || seconds <= 0.0)
        return BASELINE_BYTES_PER_SECOND;
    return static_cast<double>(m_confirmed_bytes) / seconds;
}

progress_snapshot progress_aggregator::snapshot_locked(clock::time_point now) const {
    progress_snapshot s{};
    s.file_index = m_file_index;
    s.file_count = m_file_count;
    s.label = m_label;
    s.status = m_status;
    s.current_chunk = m_current_chunk;
    s.chunks_complete = m_chunks_complete;
    s.total_chunks = m_total_chunks;

    std::uint64_t estimated = 0;
    for (const auto& entry : m_in_flight)
        estimated += entry.second.estimated_bytes;
    bool file_done = m_status == "complete";
    s.file_bytes_uploaded = std::min(m_file_size, m_confirmed_bytes + estimated);
    s.file_total_bytes = m_file_size;
    s.file_percent = percent_of(s.file_bytes_uploaded, m_file_size);
    s.bytes_per_second = speed_locked(now);

    // A finished file is already part of the batch offset; a failed one never is.
    bool file_closed = file_done || m_status == "failed";
    std::uint64_t current_contribution = file_closed ? 0 : s.file_bytes_uploaded;
    s.overall_bytes_uploaded = m_batch_offset + current_contribution;
    s.overall_total_bytes =
        m_batch_total > 0 ? m_batch_total : m_batch_offset + (file_done ? 0 : m_file_size);
    s.overall_bytes_uploaded = std::min(s.overall_bytes_uploaded, s.overall_total_bytes);
    s.overall_percent = percent_of(s.overall_bytes_uploaded, s.overall_total_bytes);
    return s;
}

progress_snapshot progress_aggregator::snapshot() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return snapshot_locked(m_now());
}

void progress_aggregator::publish() {
    if (!m_on_update)
        return;
    std::lock_guard<std::mutex> publish_lock(m_publish_mutex);
    progress_snapshot s = snapshot();
    m_on_update(s);
}
