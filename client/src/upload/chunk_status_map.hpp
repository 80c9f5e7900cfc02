#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class chunk_status {
    pending,
    uploading,
    complete,
    failed,
};

const char* to_string(chunk_status status);

// Status per chunk number for one parallel upload. Slots are assigned up front
// and never move, so workers writing their own chunk and the monitor reading
// every chunk need no shared lock. Transitions only go forward:
// pending -> uploading -> {complete | failed}.
class chunk_status_map {
public:
    struct counts {
        std::size_t pending = 0;
        std::size_t uploading = 0;
        std::size_t complete = 0;
        std::size_t failed = 0;

        std::size_t terminal() const {
            return complete + failed;
        }
    };

    explicit chunk_status_map(std::size_t total_chunks);

    chunk_status_map(const chunk_status_map&) = delete;
    chunk_status_map& operator=(const chunk_status_map&) = delete;

    // Each throws std::logic_error on a transition that is not forward.
    void mark_uploading(std::size_t chunk_number);
    void mark_complete(std::size_t chunk_number);
    void mark_failed(std::size_t chunk_number, const std::string& message);

    chunk_status status(std::size_t chunk_number) const;
    std::string error(std::size_t chunk_number) const;

    counts snapshot() const;
    bool all_terminal() const;

    std::size_t size() const {
        return m_slots.size();
    }

private:
    struct slot {
        std::atomic<chunk_status> status{chunk_status::pending};
        mutable std::mutex error_mutex;
        std::string error;
    };

    std::vector<std::unique_ptr<slot>> m_slots;

    slot& at(std::size_t chunk_number);
    const slot& at(std::size_t chunk_number) const;
    void transition(std::size_t chunk_number, chunk_status from, chunk_status to);
};
