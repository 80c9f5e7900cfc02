#include "upload/chunk_status_map.hpp"

#include <stdexcept>

const char* to_string(chunk_status status) {
    switch (status) {
    case chunk_status::pending:
        return "pending";
    case chunk_status::uploading:
        return "uploading";
    case chunk_status::complete:
        return "complete";
    case chunk_status::failed:
        return "failed";
    }
    return "unknown";
}

chunk_status_map::chunk_status_map(std::size_t total_chunks) {
    m_slots.reserve(total_chunks);
    for (std::size_t i = 0; i < total_chunks; ++i)
        m_slots.push_back(std::make_unique<slot>());
}

chunk_status_map::slot& chunk_status_map::at(std::size_t chunk_number) {
    if (chunk_number == 0 || chunk_number > m_slots.size())
        throw std::out_of_range("no status slot for chunk " + std::to_string(chunk_number));
    return *m_slots[chunk_number - 1];
}

const chunk_status_map::slot& chunk_status_map::at(std::size_t chunk_number) const {
    if (chunk_number == 0 || chunk_number > m_slots.size())
        throw std::out_of_range("no status slot for chunk " + std::to_string(chunk_number));
    return *m_slots[chunk_number - 1];
}

void chunk_status_map::transition(std::size_t chunk_number, chunk_status from, chunk_status to) {
    chunk_status expected = from;
    if (!at(chunk_number).status.compare_exchange_strong(expected, to)) {
        throw std::logic_error("chunk " + std::to_string(chunk_number) + " cannot move from " +
                               to_string(expected) + " to " + to_string(to));
    }
}

void chunk_status_map::mark_uploading(std::size_t chunk_number) {
    transition(chunk_number, chunk_status::pending, chunk_status::uploading);
}

void chunk_status_map::mark_complete(std::size_t chunk_number) {
    transition(chunk_number, chunk_status::uploading, chunk_status::complete);
}

void chunk_status_map::mark_failed(std::size_t chunk_number, const std::string& message) {
    slot& s = at(chunk_number);
    {
        std::lock_guard<std::mutex> lk(s.error_mutex);
        s.error = message;
    }
    transition(chunk_number, chunk_status::uploading, chunk_status::failed);
}

chunk_status chunk_status_map::status(std::size_t chunk_number) const {
    return at(chunk_number).status.load();
}

std::string chunk_status_map::error(std::size_t chunk_number) const {
    const slot& s = at(chunk_number);
    std::lock_guard<std::mutex> lk(s.error_mutex);
    return s.error;
}

chunk_status_map::counts chunk_status_map::snapshot() const {
    counts c;
    for (const auto& s : m_slots) {
        switch (s->status.load()) {
        case chunk_status::pending:
            ++c.pending;
            break;
        case chunk_status::uploading:
            ++c.uploading;
            break;
        case chunk_status::complete:
            ++c.complete;
            break;
        case chunk_status::failed:
            ++c.failed;
            break;
        }
    }
    return c;
}

bool chunk_status_map::all_terminal() const {
    for (const auto& s : m_slots) {
        auto st = s->status.load();
        if (st != chunk_status::complete && st != chunk_status::failed)
            return false;
    }
    return true;
}
