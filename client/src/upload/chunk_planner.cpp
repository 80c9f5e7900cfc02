#include "upload/chunk_planner.hpp"

#include <algorithm>
#include <stdexcept>

#include "net/errors.hpp"

constexpr std::uint64_t chunk_planner::DEFAULT_CHUNK_SIZE;

std::size_t chunk_planner::count(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0)
        throw std::invalid_argument("chunk size must be positive");
    return static_cast<std::size_t>((file_size + chunk_size - 1) / chunk_size);
}

std::vector<chunk_range> chunk_planner::plan(std::uint64_t file_size, std::uint64_t chunk_size) {
    std::vector<chunk_range> ranges;
    std::size_t total = count(file_size, chunk_size);
    ranges.reserve(total);

    std::uint64_t offset = 0;
    for (std::size_t i = 1; i <= total; ++i) {
        std::uint64_t size = std::min<std::uint64_t>(chunk_size, file_size - offset);
        ranges.push_back({i, offset, offset + size - 1});
        offset += size;
    }
    return ranges;
}

chunk_reader::chunk_reader(const std::string& path)
    : m_path(path), m_stream(path, std::ios::binary) {
    if (!m_stream.is_open())
        throw upload_error("Failed to open file for reading: " + path);
}

chunk chunk_reader::read(const chunk_range& range) {
    chunk c;
    c.range = range;
    c.payload.resize(static_cast<std::size_t>(range.length()));

    m_stream.clear();
    m_stream.seekg(static_cast<std::streamoff>(range.start), std::ios::beg);
    m_stream.read(&c.payload[0], static_cast<std::streamsize>(c.payload.size()));
    if (static_cast<std::uint64_t>(m_stream.gcount()) != range.length()) {
        throw upload_error("Short read of chunk " + std::to_string(range.number) + " from " +
                           m_path + " (file changed during upload?)");
    }
    return c;
}

void chunk_reader::close() {
    if (m_stream.is_open())
        m_stream.close();
}
