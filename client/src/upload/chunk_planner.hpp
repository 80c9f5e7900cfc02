#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

struct chunk_range {
    std::size_t number;          // 1-based
    std::uint64_t start;
    std::uint64_t end_inclusive; // Content-Range end is inclusive

    std::uint64_t length() const {
        return end_inclusive - start + 1;
    }
};

struct chunk {
    chunk_range range;
    std::string payload;
};

class chunk_planner {
public:
    static constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 24ULL * 1024ULL * 1024ULL;

    // Ordered ranges covering [0, file_size) exactly once. Empty for an empty
    // file. Throws std::invalid_argument for a zero chunk size.
    static std::vector<chunk_range> plan(std::uint64_t file_size, std::uint64_t chunk_size);

    static std::size_t count(std::uint64_t file_size, std::uint64_t chunk_size);
};

// Reads planned ranges out of a file opened for the duration of an upload.
class chunk_reader {
public:
    explicit chunk_reader(const std::string& path);

    chunk_reader(const chunk_reader&) = delete;
    chunk_reader& operator=(const chunk_reader&) = delete;

    // Throws upload_error if the file ends before the range does.
    chunk read(const chunk_range& range);

    void close();

private:
    std::string m_path;
    std::ifstream m_stream;
};
