#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

#include "upload/chunk_planner.hpp"
#include "upload/upload_target.hpp"

// POST software-repository/{org}/{package}/versions/{version}/upload?platform=...
struct upload_init_request {
    upload_target target;
    std::uint64_t file_size = 0;

    void validate() const;
    std::string endpoint() const;
    std::map<std::string, std::string> query() const;
    std::map<std::string, std::string> headers() const;
};

// PUT {session_url} carrying one chunk.
struct chunk_request {
    std::string session_url;
    chunk_range range;
    std::uint64_t file_size = 0;

    void validate() const;
    std::string content_range() const; // "bytes {start}-{end}/{size}"
    std::map<std::string, std::string> headers() const;
};

// POST {endpoint}/finalize
struct finalize_request {
    std::string upload_id;
    std::string file_name;
    std::size_t total_chunks = 0;

    void validate() const;
    nlohmann::json to_json() const;
};
