#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "net/http.hpp"

namespace testing_support {

struct recorded_request {
    std::string method;
    std::string url;
    std::map<std::string, std::string> headers;
    std::size_t body_size{};
    std::string body; // kept only for small bodies
};

// Thread-safe scripted HTTP peer. Every transport it hands out forwards to
// the same handler and is recorded in arrival order.
class fake_server {
public:
    using handler = std::function<http_transport::response(const http_transport::request&)>;

    explicit fake_server(handler h);

    http_transport::response handle(const http_transport::request& req);

    std::unique_ptr<http_transport> transport();
    transport_factory factory();

    std::vector<recorded_request> requests() const;
    std::vector<recorded_request> requests_with_method(const std::string& method) const;
    std::size_t transports_created() const { return m_transports_created.load(); }

private:
    handler m_handler;
    mutable std::mutex m_mutex;
    std::vector<recorded_request> m_requests;
    std::atomic<std::size_t> m_transports_created{0};
};

http_transport::response make_response(int status, std::string body = "",
                                       std::map<std::string, std::string> headers = {});

struct content_range {
    std::uint64_t start{};
    std::uint64_t end{};
    std::uint64_t total{};
};

// Parses "bytes a-b/n". Returns false on a malformed value.
bool parse_content_range(const std::string& value, content_range& out);

// Behaviour of a well-formed upload service: token endpoint, 308
// initialization, chunk PUTs and finalize. `chunk_status` decides the PUT
// status from the range and session URL; the default accepts with 308 and
// answers 200 on the chunk that reaches the end of the file.
struct upload_service_script {
    std::string token = "token-1";
    int expires_in = 3600;
    std::function<std::string(std::uint64_t file_size)> location =
        [](std::uint64_t) { return std::string("/API/upload-sessions/session-1?upload_id=session-1"); };
    std::function<int(const content_range&, const std::string& url)> chunk_status;
    std::chrono::milliseconds chunk_delay{0};
};

fake_server::handler make_upload_service(upload_service_script script);

// Creates a file of `size` bytes in the temp directory and removes it on
// destruction. Sparse files are fine; content is a repeating pattern only
// when `patterned` is set.
class temp_file {
public:
    temp_file(const std::string& name, std::uint64_t size, bool patterned = false);
    ~temp_file();

    temp_file(const temp_file&) = delete;
    temp_file& operator=(const temp_file&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string string() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

// Manually advanced steady clock for token and progress tests.
struct manual_clock {
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point() + std::chrono::hours(1);

    std::function<std::chrono::steady_clock::time_point()> function() {
        return [this]() { return now; };
    }
};

constexpr std::uint64_t MB = 1024ULL * 1024ULL;

} // namespace testing_support
