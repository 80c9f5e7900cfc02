#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include "net/http.hpp"
#include "net/token_provider.hpp"
#include "upload/chunk_planner.hpp"

enum class chunk_outcome {
    continue_upload, // 308: accepted, send the next chunk
    completed,       // 200/201/204: the service has the whole file
};

struct chunk_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds elapsed{0};
    chunk_outcome outcome = chunk_outcome::continue_upload;
};

class chunk_transmitter {
public:
    // Called from the sending thread while the PUT is in flight.
    using waiting_callback = std::function<void(std::chrono::milliseconds elapsed)>;

    chunk_transmitter(http_transport& transport, token_provider& tokens,
                      std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200));

    chunk_transmitter(const chunk_transmitter&) = delete;
    chunk_transmitter& operator=(const chunk_transmitter&) = delete;

    // PUTs the chunk with its Content-Range. Throws chunk_upload_error for any
    // status outside {308, 200, 201, 204}, including transport failures.
    chunk_response send(const std::string& session_url, const chunk& c, std::uint64_t file_size,
                        const waiting_callback& on_waiting = nullptr);

    // Throws chunk_upload_error for statuses that are neither continue nor done.
    static chunk_outcome classify(std::size_t chunk_number, int status_code,
                                  const std::string& body, const std::string& transport_error = "");

private:
    http_transport& m_transport;
    token_provider& m_tokens;
    std::chrono::milliseconds m_poll_interval;
};
