#include "upload/chunk_transmitter.hpp"

#include <future>

#include "net/errors.hpp"
#include "upload/requests.hpp"
#include "util/log.hpp"

chunk_transmitter::chunk_transmitter(http_transport& transport, token_provider& tokens,
                                     std::chrono::milliseconds poll_interval)
    : m_transport(transport), m_tokens(tokens), m_poll_interval(poll_interval) {}

chunk_outcome chunk_transmitter::classify(std::size_t chunk_number, int status_code,
                                          const std::string& body,
                                          const std::string& transport_error) {
    switch (status_code) {
    case 308:
        return chunk_outcome::continue_upload;
    case 200:
    case 201:
    case 204:
        return chunk_outcome::completed;
    default:
        throw chunk_upload_error(chunk_number, status_code, body, transport_error);
    }
}

chunk_response chunk_transmitter::send(const std::string& session_url, const chunk& c,
                                       std::uint64_t file_size,
                                       const waiting_callback& on_waiting) {
    chunk_request put{session_url, c.range, file_size};
    put.validate();

    http_transport::request req("PUT", session_url);
    req.headers = put.headers();
    req.headers["Authorization"] = "Bearer " + m_tokens.get_token();
    req.body = c.payload;

    LOG_DEBUG("chunk") << "PUT chunk " << c.range.number << " " << put.content_range();

    using clock = std::chrono::steady_clock;
    auto started = clock::now();
    auto pending = std::async(std::launch::async, [this, &req]() { return m_transport.perform(req); });

    while (pending.wait_for(m_poll_interval) != std::future_status::ready) {
        if (on_waiting)
            on_waiting(std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started));
    }
    auto resp = pending.get();

    chunk_response result;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
    result.outcome = classify(c.range.number, resp.status_code, resp.body, resp.error);
    result.status_code = resp.status_code;
    result.headers = std::move(resp.headers);
    result.body = std::move(resp.body);

    LOG_DEBUG("chunk") << "Chunk " << c.range.number << " answered " << result.status_code
                       << " after " << result.elapsed.count() << "ms";
    return result;
}
