#include "net/errors.hpp"

#include <sstream>

namespace {
constexpr std::size_t MAX_BODY_IN_MESSAGE = 512;

std::string summarize_failures(const std::vector<aggregate_chunk_failure::failed_chunk>& failures) {
    std::ostringstream oss;
    oss << failures.size() << " chunk(s) failed:";
    for (const auto& failure : failures) {
        oss << " [chunk " << failure.chunk_number << ": " << failure.message << "]";
    }
    return oss.str();
}
} // namespace

std::string describe_http_failure(const std::string& what, int status_code,
                                  const std::string& body, const std::string& transport_error) {
    std::ostringstream oss;
    oss << what;
    if (status_code == 0) {
        oss << " (transport error";
        if (!transport_error.empty())
            oss << ": " << transport_error;
        oss << ")";
        return oss.str();
    }
    oss << " (HTTP " << status_code << ")";
    if (!body.empty()) {
        oss << ": ";
        if (body.size() > MAX_BODY_IN_MESSAGE)
            oss << body.substr(0, MAX_BODY_IN_MESSAGE) << "...";
        else
            oss << body;
    }
    return oss.str();
}

chunk_upload_error::chunk_upload_error(std::size_t chunk_number, int status_code, std::string body,
                                       const std::string& detail)
    : upload_error(describe_http_failure("Chunk " + std::to_string(chunk_number) +
                                             " upload failed",
                                         status_code, body, detail)),
      m_chunk_number(chunk_number), m_status_code(status_code), m_body(std::move(body)) {}

aggregate_chunk_failure::aggregate_chunk_failure(std::vector<failed_chunk> failures)
    : upload_error(summarize_failures(failures)), m_failures(std::move(failures)) {}
