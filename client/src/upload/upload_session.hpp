#pragma once

#include <cstdint>
#include <string>

#include "net/api_client.hpp"
#include "upload/upload_target.hpp"

struct upload_session_info {
    std::string url; // absolute session URL every chunk is PUT to
    std::string endpoint; // initialization path, base of the finalize call
    upload_target target;
    std::uint64_t file_size = 0;

    // upload_id / uploadId query parameter, else the last path segment of url.
    std::string upload_id() const;
};

class upload_session {
public:
    explicit upload_session(api_client& api) : m_api(api) {}

    // Negotiates a resumable session. The service must answer 308 with an
    // X-Upload-Location header; anything else throws upload_init_error.
    upload_session_info initialize(const upload_target& target, std::uint64_t file_size);

    // Absolute locations pass through. Relative ones are resolved against the
    // origin of `base_uri`, with a leading /API/ rewritten to /api/3.0/.
    static std::string normalize_location(const std::string& base_uri,
                                          const std::string& location);

    // scheme://host[:port] of a URL, empty if it has no scheme.
    static std::string origin_of(const std::string& url);

private:
    api_client& m_api;
};
