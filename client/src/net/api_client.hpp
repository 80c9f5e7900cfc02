#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "net/http.hpp"
#include "net/token_provider.hpp"

// Authenticated JSON executor against the configured API base URI.
class api_client {
public:
    using query_params = std::map<std::string, std::string>;

    api_client(token_provider& tokens, std::unique_ptr<http_transport> transport);

    api_client(const api_client&) = delete;
    api_client& operator=(const api_client&) = delete;

    // Sends `body` as JSON (when present) and parses the response body as JSON.
    // An empty 2xx body yields a null json. Throws api_error on transport
    // failure, non-2xx status, or an unparsable 2xx body.
    nlohmann::json request(const std::string& endpoint, const std::string& method,
                           const std::optional<nlohmann::json>& body = std::nullopt,
                           const query_params& query = {});

    // Same authentication and URL building, but hands back the raw response so
    // the caller can interpret non-2xx protocol statuses (e.g. 308) itself.
    http_transport::response send(const std::string& endpoint, http_transport::request req,
                                  const query_params& query = {});

    // {base}/{endpoint}?k=v&..., with endpoint slashes normalized.
    std::string url_for(const std::string& endpoint, const query_params& query = {}) const;

    const std::string& base_uri() const {
        return m_tokens.creds().base_uri;
    }

    token_provider& tokens() {
        return m_tokens;
    }

    static std::string url_encode(const std::string& value);

private:
    token_provider& m_tokens;
    std::unique_ptr<http_transport> m_transport;
    std::mutex m_transport_mutex;
};
