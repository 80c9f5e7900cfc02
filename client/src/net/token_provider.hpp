#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

#include "net/http.hpp"

struct credentials {
    std::string client_id;
    std::string client_secret;
    std::string base_uri; // e.g. https://app.eu.action1.com/api/3.0
};

// Body of POST {base}/oauth2/token.
struct token_request {
    std::string client_id;
    std::string client_secret;

    void validate() const;
    nlohmann::json to_json() const;
};

// Owns the bearer token for one set of credentials. Safe to share between
// upload workers: a refresh happens under the lock, so callers either see the
// old token or the new one, never a half-written state.
class token_provider {
public:
    using clock = std::chrono::steady_clock;
    using now_function = std::function<clock::time_point()>;

    static constexpr std::chrono::seconds SAFETY_MARGIN{300};
    static constexpr std::chrono::seconds DEFAULT_LIFETIME{3300};

    token_provider(credentials creds, std::unique_ptr<http_transport> transport,
                   now_function now = nullptr);

    token_provider(const token_provider&) = delete;
    token_provider& operator=(const token_provider&) = delete;

    // Cached token unless `force` is set or the refresh deadline has passed.
    // Throws authentication_error; never retries.
    std::string get_token(bool force = false);

    // Drops the cached token so the next get_token() performs an exchange.
    void invalidate();

    bool has_valid_token() const;
    clock::time_point refresh_deadline() const;

    const credentials& creds() const {
        return m_credentials;
    }

private:
    credentials m_credentials;
    std::unique_ptr<http_transport> m_transport;
    now_function m_now;

    mutable std::mutex m_mutex;
    std::string m_token;
    clock::time_point m_refresh_deadline;

    bool valid_locked(clock::time_point now) const;
    void exchange_locked();
};
