#include "net/token_provider.hpp"

#include <stdexcept>

#include "net/errors.hpp"
#include "util/log.hpp"

constexpr std::chrono::seconds token_provider::SAFETY_MARGIN;
constexpr std::chrono::seconds token_provider::DEFAULT_LIFETIME;

void token_request::validate() const {
    if (client_id.empty())
        throw std::invalid_argument("token_request: client_id is empty");
    if (client_secret.empty())
        throw std::invalid_argument("token_request: client_secret is empty");
}

nlohmann::json token_request::to_json() const {
    return nlohmann::json{{"client_id", client_id}, {"client_secret", client_secret}};
}

token_provider::token_provider(credentials creds, std::unique_ptr<http_transport> transport,
                               now_function now)
    : m_credentials(std::move(creds)), m_transport(std::move(transport)), m_now(std::move(now)) {
    if (!m_now)
        m_now = [] { return clock::now(); };
}

std::string token_provider::get_token(bool force) {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (force || !valid_locked(m_now())) {
        exchange_locked();
    }
    return m_token;
}

void token_provider::invalidate() {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_token.clear();
}

bool token_provider::has_valid_token() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return valid_locked(m_now());
}

token_provider::clock::time_point token_provider::refresh_deadline() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_refresh_deadline;
}

bool token_provider::valid_locked(clock::time_point now) const {
    return !m_token.empty() && now < m_refresh_deadline;
}

void token_provider::exchange_locked() {
    if (m_credentials.base_uri.empty()) {
        throw authentication_error("No API base URI configured");
    }
    token_request body{m_credentials.client_id, m_credentials.client_secret};
    try {
        body.validate();
    } catch (const std::invalid_argument& e) {
        throw authentication_error(std::string("Missing client credentials: ") + e.what());
    }
    if (!m_transport) {
        throw authentication_error("No HTTP transport for token exchange");
    }

    LOG_DEBUG("auth") << "Requesting access token from " << m_credentials.base_uri;

    http_transport::request req("POST", m_credentials.base_uri + "/oauth2/token");
    req.headers["Content-Type"] = "application/json";
    req.headers["Accept"] = "application/json";
    req.body = body.to_json().dump();

    auto requested_at = m_now();
    auto resp = m_transport->perform(req);
    if (!resp.ok()) {
        throw authentication_error(
            describe_http_failure("Token exchange failed", resp.status_code, resp.body, resp.error),
            resp.status_code, resp.body);
    }

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw authentication_error(std::string("Token response is not JSON: ") + e.what(),
                                   resp.status_code, resp.body);
    }

    auto token_it = data.find("access_token");
    if (!data.is_object() || token_it == data.end() || !token_it->is_string() ||
        token_it->get<std::string>().empty()) {
        throw authentication_error("Token response has no access_token", resp.status_code,
                                   resp.body);
    }

    std::chrono::seconds lifetime = DEFAULT_LIFETIME;
    auto expires_it = data.find("expires_in");
    if (expires_it != data.end() && expires_it->is_number()) {
        auto expires_in = std::chrono::seconds(expires_it->get<long long>());
        lifetime = expires_in > SAFETY_MARGIN ? expires_in - SAFETY_MARGIN : std::chrono::seconds(0);
    }

    m_token = token_it->get<std::string>();
    m_refresh_deadline = requested_at + lifetime;

    LOG_INFO("auth") << "Authentication successful (token valid for " << lifetime.count()
                     << "s)";
}
