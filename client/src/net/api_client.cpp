#include "net/api_client.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

#include "net/errors.hpp"
#include "util/log.hpp"

api_client::api_client(token_provider& tokens, std::unique_ptr<http_transport> transport)
    : m_tokens(tokens), m_transport(std::move(transport)) {}

std::string api_client::url_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string api_client::url_for(const std::string& endpoint, const query_params& query) const {
    std::string url = base_uri();
    while (!url.empty() && url.back() == '/')
        url.pop_back();

    std::string path = endpoint;
    if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
        url = path;
    } else {
        if (path.empty() || path.front() != '/')
            path.insert(path.begin(), '/');
        url += path;
    }

    bool first = url.find('?') == std::string::npos;
    for (const auto& param : query) {
        url += first ? '?' : '&';
        first = false;
        url += url_encode(param.first) + "=" + url_encode(param.second);
    }
    return url;
}

http_transport::response api_client::send(const std::string& endpoint,
                                          http_transport::request req, const query_params& query) {
    req.url = url_for(endpoint, query);
    req.headers["Authorization"] = "Bearer " + m_tokens.get_token();
    if (req.headers.find("Accept") == req.headers.end())
        req.headers["Accept"] = "application/json";

    LOG_DEBUG("api") << req.method << " " << req.url;

    std::lock_guard<std::mutex> lk(m_transport_mutex);
    return m_transport->perform(req);
}

nlohmann::json api_client::request(const std::string& endpoint, const std::string& method,
                                   const std::optional<nlohmann::json>& body,
                                   const query_params& query) {
    http_transport::request req(method, "");
    if (body) {
        req.headers["Content-Type"] = "application/json; charset=utf-8";
        req.body = body->dump();
    }

    auto resp = send(endpoint, std::move(req), query);
    if (!resp.ok()) {
        throw api_error(describe_http_failure(method + " " + endpoint + " failed", resp.status_code,
                                              resp.body, resp.error),
                        resp.status_code, resp.body);
    }

    if (resp.body.empty())
        return nullptr;

    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw api_error(method + " " + endpoint + " returned invalid JSON: " + e.what(),
                        resp.status_code, resp.body);
    }
}
