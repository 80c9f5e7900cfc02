#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

// Anything that can execute one HTTP exchange. The upload engine only talks to
// this interface so tests can substitute a scripted server.
class http_transport {
public:
    struct response {
        int status_code;
        std::string body;
        std::map<std::string, std::string> headers; // names lower-cased
        std::string error;                          // transport failure text, status_code == 0

        response() : status_code(0) {}

        bool ok() const {
            return status_code >= 200 && status_code < 300;
        }
        const std::string* header(const std::string& name) const;
    };

    struct request {
        std::string method;
        std::string url;
        std::map<std::string, std::string> headers;
        std::string body;

        request(const std::string& url) : method("GET"), url(url) {}
        request(const std::string& method, const std::string& url) : method(method), url(url) {}
    };

    virtual ~http_transport() = default;

    virtual response perform(const request& req) = 0;
};

using transport_factory = std::function<std::unique_ptr<http_transport>()>;

class http_client : public http_transport {
public:
    http_client();
    ~http_client() override;

    // Disable copy constructor and assignment operator
    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;

    // Enable move constructor and assignment operator
    http_client(http_client&&) noexcept;
    http_client& operator=(http_client&&) noexcept;

    response perform(const request& req) override;

    // Whole-request timeout; 0 disables it
    void set_timeout(long timeout_seconds);

private:
    class impl;
    std::unique_ptr<impl> pimpl;

    void print_request_details(const request& req);
    void print_response_details(const response& resp);
};

// Parses a raw response header block into lower-cased names. Every status line
// restarts the block, so only the final response's headers survive interim
// ones such as "100 Continue".
std::map<std::string, std::string> parse_header_block(const std::string& raw);

// Value to print for a request header in trace output. Credentials are masked.
std::string loggable_header_value(const std::string& name, const std::string& value);

// Factory producing independent curl-backed clients with the given timeout.
transport_factory make_curl_transport_factory(long timeout_seconds);
