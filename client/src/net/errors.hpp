#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Base of everything the upload engine throws at its caller.
class upload_error : public std::runtime_error {
public:
    explicit upload_error(const std::string& message) : std::runtime_error(message) {}
};

// Missing credentials or a failed client-credential exchange.
class authentication_error : public upload_error {
public:
    explicit authentication_error(const std::string& message, int status_code = 0,
                                  std::string body = "")
        : upload_error(message), m_status_code(status_code), m_body(std::move(body)) {}

    int status_code() const {
        return m_status_code;
    }
    const std::string& body() const {
        return m_body;
    }

private:
    int m_status_code;
    std::string m_body;
};

// Non-2xx (or transport failure, status 0) from a generic API call.
class api_error : public upload_error {
public:
    api_error(const std::string& message, int status_code, std::string body)
        : upload_error(message), m_status_code(status_code), m_body(std::move(body)) {}

    int status_code() const {
        return m_status_code;
    }
    const std::string& body() const {
        return m_body;
    }

private:
    int m_status_code;
    std::string m_body;
};

// Session initialization did not answer 308 with an X-Upload-Location.
class upload_init_error : public upload_error {
public:
    upload_init_error(const std::string& message, int status_code, std::string body)
        : upload_error(message), m_status_code(status_code), m_body(std::move(body)) {}

    int status_code() const {
        return m_status_code;
    }
    const std::string& body() const {
        return m_body;
    }

private:
    int m_status_code;
    std::string m_body;
};

// A chunk PUT answered outside {308, 200, 201, 204}.
class chunk_upload_error : public upload_error {
public:
    chunk_upload_error(std::size_t chunk_number, int status_code, std::string body,
                       const std::string& detail = "");

    std::size_t chunk_number() const {
        return m_chunk_number;
    }
    int status_code() const {
        return m_status_code;
    }
    const std::string& body() const {
        return m_body;
    }

private:
    std::size_t m_chunk_number;
    int m_status_code;
    std::string m_body;
};

// One or more chunks of a parallel upload failed. Nothing was finalized.
class aggregate_chunk_failure : public upload_error {
public:
    struct failed_chunk {
        std::size_t chunk_number;
        std::string message;
    };

    explicit aggregate_chunk_failure(std::vector<failed_chunk> failures);

    const std::vector<failed_chunk>& failures() const {
        return m_failures;
    }

private:
    std::vector<failed_chunk> m_failures;
};

// Builds "<what> (HTTP <status>): <body>" with the body shortened for display.
std::string describe_http_failure(const std::string& what, int status_code,
                                  const std::string& body, const std::string& transport_error = "");
