#include "fake_transport.hpp"

#include <fstream>
#include <stdexcept>
#include <thread>

namespace testing_support {

namespace {

    class forwarding_transport : public http_transport {
    public:
        explicit forwarding_transport(fake_server& server) : m_server(server) {}

        response perform(const request& req) override { return m_server.handle(req); }

    private:
        fake_server& m_server;
    };

    constexpr std::size_t MAX_RECORDED_BODY = 4096;

} // namespace

fake_server::fake_server(handler h) : m_handler(std::move(h)) {}

http_transport::response fake_server::handle(const http_transport::request& req) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        recorded_request rec;
        rec.method = req.method;
        rec.url = req.url;
        rec.headers = req.headers;
        rec.body_size = req.body.size();
        if (req.body.size() <= MAX_RECORDED_BODY) {
            rec.body = req.body;
        }
        m_requests.push_back(std::move(rec));
    }
    return m_handler(req);
}

std::unique_ptr<http_transport> fake_server::transport() {
    ++m_transports_created;
    return std::make_unique<forwarding_transport>(*this);
}

transport_factory fake_server::factory() {
    return [this]() { return transport(); };
}

std::vector<recorded_request> fake_server::requests() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requests;
}

std::vector<recorded_request> fake_server::requests_with_method(const std::string& method) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<recorded_request> out;
    for (const auto& rec : m_requests) {
        if (rec.method == method) {
            out.push_back(rec);
        }
    }
    return out;
}

http_transport::response make_response(int status, std::string body,
                                       std::map<std::string, std::string> headers) {
    http_transport::response resp;
    resp.status_code = status;
    resp.body = std::move(body);
    for (const auto& header : headers) {
        std::string name = header.first;
        for (auto& c : name) {
            c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        }
        resp.headers[name] = header.second;
    }
    return resp;
}

bool parse_content_range(const std::string& value, content_range& out) {
    const std::string prefix = "bytes ";
    if (value.rfind(prefix, 0) != 0) {
        return false;
    }
    const auto dash = value.find('-', prefix.size());
    const auto slash = value.find('/', prefix.size());
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) {
        return false;
    }
    try {
        out.start = std::stoull(value.substr(prefix.size(), dash - prefix.size()));
        out.end = std::stoull(value.substr(dash + 1, slash - dash - 1));
        out.total = std::stoull(value.substr(slash + 1));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

fake_server::handler make_upload_service(upload_service_script script) {
    return [script](const http_transport::request& req) -> http_transport::response {
        if (req.method == "POST" && req.url.find("/oauth2/token") != std::string::npos) {
            return make_response(200, "{\"access_token\":\"" + script.token +
                                          "\",\"expires_in\":" + std::to_string(script.expires_in) +
                                          ",\"token_type\":\"Bearer\"}");
        }
        if (req.method == "POST" && req.url.find("/upload/finalize") != std::string::npos) {
            return make_response(200, "{\"status\":\"finalized\"}");
        }
        if (req.method == "POST" && req.url.find("/upload?") != std::string::npos) {
            const auto it = req.headers.find("X-Upload-Content-Length");
            const std::uint64_t size = it == req.headers.end() ? 0 : std::stoull(it->second);
            return make_response(308, "", {{"X-Upload-Location", script.location(size)}});
        }
        if (req.method == "PUT") {
            if (script.chunk_delay.count() > 0) {
                std::this_thread::sleep_for(script.chunk_delay);
            }
            content_range range;
            const auto it = req.headers.find("Content-Range");
            if (it == req.headers.end() || !parse_content_range(it->second, range)) {
                return make_response(400, "bad Content-Range");
            }
            if (range.end - range.start + 1 != req.body.size()) {
                return make_response(400, "body length does not match Content-Range");
            }
            if (script.chunk_status) {
                return make_response(script.chunk_status(range, req.url));
            }
            return make_response(range.end + 1 == range.total ? 200 : 308);
        }
        return make_response(404, "no route for " + req.method + " " + req.url);
    };
}

temp_file::temp_file(const std::string& name, std::uint64_t size, bool patterned)
    : m_path(std::filesystem::temp_directory_path() / ("swrepo_test_" + name)) {
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
    {
        std::ofstream out(m_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot create " + m_path.string());
        }
        if (patterned) {
            for (std::uint64_t i = 0; i < size; ++i) {
                out.put(static_cast<char>(i % 251));
            }
        }
    }
    if (!patterned) {
        std::filesystem::resize_file(m_path, size);
    }
}

temp_file::~temp_file() {
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
}

} // namespace testing_support
