#include "net/http.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <curl/curl.h>

#include "util/log.hpp"

constexpr const char* USER_AGENT = "swrepo-upload/1.0";

namespace {
// Body and header sinks share one shape: append whatever curl hands over.
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t");
    return str.substr(first, (last - first + 1));
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}
} // namespace

const std::string* http_transport::response::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end())
        return nullptr;
    return &it->second;
}

class http_client::impl {
public:
    impl() : curl_handle(nullptr), timeout_seconds(60) {
        ensure_curl_global_init();
        curl_handle = curl_easy_init();
        if (!curl_handle) {
            throw std::runtime_error("Failed to initialize curl handle");
        }

        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, write_callback);
        // A 308 from the upload service is a protocol signal, never a redirect
        curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl_handle, CURLOPT_MAXREDIRS, 0L);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_handle, CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        // Prefer HTTP/2 over TLS if available (falls back automatically)
        curl_easy_setopt(curl_handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

        curl_easy_setopt(curl_handle, CURLOPT_ACCEPT_ENCODING, "");
    }

    ~impl() {
        if (curl_handle) {
            curl_easy_cleanup(curl_handle);
        }
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    CURL* curl_handle;
    long timeout_seconds;
};

http_client::http_client() : pimpl(std::make_unique<impl>()) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
http_client& http_client::operator=(http_client&&) noexcept = default;

void http_client::set_timeout(long timeout_seconds) {
    pimpl->timeout_seconds = timeout_seconds;
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_TIMEOUT, timeout_seconds);
}

http_client::response http_client::perform(const request& req) {
    response resp;
    std::string response_body;
    std::string response_headers;
    CURL* curl = pimpl->curl_handle;

    print_request_details(req);

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);

    if (req.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, nullptr);
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        // POSTFIELDS carries the body for every non-GET verb; CUSTOMREQUEST
        // swaps the verb on the request line.
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(req.body.size()));
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST,
                         req.method == "POST" ? nullptr : req.method.c_str());
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : req.headers) {
        std::string header_string = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, header_string.c_str());
    }
    header_list = curl_slist_append(header_list, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl);

    // Clear headers from handle to avoid dangling pointer across requests
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        resp.error = curl_easy_strerror(res);
        LOG_DEBUG("http") << req.method << " " << req.url << " failed: " << resp.error;
        return resp;
    }

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    resp.status_code = static_cast<int>(status_code);

    resp.headers = parse_header_block(response_headers);
    resp.body = std::move(response_body);

    print_response_details(resp);

    return resp;
}

std::map<std::string, std::string> parse_header_block(const std::string& raw) {
    std::map<std::string, std::string> headers;
    std::istringstream stream(raw);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.rfind("HTTP/", 0) == 0) {
            headers.clear();
            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string header_name = trim(line.substr(0, colon_pos));
            std::string header_value = trim(line.substr(colon_pos + 1));

            headers[to_lower(header_name)] = header_value;
        }
    }
    return headers;
}

std::string loggable_header_value(const std::string& name, const std::string& value) {
    return to_lower(name) == "authorization" ? "<masked>" : value;
}

void http_client::print_request_details(const request& req) {
    if (!logging::enabled(logging::level::trace))
        return;
    LOG_TRACE("http") << "=> " << req.method << " " << req.url << " (" << req.body.size()
                      << " body bytes)";
    for (const auto& header : req.headers) {
        LOG_TRACE("http") << "   " << header.first << ": "
                          << loggable_header_value(header.first, header.second);
    }
}

void http_client::print_response_details(const response& resp) {
    if (!logging::enabled(logging::level::trace))
        return;
    LOG_TRACE("http") << "<= " << resp.status_code << " (" << resp.body.size() << " body bytes)";
    for (const auto& header : resp.headers) {
        LOG_TRACE("http") << "   " << header.first << ": " << header.second;
    }
}

transport_factory make_curl_transport_factory(long timeout_seconds) {
    return [timeout_seconds]() -> std::unique_ptr<http_transport> {
        auto client = std::make_unique<http_client>();
        client->set_timeout(timeout_seconds);
        return client;
    };
}
