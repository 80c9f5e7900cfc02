#include "upload/upload_session.hpp"

#include <stdexcept>

#include "net/errors.hpp"
#include "upload/requests.hpp"
#include "util/log.hpp"

namespace {
constexpr int STATUS_RESUME_INCOMPLETE = 308;

std::string query_value(const std::string& url, const std::string& key) {
    auto qpos = url.find('?');
    if (qpos == std::string::npos)
        return "";
    std::string query = url.substr(qpos + 1);
    auto hash = query.find('#');
    if (hash != std::string::npos)
        query.resize(hash);

    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == key)
            return pair.substr(eq + 1);
        if (amp == std::string::npos)
            break;
        pos = amp + 1;
    }
    return "";
}
} // namespace

std::string upload_session_info::upload_id() const {
    for (const char* key : {"upload_id", "uploadId"}) {
        std::string value = query_value(url, key);
        if (!value.empty())
            return value;
    }

    std::string path = url.substr(0, url.find('?'));
    while (!path.empty() && path.back() == '/')
        path.pop_back();
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string upload_session::origin_of(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        return "";
    auto path_start = url.find('/', scheme_end + 3);
    return path_start == std::string::npos ? url : url.substr(0, path_start);
}

std::string upload_session::normalize_location(const std::string& base_uri,
                                               const std::string& location) {
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0)
        return location;

    std::string loc = location;
    if (loc.rfind("/API/", 0) == 0)
        loc = "/api/3.0/" + loc.substr(5);

    std::string origin = origin_of(base_uri);
    if (!loc.empty() && loc.front() == '/')
        return origin + loc;
    return origin + "/" + loc;
}

upload_session_info upload_session::initialize(const upload_target& target,
                                               std::uint64_t file_size) {
    upload_init_request init{target, file_size};
    init.validate();

    LOG_INFO("session") << "Initializing upload for platform " << to_string(target.target_platform)
                        << " (" << file_size << " bytes)";

    http_transport::request req("POST", "");
    req.headers = init.headers();
    req.body = "{}";

    auto resp = m_api.send(init.endpoint(), std::move(req), init.query());
    if (resp.status_code != STATUS_RESUME_INCOMPLETE) {
        throw upload_init_error(describe_http_failure("Upload initialization failed (expected 308)",
                                                      resp.status_code, resp.body, resp.error),
                                resp.status_code, resp.body);
    }

    const std::string* location = resp.header("X-Upload-Location");
    if (!location || location->empty()) {
        throw upload_init_error("Upload initialization returned 308 without X-Upload-Location",
                                resp.status_code, resp.body);
    }

    upload_session_info info;
    info.url = normalize_location(m_api.base_uri(), *location);
    info.endpoint = init.endpoint();
    info.target = target;
    info.file_size = file_size;

    LOG_DEBUG("session") << "Upload URL: " << info.url;
    return info;
}
