#include "upload/requests.hpp"

#include <stdexcept>

void upload_init_request::validate() const {
    target.validate();
    if (file_size == 0)
        throw std::invalid_argument("upload_init_request: file_size is zero");
}

std::string upload_init_request::endpoint() const {
    return "/software-repository/" + target.organization_id + "/" + target.package_id +
           "/versions/" + target.version_id + "/upload";
}

std::map<std::string, std::string> upload_init_request::query() const {
    return {{"platform", to_string(target.target_platform)}};
}

std::map<std::string, std::string> upload_init_request::headers() const {
    return {
        {"Accept", "*/*"},
        {"Content-Type", "application/json"},
        {"X-Upload-Content-Type", "application/octet-stream"},
        {"X-Upload-Content-Length", std::to_string(file_size)},
    };
}

void chunk_request::validate() const {
    if (session_url.empty())
        throw std::invalid_argument("chunk_request: session_url is empty");
    if (range.number == 0)
        throw std::invalid_argument("chunk_request: chunk numbers start at 1");
    if (range.end_inclusive < range.start || range.end_inclusive >= file_size)
        throw std::invalid_argument("chunk_request: range " + std::to_string(range.start) + "-" +
                                    std::to_string(range.end_inclusive) +
                                    " is outside the file of " + std::to_string(file_size) +
                                    " bytes");
}

std::string chunk_request::content_range() const {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end_inclusive) +
           "/" + std::to_string(file_size);
}

std::map<std::string, std::string> chunk_request::headers() const {
    return {
        {"Accept", "*/*"},
        {"Content-Type", "application/octet-stream"},
        {"Content-Range", content_range()},
    };
}

void finalize_request::validate() const {
    if (upload_id.empty())
        throw std::invalid_argument("finalize_request: upload_id is empty");
    if (file_name.empty())
        throw std::invalid_argument("finalize_request: file_name is empty");
    if (total_chunks == 0)
        throw std::invalid_argument("finalize_request: total_chunks is zero");
}

nlohmann::json finalize_request::to_json() const {
    return nlohmann::json{
        {"uploadId", upload_id}, {"fileName", file_name}, {"totalChunks", total_chunks}};
}
