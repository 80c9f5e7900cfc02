#include "upload/upload_target.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "net/errors.hpp"

namespace {
std::string to_lower_copy(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

const char* to_string(platform p) {
    switch (p) {
    case platform::windows_64:
        return "Windows_64";
    case platform::windows_32:
        return "Windows_32";
    case platform::windows_arm64:
        return "Windows_ARM64";
    case platform::mac_apple_silicon:
        return "Mac_AppleSilicon";
    case platform::mac_intel_cpu:
        return "Mac_IntelCPU";
    }
    return "Windows_64";
}

std::vector<platform> all_platforms() {
    return {platform::windows_64, platform::windows_32, platform::windows_arm64,
            platform::mac_apple_silicon, platform::mac_intel_cpu};
}

std::optional<platform> parse_platform(const std::string& name) {
    std::string wanted = to_lower_copy(name);
    for (platform p : all_platforms()) {
        if (to_lower_copy(to_string(p)) == wanted)
            return p;
    }
    return std::nullopt;
}

platform default_platform_for(const std::string& file_path) {
    std::string lower = to_lower_copy(file_path);
    if (ends_with(lower, ".pkg") || ends_with(lower, ".dmg") || ends_with(lower, ".app.zip"))
        return platform::mac_apple_silicon;
    return platform::windows_64;
}

void upload_target::validate() const {
    if (organization_id.empty())
        throw std::invalid_argument("upload_target: organization_id is empty");
    if (package_id.empty())
        throw std::invalid_argument("upload_target: package_id is empty");
    if (version_id.empty())
        throw std::invalid_argument("upload_target: version_id is empty");
}

file_descriptor describe_file(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path p = fs::absolute(path, ec);
    if (ec)
        throw upload_error("Cannot resolve path " + path + ": " + ec.message());

    if (!fs::is_regular_file(p, ec))
        throw upload_error("File not found: " + path);

    auto size = fs::file_size(p, ec);
    if (ec)
        throw upload_error("Cannot read size of " + path + ": " + ec.message());

    file_descriptor fd;
    fd.path = p.string();
    fd.size = static_cast<std::uint64_t>(size);
    fd.display_name = p.filename().string();
    return fd;
}
