#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class platform {
    windows_64,
    windows_32,
    windows_arm64,
    mac_apple_silicon,
    mac_intel_cpu,
};

// Wire name, e.g. "Windows_64" or "Mac_AppleSilicon".
const char* to_string(platform p);
std::optional<platform> parse_platform(const std::string& name);
std::vector<platform> all_platforms();

// Mac installers (.pkg, .dmg, .app.zip) default to Apple Silicon, everything
// else to 64-bit Windows.
platform default_platform_for(const std::string& file_path);

struct upload_target {
    std::string organization_id;
    std::string package_id;
    std::string version_id;
    platform target_platform = platform::windows_64;

    void validate() const;
};

// Snapshot of the file taken when its upload starts.
struct file_descriptor {
    std::string path; // absolute
    std::uint64_t size = 0;
    std::string display_name;
};

// Throws upload_error if the path is missing or not a regular file.
file_descriptor describe_file(const std::string& path);
