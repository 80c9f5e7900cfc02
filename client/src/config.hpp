#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "net/token_provider.hpp"
#include "upload/multi_file_coordinator.hpp"
#include "upload/upload_orchestrator.hpp"
#include "upload/upload_target.hpp"
#include "util/log.hpp"

struct app_config {
    credentials creds;
    std::string region;
    upload_target target;
    std::vector<file_upload_request> files;
    std::uint64_t chunk_mb = 24;
    std::size_t max_parallel = 4;
    bool allow_parallel = true;
    long chunk_timeout_minutes = 30;
    std::string env_file = ".env";
    logging::level log_level = logging::level::info;
    bool show_help = false;

    upload_options make_upload_options() const;
};

using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

constexpr std::uint64_t MIN_CHUNK_MB = 5;
constexpr std::uint64_t MAX_CHUNK_MB = 100;
constexpr std::size_t MAX_PARALLEL = 16;
constexpr long MAX_TIMEOUT_MINUTES = 24 * 60;

// Flags first, then the process environment, then the dotenv file. Throws
// std::invalid_argument / std::runtime_error with a readable message.
app_config parse_arguments(int argc, char* argv[], const env_lookup& env);

// KEY=VALUE lines; '#' comments, "export " prefixes and surrounding quotes
// are accepted. A missing file yields an empty map.
std::map<std::string, std::string> load_env_file(const std::string& path);

// Europe, NorthAmerica, Australia and their short aliases.
std::optional<std::string> base_uri_for_region(const std::string& region);

// Reads the real process environment.
env_lookup process_environment();

std::string usage_text(const std::string& program);
