#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "util/byte_utils.hpp"

namespace {
std::string to_lower_copy(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::uint64_t parse_unsigned(const std::string& flag, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; }))
        throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(flag + " value is out of range: " + value);
    }
}

std::string platform_names() {
    std::string names;
    for (platform p : all_platforms()) {
        if (!names.empty())
            names += ", ";
        names += to_string(p);
    }
    return names;
}
} // namespace

upload_options app_config::make_upload_options() const {
    upload_options opts;
    opts.chunk_size = chunk_mb * byte_utils::MiB;
    opts.max_parallel = max_parallel;
    opts.allow_parallel = allow_parallel;
    return opts;
}

std::optional<std::string> base_uri_for_region(const std::string& region) {
    std::string r = to_lower_copy(trim(region));
    if (r == "europe" || r == "eu")
        return std::string("https://app.eu.action1.com/api/3.0");
    if (r == "northamerica" || r == "north_america" || r == "na" || r == "us" || r == "global")
        return std::string("https://app.action1.com/api/3.0");
    if (r == "australia" || r == "au")
        return std::string("https://app.au.action1.com/api/3.0");
    return std::nullopt;
}

std::map<std::string, std::string> load_env_file(const std::string& path) {
    std::map<std::string, std::string> values;
    std::ifstream in(path);
    if (!in.is_open())
        return values;

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#')
            continue;
        if (line.rfind("export ", 0) == 0)
            line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty())
            values[key] = value;
    }
    return values;
}

env_lookup process_environment() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    };
}

std::string usage_text(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage:\n"
        << "  " << program << " --file PATH [--platform NAME] [--file PATH ...] [options]\n\n"
        << "Options:\n"
        << "  --file PATH             Installer to upload (repeatable)\n"
        << "  --platform NAME         Platform of the preceding --file (" << platform_names()
        << ")\n"
        << "  --org ID                Organization id (env ACTION1_ORG_ID)\n"
        << "  --package ID            Repository package id (env ACTION1_PACKAGE_ID)\n"
        << "  --version ID            Package version id (env ACTION1_VERSION_ID)\n"
        << "  --chunk-mb N            Chunk size in MB (" << MIN_CHUNK_MB << "-" << MAX_CHUNK_MB
        << ", default 24)\n"
        << "  --parallel N            Concurrent chunk uploads (1-" << MAX_PARALLEL
        << ", default 4)\n"
        << "  --sequential            Upload chunks one at a time\n"
        << "  --timeout-minutes N     Per-chunk request timeout (1-" << MAX_TIMEOUT_MINUTES
        << ", default 30)\n"
        << "  --env FILE              Environment file (default: .env)\n"
        << "  --log-level LEVEL       SILENT|ERROR|WARN|INFO|DEBUG|TRACE (default: INFO)\n"
        << "  -h, --help              Show this help\n\n"
        << "Environment Variables:\n"
        << "  ACTION1_CLIENT_ID       API Client ID\n"
        << "  ACTION1_CLIENT_SECRET   API Client Secret\n"
        << "  ACTION1_REGION          Region (Europe, NorthAmerica, Australia)\n"
        << "  ACTION1_BASE_URL        Custom API base URL\n";
    return oss.str();
}

app_config parse_arguments(int argc, char* argv[], const env_lookup& env) {
    app_config config;
    std::optional<std::string> org, package, version;
    std::vector<std::optional<platform>> explicit_platforms;

    int index = 1;
    auto require_value = [&](const std::string& flag) -> std::string {
        if (index >= argc)
            throw std::invalid_argument(flag + " requires a value");
        return argv[index++];
    };

    while (index < argc) {
        const std::string arg = argv[index++];
        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return config;
        } else if (arg == "--file") {
            config.files.push_back({require_value(arg), platform::windows_64});
            explicit_platforms.emplace_back();
        } else if (arg == "--platform") {
            std::string name = require_value(arg);
            if (config.files.empty())
                throw std::invalid_argument("--platform must follow a --file");
            auto p = parse_platform(name);
            if (!p)
                throw std::invalid_argument("Unknown platform '" + name +
                                            "'. Expected one of: " + platform_names());
            explicit_platforms.back() = *p;
        } else if (arg == "--org") {
            org = require_value(arg);
        } else if (arg == "--package") {
            package = require_value(arg);
        } else if (arg == "--version") {
            version = require_value(arg);
        } else if (arg == "--chunk-mb") {
            config.chunk_mb = parse_unsigned(arg, require_value(arg));
            if (config.chunk_mb < MIN_CHUNK_MB || config.chunk_mb > MAX_CHUNK_MB)
                throw std::invalid_argument("Chunk size must be between " +
                                            std::to_string(MIN_CHUNK_MB) + " and " +
                                            std::to_string(MAX_CHUNK_MB) + " MB");
        } else if (arg == "--parallel") {
            config.max_parallel = static_cast<std::size_t>(parse_unsigned(arg, require_value(arg)));
            if (config.max_parallel < 1 || config.max_parallel > MAX_PARALLEL)
                throw std::invalid_argument("--parallel must be between 1 and " +
                                            std::to_string(MAX_PARALLEL));
        } else if (arg == "--sequential") {
            config.allow_parallel = false;
        } else if (arg == "--timeout-minutes") {
            std::uint64_t minutes = parse_unsigned(arg, require_value(arg));
            // Bounded so the seconds handed to curl cannot overflow.
            if (minutes < 1 || minutes > static_cast<std::uint64_t>(MAX_TIMEOUT_MINUTES))
                throw std::invalid_argument("--timeout-minutes must be between 1 and " +
                                            std::to_string(MAX_TIMEOUT_MINUTES));
            config.chunk_timeout_minutes = static_cast<long>(minutes);
        } else if (arg == "--env") {
            config.env_file = require_value(arg);
        } else if (arg == "--log-level") {
            std::string name = require_value(arg);
            auto lvl = logging::parse_level(name);
            if (!lvl)
                throw std::invalid_argument("Unknown log level: " + name);
            config.log_level = *lvl;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (config.files.empty())
        throw std::invalid_argument("Missing required argument: --file");

    for (std::size_t i = 0; i < config.files.size(); ++i) {
        auto& file = config.files[i];
        file.target_platform = explicit_platforms[i] ? *explicit_platforms[i]
                                                     : default_platform_for(file.file_path);
    }

    // Process environment wins over the dotenv file.
    auto dotenv = load_env_file(config.env_file);
    auto lookup = [&](const std::string& key) -> std::string {
        if (auto value = env(key))
            return *value;
        auto it = dotenv.find(key);
        return it == dotenv.end() ? "" : it->second;
    };

    config.creds.client_id = lookup("ACTION1_CLIENT_ID");
    config.creds.client_secret = lookup("ACTION1_CLIENT_SECRET");
    config.region = lookup("ACTION1_REGION");
    if (config.region.empty())
        config.region = "Europe";

    std::string base_url = lookup("ACTION1_BASE_URL");
    if (!base_url.empty()) {
        while (!base_url.empty() && base_url.back() == '/')
            base_url.pop_back();
        config.creds.base_uri = base_url;
    } else {
        auto mapped = base_uri_for_region(config.region);
        if (!mapped)
            throw std::invalid_argument("Could not determine API base URL for region '" +
                                        config.region + "'. Set ACTION1_REGION or ACTION1_BASE_URL");
        config.creds.base_uri = *mapped;
    }

    config.target.organization_id = org ? *org : lookup("ACTION1_ORG_ID");
    config.target.package_id = package ? *package : lookup("ACTION1_PACKAGE_ID");
    config.target.version_id = version ? *version : lookup("ACTION1_VERSION_ID");
    config.target.validate();

    if (config.creds.client_id.empty() || config.creds.client_secret.empty())
        throw std::runtime_error("ACTION1_CLIENT_ID and ACTION1_CLIENT_SECRET must be set");

    return config;
}
