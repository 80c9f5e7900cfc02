#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "upload/progress_aggregator.hpp"
#include "upload/upload_orchestrator.hpp"
#include "upload/upload_target.hpp"

struct file_upload_request {
    std::string file_path;
    platform target_platform;
};

struct file_upload_result {
    std::string file_path;
    platform target_platform = platform::windows_64;
    bool success = false;
    std::string error_message;
    std::uint64_t bytes = 0;
    std::optional<upload_result> detail;
};

struct batch_summary {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_uploaded = 0;
};

// Uploads the installers of one release, one file at a time. A failing file
// is recorded in its result and the batch moves on.
class multi_file_coordinator {
public:
    explicit multi_file_coordinator(upload_orchestrator& orchestrator,
                                    progress_aggregator* progress = nullptr);

    // `target` supplies organization, package and version; each request
    // supplies its own platform. Never throws for a per-file failure.
    std::vector<file_upload_result> upload_all(const std::vector<file_upload_request>& files,
                                               const upload_target& target);

    const batch_summary& summary() const {
        return m_summary;
    }

private:
    upload_orchestrator& m_orchestrator;
    progress_aggregator* m_progress;
    batch_summary m_summary;
};
