#include "upload/multi_file_coordinator.hpp"

#include <stdexcept>

#include "net/errors.hpp"
#include "util/byte_utils.hpp"
#include "util/log.hpp"

multi_file_coordinator::multi_file_coordinator(upload_orchestrator& orchestrator,
                                               progress_aggregator* progress)
    : m_orchestrator(orchestrator), m_progress(progress) {}

std::vector<file_upload_result> multi_file_coordinator::upload_all(
    const std::vector<file_upload_request>& files, const upload_target& target) {
    m_summary = batch_summary();

    // Snapshot every file first so the batch total is known up front.
    std::vector<std::optional<file_descriptor>> descriptors;
    std::vector<std::string> describe_errors;
    for (const auto& request : files) {
        try {
            descriptors.push_back(describe_file(request.file_path));
            describe_errors.emplace_back();
            m_summary.total_bytes += descriptors.back()->size;
        } catch (const upload_error& e) {
            descriptors.push_back(std::nullopt);
            describe_errors.emplace_back(e.what());
        }
    }

    LOG_INFO("batch") << "Uploading " << files.size() << " file(s), "
                      << byte_utils::format_bytes(m_summary.total_bytes) << " total";
    if (m_progress)
        m_progress->begin_batch(m_summary.total_bytes, files.size());

    std::vector<file_upload_result> results;
    results.reserve(files.size());

    for (std::size_t i = 0; i < files.size(); ++i) {
        file_upload_result entry;
        entry.file_path = files[i].file_path;
        entry.target_platform = files[i].target_platform;
        if (m_progress)
            m_progress->select_file(i + 1);

        if (!descriptors[i]) {
            entry.error_message = describe_errors[i];
        } else {
            entry.bytes = descriptors[i]->size;
            upload_target file_target = target;
            file_target.target_platform = files[i].target_platform;

            LOG_INFO("batch") << "[" << (i + 1) << "/" << files.size() << "] "
                              << descriptors[i]->display_name << " -> "
                              << to_string(files[i].target_platform);
            try {
                entry.detail = m_orchestrator.upload(*descriptors[i], file_target);
                entry.success = true;
                m_summary.bytes_uploaded += entry.bytes;
            } catch (const std::exception& e) {
                entry.error_message = e.what();
            }
        }

        if (entry.success) {
            ++m_summary.succeeded;
        } else {
            ++m_summary.failed;
            LOG_ERROR("batch") << entry.file_path << ": " << entry.error_message;
        }
        results.push_back(std::move(entry));
    }

    LOG_INFO("batch") << m_summary.succeeded << " succeeded, " << m_summary.failed << " failed ("
                      << byte_utils::format_bytes(m_summary.bytes_uploaded) << " of "
                      << byte_utils::format_bytes(m_summary.total_bytes) << " uploaded)";
    return results;
}
