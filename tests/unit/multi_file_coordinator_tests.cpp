#include <cassert>
#include <string>

#include "fake_transport.hpp"
#include "net/errors.hpp"
#include "upload/multi_file_coordinator.hpp"

using namespace testing_support;

namespace {

const credentials TEST_CREDENTIALS{"client", "secret", "https://api.test/api/3.0"};

upload_target test_target() {
    upload_target target;
    target.organization_id = "org-1";
    target.package_id = "pkg-1";
    target.version_id = "ver-1";
    return target;
}

// Sessions are named after the announced file size so chunk PUTs can be told apart.
upload_service_script sized_sessions(std::uint64_t failing_size) {
    upload_service_script script;
    script.location = [](std::uint64_t size) {
        return "/API/upload-sessions/size-" + std::to_string(size);
    };
    const std::string failing_session = "size-" + std::to_string(failing_size);
    script.chunk_status = [failing_session](const content_range& range, const std::string& url) {
        if (url.find(failing_session) != std::string::npos)
            return 500;
        return range.end + 1 == range.total ? 200 : 308;
    };
    return script;
}

void test_failure_does_not_stop_batch() {
    fake_server server(make_upload_service(sized_sessions(20 * MB)));
    token_provider tokens(TEST_CREDENTIALS, server.transport());
    api_client api(tokens, server.transport());

    temp_file first("batch_first.msi", 10 * MB);
    temp_file second("batch_second.msi", 20 * MB);
    temp_file third("batch_third.msi", 5 * MB);

    upload_options options;
    options.poll_interval = std::chrono::milliseconds(5);
    progress_aggregator progress;
    upload_orchestrator orchestrator(api, server.factory(), options, &progress);
    multi_file_coordinator coordinator(orchestrator, &progress);

    auto results = coordinator.upload_all({{first.string(), platform::windows_64},
                                           {second.string(), platform::windows_64},
                                           {third.string(), platform::windows_32}},
                                          test_target());

    assert(results.size() == 3);
    assert(results[0].success);
    assert(!results[1].success);
    assert(results[2].success);
    assert(results[1].error_message.find("Chunk 1") != std::string::npos);
    assert(results[0].detail && results[0].detail->chunks_sent == 1);
    assert(!results[1].detail);
    assert(results[2].target_platform == platform::windows_32);

    const auto& summary = coordinator.summary();
    assert(summary.succeeded == 2);
    assert(summary.failed == 1);
    assert(summary.total_bytes == 35 * MB);
    assert(summary.bytes_uploaded == 15 * MB);

    // Only the two successful files were finalized.
    std::size_t finalized = 0;
    for (const auto& rec : server.requests_with_method("POST")) {
        if (rec.url.find("/upload/finalize") != std::string::npos)
            ++finalized;
    }
    assert(finalized == 2);

    auto s = progress.snapshot();
    assert(s.file_index == 3);
    assert(s.overall_total_bytes == 35 * MB);
    assert(s.overall_bytes_uploaded == 15 * MB);
}

void test_empty_file_keeps_batch_position() {
    fake_server server(make_upload_service(upload_service_script()));
    token_provider tokens(TEST_CREDENTIALS, server.transport());
    api_client api(tokens, server.transport());

    temp_file empty("empty.msi", 0);
    temp_file first("first.msi", 1000, true);
    temp_file last("last.msi", 1000, true);
    upload_options options;
    options.poll_interval = std::chrono::milliseconds(5);
    progress_aggregator progress;
    upload_orchestrator orchestrator(api, server.factory(), options, &progress);
    multi_file_coordinator coordinator(orchestrator, &progress);

    auto results = coordinator.upload_all({{first.string(), platform::windows_64},
                                           {empty.string(), platform::windows_64},
                                           {last.string(), platform::windows_64}},
                                          test_target());
    assert(results[0].success);
    assert(!results[1].success);
    assert(results[2].success);

    auto s = progress.snapshot();
    assert(s.file_index == 3);
    assert(s.file_count == 3);
    assert(s.label.find("last.msi") != std::string::npos);
}

void test_platform_per_file() {
    fake_server server(make_upload_service(upload_service_script()));
    token_provider tokens(TEST_CREDENTIALS, server.transport());
    api_client api(tokens, server.transport());

    temp_file mac("installer.pkg", 2000, true);
    upload_options options;
    options.poll_interval = std::chrono::milliseconds(5);
    upload_orchestrator orchestrator(api, server.factory(), options);
    multi_file_coordinator coordinator(orchestrator);

    auto results = coordinator.upload_all({{mac.string(), default_platform_for(mac.string())}},
                                          test_target());
    assert(results.size() == 1);
    assert(results[0].success);

    bool saw_platform = false;
    for (const auto& rec : server.requests_with_method("POST")) {
        if (rec.url.find("/upload?platform=Mac_AppleSilicon") != std::string::npos)
            saw_platform = true;
    }
    assert(saw_platform);
}

void test_missing_file_is_recorded() {
    fake_server server(make_upload_service(upload_service_script()));
    token_provider tokens(TEST_CREDENTIALS, server.transport());
    api_client api(tokens, server.transport());

    temp_file present("present.msi", 1000, true);
    upload_options options;
    options.poll_interval = std::chrono::milliseconds(5);
    progress_aggregator progress;
    upload_orchestrator orchestrator(api, server.factory(), options, &progress);
    multi_file_coordinator coordinator(orchestrator, &progress);

    auto results = coordinator.upload_all({{"/nonexistent/missing.msi", platform::windows_64},
                                           {present.string(), platform::windows_64}},
                                          test_target());
    // The file that never started still holds position 1 of the batch.
    auto s = progress.snapshot();
    assert(s.file_index == 2);
    assert(s.file_count == 2);
    assert(s.label.find("present.msi") != std::string::npos);

    assert(!results[0].success);
    assert(results[0].error_message.find("missing.msi") != std::string::npos);
    assert(results[1].success);
    assert(coordinator.summary().succeeded == 1);
    assert(coordinator.summary().failed == 1);
}

} // namespace

void run_multi_file_coordinator_tests() {
    test_failure_does_not_stop_batch();
    test_empty_file_keeps_batch_position();
    test_platform_per_file();
    test_missing_file_is_recorded();
}
