#include "upload/upload_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <memory>

#include "net/errors.hpp"
#include "upload/chunk_status_map.hpp"
#include "upload/requests.hpp"
#include "util/byte_utils.hpp"
#include "util/defer.hpp"
#include "util/log.hpp"

const char* to_string(upload_strategy strategy) {
    return strategy == upload_strategy::parallel ? "parallel" : "sequential";
}

upload_options::upload_options()
    : chunk_size(chunk_planner::DEFAULT_CHUNK_SIZE), max_parallel(4), allow_parallel(true),
      parallel_threshold(5), require_completion_status(false), poll_interval(200) {}

upload_orchestrator::upload_orchestrator(api_client& api, transport_factory transports,
                                         upload_options options, progress_aggregator* progress)
    : m_api(api), m_transports(std::move(transports)), m_options(options), m_progress(progress) {}

upload_strategy upload_orchestrator::choose_strategy(std::size_t total_chunks) const {
    if (m_options.allow_parallel && m_options.max_parallel > 1 &&
        total_chunks >= m_options.parallel_threshold)
        return upload_strategy::parallel;
    return upload_strategy::sequential;
}

upload_result upload_orchestrator::upload(const file_descriptor& file,
                                          const upload_target& target) {
    if (file.size == 0)
        throw upload_error("Refusing to upload empty file: " + file.path);

    auto plan = chunk_planner::plan(file.size, m_options.chunk_size);

    upload_result result;
    result.file_name = file.display_name;
    result.total_chunks = plan.size();
    result.strategy = choose_strategy(plan.size());

    if (m_progress)
        m_progress->begin_file(file.display_name, file.size, plan.size());
    // Clears the in-progress indicator however this scope is left.
    auto mark_failed = make_deferred([this]() {
        if (m_progress)
            m_progress->file_finished(false);
    });

    LOG_INFO("upload") << "Uploading " << file.display_name << " ("
                       << byte_utils::format_bytes(file.size) << ") in " << plan.size()
                       << " chunk(s) of " << byte_utils::format_bytes(m_options.chunk_size)
                       << ", " << to_string(result.strategy) << " strategy";

    upload_session session(m_api);
    auto info = session.initialize(target, file.size);
    result.session_url = info.url;

    if (result.strategy == upload_strategy::parallel)
        upload_parallel(file, info, plan, result);
    else
        upload_sequential(file, info, plan, result);

    if (!result.completion_confirmed) {
        if (m_options.require_completion_status) {
            throw upload_error("Sent all " + std::to_string(result.chunks_sent) + " chunk(s) of " +
                               file.display_name +
                               " but the service never confirmed completion");
        }
        LOG_WARN("upload") << "No chunk of " << file.display_name
                           << " was answered with a completion status; the upload may be "
                              "incomplete";
    }

    finalize(file, info, result);

    mark_failed.dismiss();
    if (m_progress)
        m_progress->file_finished(true);

    LOG_INFO("upload") << "Upload of " << file.display_name << " complete (" << result.chunks_sent
                       << "/" << result.total_chunks << " chunks sent)";
    return result;
}

void upload_orchestrator::upload_sequential(const file_descriptor& file,
                                            const upload_session_info& session,
                                            const std::vector<chunk_range>& plan,
                                            upload_result& result) {
    auto transport = m_transports();
    chunk_transmitter transmitter(*transport, m_api.tokens(), m_options.poll_interval);

    chunk_reader reader(file.path);
    DEFER(reader.close(););

    for (const auto& range : plan) {
        chunk c = reader.read(range);

        if (m_progress)
            m_progress->chunk_started(range.number, range.length());

        chunk_response resp;
        try {
            resp = transmitter.send(session.url, c, file.size,
                                    [this, &range](std::chrono::milliseconds elapsed) {
                                        if (m_progress)
                                            m_progress->chunk_in_flight(range.number, elapsed);
                                    });
        } catch (const upload_error&) {
            if (m_progress)
                m_progress->chunk_failed(range.number);
            throw;
        }
        ++result.chunks_sent;

        if (m_progress)
            m_progress->chunk_finished(range.number, range.length());

        if (resp.outcome == chunk_outcome::completed) {
            result.completion_confirmed = true;
            if (range.number < plan.size()) {
                LOG_INFO("upload") << "Service reported completion after chunk " << range.number
                                   << "/" << plan.size() << "; skipping remaining chunks";
            }
            break;
        }
    }
}

void upload_orchestrator::upload_parallel(const file_descriptor& file,
                                          const upload_session_info& session,
                                          const std::vector<chunk_range>& plan,
                                          upload_result& result) {
    // Workers run independently of a file cursor, so every chunk is read first.
    std::vector<chunk> chunks;
    chunks.reserve(plan.size());
    {
        chunk_reader reader(file.path);
        for (const auto& range : plan)
            chunks.push_back(reader.read(range));
    }

    // Single record of every chunk's fate; the monitor and the final
    // aggregation both read it.
    chunk_status_map statuses(plan.size());
    std::atomic<std::size_t> next_index(0);
    std::atomic<bool> completion_seen(false);

    std::size_t worker_count = std::min<std::size_t>(std::max<std::size_t>(1, m_options.max_parallel),
                                                     chunks.size());
    LOG_DEBUG("upload") << "Dispatching " << chunks.size() << " chunks to " << worker_count
                        << " workers";

    auto worker = [&]() {
        auto transport = m_transports();
        chunk_transmitter transmitter(*transport, m_api.tokens(), m_options.poll_interval);

        while (!completion_seen.load()) {
            std::size_t index = next_index.fetch_add(1);
            if (index >= chunks.size())
                break;

            const chunk& c = chunks[index];
            const std::size_t number = c.range.number;

            statuses.mark_uploading(number);
            if (m_progress)
                m_progress->chunk_started(number, c.range.length());

            try {
                auto resp = transmitter.send(session.url, c, file.size,
                                             [this, number](std::chrono::milliseconds elapsed) {
                                                 if (m_progress)
                                                     m_progress->chunk_in_flight(number, elapsed);
                                             });
                statuses.mark_complete(number);
                if (m_progress)
                    m_progress->chunk_finished(number, c.range.length());
                if (resp.outcome == chunk_outcome::completed)
                    completion_seen.store(true);
            } catch (const upload_error& e) {
                statuses.mark_failed(number, e.what());
                if (m_progress)
                    m_progress->chunk_failed(number);
                LOG_ERROR("upload") << e.what();
            }
        }
    };

    std::vector<std::future<void>> in_flight;
    in_flight.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i)
        in_flight.emplace_back(std::async(std::launch::async, worker));

    auto workers_drained = [&]() {
        for (auto& fut : in_flight) {
            if (fut.wait_for(m_options.poll_interval) != std::future_status::ready)
                return false;
        }
        return true;
    };

    // Monitor: report aggregate status until every chunk has settled. A
    // completion status leaves chunks pending, so drained workers end it too.
    while (!statuses.all_terminal() && !workers_drained()) {
        auto counts = statuses.snapshot();
        LOG_TRACE("upload") << "chunks: " << counts.complete << " complete, " << counts.uploading
                            << " uploading, " << counts.pending << " pending, " << counts.failed
                            << " failed";
        if (m_progress)
            m_progress->publish();
    }
    // Surfaces worker-level failures such as a transport that could not be built.
    for (auto& fut : in_flight)
        fut.get();

    std::vector<aggregate_chunk_failure::failed_chunk> failures;
    for (std::size_t number = 1; number <= statuses.size(); ++number) {
        chunk_status status = statuses.status(number);
        if (status == chunk_status::pending)
            continue;
        ++result.chunks_sent;
        if (status == chunk_status::failed)
            failures.push_back({number, statuses.error(number)});
    }
    result.completion_confirmed = completion_seen.load();

    if (!failures.empty())
        throw aggregate_chunk_failure(std::move(failures));

    if (result.completion_confirmed && result.chunks_sent < chunks.size()) {
        LOG_INFO("upload") << "Service reported completion after " << result.chunks_sent << "/"
                           << chunks.size() << " chunks; remaining chunks were not sent";
    }
}

void upload_orchestrator::finalize(const file_descriptor& file, const upload_session_info& session,
                                   upload_result& result) {
    if (m_progress)
        m_progress->set_status("finalizing");

    finalize_request body{session.upload_id(), file.display_name, result.total_chunks};
    body.validate();

    LOG_DEBUG("upload") << "Finalizing upload " << body.upload_id;
    result.finalize_response = m_api.request(session.endpoint + "/finalize", "POST", body.to_json());
}
