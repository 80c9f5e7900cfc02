#include <atomic>
#include <cassert>
#include <chrono>
#include <string>

#include "fake_transport.hpp"
#include "net/errors.hpp"
#include "upload/chunk_transmitter.hpp"

using namespace testing_support;

namespace {

const credentials TEST_CREDENTIALS{"client", "secret", "https://api.test/api/3.0"};

chunk make_chunk(std::size_t number, std::uint64_t start, std::uint64_t length) {
    chunk c;
    c.range = chunk_range{number, start, start + length - 1};
    c.payload.assign(static_cast<std::size_t>(length), 'z');
    return c;
}

void test_classify_statuses() {
    assert(chunk_transmitter::classify(1, 308, "") == chunk_outcome::continue_upload);
    assert(chunk_transmitter::classify(1, 200, "") == chunk_outcome::completed);
    assert(chunk_transmitter::classify(1, 201, "") == chunk_outcome::completed);
    assert(chunk_transmitter::classify(1, 204, "") == chunk_outcome::completed);

    for (int status : {0, 202, 400, 401, 404, 500, 503}) {
        bool threw = false;
        try {
            chunk_transmitter::classify(7, status, "boom");
        } catch (const chunk_upload_error& e) {
            threw = true;
            assert(e.chunk_number() == 7);
            assert(e.status_code() == status);
        }
        assert(threw);
    }
}

void test_put_carries_range_and_token() {
    fake_server server(make_upload_service(upload_service_script()));
    token_provider tokens(TEST_CREDENTIALS, server.transport());
    auto transport = server.transport();
    chunk_transmitter transmitter(*transport, tokens, std::chrono::milliseconds(5));

    auto resp = transmitter.send("https://api.test/session", make_chunk(2, 100, 100), 1000);
    assert(resp.status_code == 308);
    assert(resp.outcome == chunk_outcome::continue_upload);

    auto puts = server.requests_with_method("PUT");
    assert(puts.size() == 1);
    assert(puts[0].url == "https://api.test/session");
    assert(puts[0].headers.at("Content-Range") == "bytes 100-199/1000");
    assert(puts[0].headers.at("Content-Type") == "application/octet-stream");
    assert(puts[0].headers.at("Authorization") == "Bearer token-1");
    assert(puts[0].body_size == 100);
}

void test_last_chunk_completes() {
    fake_server server(make_upload_service(upload_service_script()));
    token_provider tokens(TEST_CREDENTIALS, server.transport());
    auto transport = server.transport();
    chunk_transmitter transmitter(*transport, tokens, std::chrono::milliseconds(5));

    auto resp = transmitter.send("https://api.test/session", make_chunk(3, 200, 50), 250);
    assert(resp.status_code == 200);
    assert(resp.outcome == chunk_outcome::completed);
}

void test_waiting_callback_runs_while_in_flight() {
    upload_service_script script;
    script.chunk_delay = std::chrono::milliseconds(60);
    fake_server server(make_upload_service(script));
    token_provider tokens(TEST_CREDENTIALS, server.transport());
    auto transport = server.transport();
    chunk_transmitter transmitter(*transport, tokens, std::chrono::milliseconds(5));

    std::atomic<int> ticks(0);
    std::chrono::milliseconds last_elapsed(0);
    transmitter.send("https://api.test/session", make_chunk(1, 0, 10), 100,
                     [&](std::chrono::milliseconds elapsed) {
                         assert(elapsed >= last_elapsed);
                         last_elapsed = elapsed;
                         ++ticks;
                     });
    assert(ticks > 0);
}

void test_server_error_raises() {
    upload_service_script script;
    script.chunk_status = [](const content_range&, const std::string&) { return 500; };
    fake_server server(make_upload_service(script));
    token_provider tokens(TEST_CREDENTIALS, server.transport());
    auto transport = server.transport();
    chunk_transmitter transmitter(*transport, tokens, std::chrono::milliseconds(5));

    bool threw = false;
    try {
        transmitter.send("https://api.test/session", make_chunk(4, 0, 10), 100);
    } catch (const chunk_upload_error& e) {
        threw = true;
        assert(e.chunk_number() == 4);
        assert(e.status_code() == 500);
    }
    assert(threw);
}

} // namespace

void run_chunk_transmitter_tests() {
    test_classify_statuses();
    test_put_carries_range_and_token();
    test_last_chunk_completes();
    test_waiting_callback_runs_while_in_flight();
    test_server_error_raises();
}
