#include <atomic>
#include <cassert>
#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "fake_transport.hpp"
#include "net/errors.hpp"
#include "net/token_provider.hpp"

using namespace testing_support;

namespace {

const credentials TEST_CREDENTIALS{"client", "secret", "https://api.test/api/3.0"};

// Issues "token-<n>" for the n-th exchange with the given expires_in.
fake_server::handler counting_token_endpoint(std::atomic<int>& exchanges, int expires_in) {
    return [&exchanges, expires_in](const http_transport::request& req) {
        assert(req.method == "POST");
        assert(req.url == "https://api.test/api/3.0/oauth2/token");
        int n = ++exchanges;
        nlohmann::json body{{"access_token", "token-" + std::to_string(n)}};
        if (expires_in >= 0)
            body["expires_in"] = expires_in;
        return make_response(200, body.dump());
    };
}

void test_exchange_sends_client_credentials() {
    std::atomic<int> exchanges(0);
    fake_server server(counting_token_endpoint(exchanges, 3600));
    token_provider tokens(TEST_CREDENTIALS, server.transport());

    assert(tokens.get_token() == "token-1");
    auto requests = server.requests();
    assert(requests.size() == 1);
    auto body = nlohmann::json::parse(requests[0].body);
    assert(body.at("client_id") == "client");
    assert(body.at("client_secret") == "secret");
    assert(requests[0].headers.at("Content-Type") == "application/json");
}

void test_token_is_cached_until_refresh_deadline() {
    std::atomic<int> exchanges(0);
    fake_server server(counting_token_endpoint(exchanges, 3600));
    manual_clock clock;
    token_provider tokens(TEST_CREDENTIALS, server.transport(), clock.function());

    assert(tokens.get_token() == "token-1");
    assert(tokens.refresh_deadline() == clock.now + std::chrono::seconds(3300));

    clock.now += std::chrono::seconds(3299);
    assert(tokens.get_token() == "token-1");
    assert(exchanges == 1);

    // 3600s lifetime minus the 300s margin: one second past 3300 refreshes.
    clock.now += std::chrono::seconds(2);
    assert(!tokens.has_valid_token());
    assert(tokens.get_token() == "token-2");
    assert(exchanges == 2);
}

void test_missing_expiry_uses_default_lifetime() {
    std::atomic<int> exchanges(0);
    fake_server server(counting_token_endpoint(exchanges, -1));
    manual_clock clock;
    token_provider tokens(TEST_CREDENTIALS, server.transport(), clock.function());

    auto start = clock.now;
    tokens.get_token();
    assert(tokens.refresh_deadline() == start + token_provider::DEFAULT_LIFETIME);
}

void test_short_lifetime_never_goes_negative() {
    std::atomic<int> exchanges(0);
    fake_server server(counting_token_endpoint(exchanges, 120));
    manual_clock clock;
    token_provider tokens(TEST_CREDENTIALS, server.transport(), clock.function());

    tokens.get_token();
    assert(tokens.refresh_deadline() == clock.now);
    // A deadline equal to now is already stale.
    tokens.get_token();
    assert(exchanges == 2);
}

void test_force_and_invalidate() {
    std::atomic<int> exchanges(0);
    fake_server server(counting_token_endpoint(exchanges, 3600));
    token_provider tokens(TEST_CREDENTIALS, server.transport());

    tokens.get_token();
    assert(tokens.get_token(true) == "token-2");
    tokens.invalidate();
    assert(!tokens.has_valid_token());
    assert(tokens.get_token() == "token-3");
}

void expect_authentication_error(token_provider& tokens, int expected_status) {
    bool threw = false;
    try {
        tokens.get_token();
    } catch (const authentication_error& e) {
        threw = true;
        assert(e.status_code() == expected_status);
    }
    assert(threw);
}

void test_failed_exchanges() {
    fake_server rejected([](const http_transport::request&) {
        return make_response(401, "{\"error\":\"invalid_client\"}");
    });
    token_provider tokens(TEST_CREDENTIALS, rejected.transport());
    expect_authentication_error(tokens, 401);
    assert(!tokens.has_valid_token());

    fake_server not_json([](const http_transport::request&) { return make_response(200, "<html>"); });
    token_provider tokens2(TEST_CREDENTIALS, not_json.transport());
    expect_authentication_error(tokens2, 200);

    fake_server no_token([](const http_transport::request&) {
        return make_response(200, "{\"expires_in\":3600}");
    });
    token_provider tokens3(TEST_CREDENTIALS, no_token.transport());
    expect_authentication_error(tokens3, 200);

    fake_server unreachable([](const http_transport::request&) {
        http_transport::response resp;
        resp.error = "Couldn't resolve host name";
        return resp;
    });
    token_provider tokens4(TEST_CREDENTIALS, unreachable.transport());
    expect_authentication_error(tokens4, 0);
}

void test_missing_configuration() {
    fake_server server([](const http_transport::request&) { return make_response(500); });

    token_provider no_base(credentials{"client", "secret", ""}, server.transport());
    expect_authentication_error(no_base, 0);

    token_provider no_secret(credentials{"client", "", "https://api.test/api/3.0"},
                             server.transport());
    expect_authentication_error(no_secret, 0);

    // Nothing should have reached the wire.
    assert(server.requests().empty());
}

} // namespace

void run_token_provider_tests() {
    test_exchange_sends_client_credentials();
    test_token_is_cached_until_refresh_deadline();
    test_missing_expiry_uses_default_lifetime();
    test_short_lifetime_never_goes_negative();
    test_force_and_invalidate();
    test_failed_exchanges();
    test_missing_configuration();
}
