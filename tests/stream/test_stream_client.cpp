#include <iostream>
#include <string>
#include <chrono>

#include "gemstream/stream/client.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

using namespace gemstream;
using namespace gemstream::stream;
using namespace gemstream::transport;

using clock_t_ = std::chrono::steady_clock;

// -----------------------------------------------------------------------------
// Test: connect() succeeds, splits the URL and triggers on_connect
// -----------------------------------------------------------------------------
void test_connect() {
    std::cout << "[TEST] stream::Client connect\n";
    MockWebSocket::reset();

    bool connected_cb = false;
    Client<MockWebSocket> client;
    client.on_connect([&]() { connected_cb = true; });

    TEST_CHECK(client.connect("wss://api.gemini.com/v1/marketdata/BTCUSD?top_of_book=true"));
    TEST_CHECK(connected_cb);
    TEST_CHECK(client.state() == State::Connected);
    TEST_CHECK(client.ws().last_host() == "api.gemini.com");
    TEST_CHECK(client.ws().last_port() == "443");
    TEST_CHECK(client.ws().last_path() == "/v1/marketdata/BTCUSD?top_of_book=true");

    client.close();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: an invalid URL never reaches the transport
// -----------------------------------------------------------------------------
void test_connect_invalid_url() {
    std::cout << "[TEST] stream::Client invalid URL\n";
    MockWebSocket::reset();

    Client<MockWebSocket> client;
    TEST_CHECK(!client.connect("https://api.gemini.com/v1/marketdata/BTCUSD"));
    TEST_CHECK(client.state() == State::Disconnected);
    TEST_CHECK(client.ws().connect_count() == 0);

    // Plain ws:// parses but the transport is TLS-only
    TEST_CHECK(!client.connect("ws://api.gemini.com/v1/marketdata/BTCUSD"));
    TEST_CHECK(client.state() == State::Disconnected);
    TEST_CHECK(client.ws().connect_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: message callback propagation, empty frames dropped
// -----------------------------------------------------------------------------
void test_message_dispatch() {
    std::cout << "[TEST] stream::Client message dispatch\n";
    MockWebSocket::reset();

    std::string received;
    int calls = 0;
    Client<MockWebSocket> client;
    client.on_message([&](std::string_view msg) {
        received = msg;
        ++calls;
    });
    TEST_CHECK(client.connect("wss://example.com/ws"));

    client.ws().emit_message("hello");
    TEST_CHECK(received == "hello");
    TEST_CHECK(calls == 1);

    client.ws().emit_message("");
    TEST_CHECK(calls == 1);
    TEST_CHECK(client.empty_frames() == 1);

    client.close();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: local close notifies once and never schedules a reconnect
// -----------------------------------------------------------------------------
void test_close() {
    std::cout << "[TEST] stream::Client close\n";
    MockWebSocket::reset();

    int disconnected = 0;
    Client<MockWebSocket> client;
    client.on_disconnect([&]() { ++disconnected; });

    TEST_CHECK(client.connect("wss://example.com/ws"));
    client.close();

    TEST_CHECK(disconnected == 1);
    TEST_CHECK(client.ws().close_count() == 1);
    TEST_CHECK(client.state() == State::Disconnected);

    client.force_next_retry(clock_t_::now() - std::chrono::seconds(1));
    client.poll();
    TEST_CHECK(client.ws().connect_count() == 1);

    // Idempotent
    client.close();
    TEST_CHECK(disconnected == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: transport close triggers reconnect scheduling
// -----------------------------------------------------------------------------
void test_reconnect_on_close() {
    std::cout << "[TEST] stream::Client reconnect on transport close\n";
    MockWebSocket::reset();

    int connect_count = 0;
    Client<MockWebSocket> client;
    client.on_connect([&]() {
        ++connect_count;
    });

    TEST_CHECK(client.connect("wss://example.com/ws"));
    TEST_CHECK(connect_count == 1);

    // Simulate remote close
    client.ws().close();
    TEST_CHECK(client.state() == State::WaitingReconnect);
    TEST_CHECK(client.retry_attempts() == 0);

    // First poll schedules the retry; backoff not elapsed yet
    client.poll();
    TEST_CHECK(client.retry_attempts() == 1);
    TEST_CHECK(connect_count == 1);

    client.force_next_retry(clock_t_::now() - std::chrono::milliseconds(1));
    client.poll();

    TEST_CHECK(connect_count == 2);
    TEST_CHECK(client.state() == State::Connected);
    TEST_CHECK(client.retry_attempts() == 0);

    client.close();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: failed reconnects keep retrying with a growing attempt count
// -----------------------------------------------------------------------------
void test_reconnect_failure_backoff() {
    std::cout << "[TEST] stream::Client reconnect failure\n";
    MockWebSocket::reset();

    Client<MockWebSocket> client;
    TEST_CHECK(client.connect("wss://example.com/ws"));

    MockWebSocket::set_fail_connect(true);
    client.ws().close();
    client.poll();
    TEST_CHECK(client.retry_attempts() == 1);

    client.force_next_retry(clock_t_::now() - std::chrono::milliseconds(1));
    client.poll();
    TEST_CHECK(client.state() == State::WaitingReconnect);
    TEST_CHECK(client.retry_attempts() == 2);

    MockWebSocket::set_fail_connect(false);
    client.force_next_retry(clock_t_::now() - std::chrono::milliseconds(1));
    client.poll();
    TEST_CHECK(client.state() == State::Connected);
    TEST_CHECK(client.retry_attempts() == 0);

    client.close();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a close signaled from the transport thread leaves retry scheduling to
// poll(), and the backoff is honored
// -----------------------------------------------------------------------------
void test_remote_close_from_transport_thread() {
    std::cout << "[TEST] stream::Client remote close from transport thread\n";

    Client<ThreadedCloseWebSocket> client;
    TEST_CHECK(client.connect("wss://example.com/ws"));

    client.ws().close_from_thread();
    // Application thread keeps polling while the transport thread closes
    while (!client.ws().close_done()) {
        client.poll();
    }
    client.ws().join();
    TEST_CHECK(client.state() == State::WaitingReconnect);

    client.poll();
    TEST_CHECK(client.retry_attempts() == 1);
    TEST_CHECK(client.ws().connect_count() == 1);

    client.force_next_retry(clock_t_::now() - std::chrono::milliseconds(1));
    client.poll();
    TEST_CHECK(client.state() == State::Connected);
    TEST_CHECK(client.ws().connect_count() == 2);
    TEST_CHECK(client.retry_attempts() == 0);

    client.close();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: liveness timeout fires when both timestamps are stale
// -----------------------------------------------------------------------------
void test_liveness_timeout() {
    std::cout << "[TEST] stream::Client liveness timeout\n";
    MockWebSocket::reset();

    bool liveness_called = false;
    Client<MockWebSocket> client;
    client.on_liveness_timeout([&]() {
        liveness_called = true;
    });
    TEST_CHECK(client.connect("wss://example.com/ws"));

    // Fresh heartbeat keeps the connection alive
    auto past = clock_t_::now() - std::chrono::seconds(30);
    client.force_last_message(past);
    client.record_heartbeat();
    client.poll();
    TEST_CHECK(!liveness_called);
    TEST_CHECK(client.heartbeat_total() == 1);

    client.force_last_heartbeat(past);
    client.poll();

    TEST_CHECK(liveness_called);
    TEST_CHECK(client.ws().close_count() == 1);
    TEST_CHECK(client.state() == State::WaitingReconnect);

    client.close();
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: transport errors are reported without changing state
// -----------------------------------------------------------------------------
void test_transport_error() {
    std::cout << "[TEST] stream::Client transport error\n";
    MockWebSocket::reset();

    Client<MockWebSocket> client;
    TEST_CHECK(client.connect("wss://example.com/ws"));
    client.ws().emit_error(Error::TransportFailure);
    TEST_CHECK(client.ws().error_count() == 1);
    TEST_CHECK(client.state() == State::Connected);

    client.close();
    std::cout << "[TEST] OK\n";
}

int main() {
    test_connect();
    test_connect_invalid_url();
    test_message_dispatch();
    test_close();
    test_reconnect_on_close();
    test_reconnect_failure_backoff();
    test_remote_close_from_transport_thread();
    test_liveness_timeout();
    test_transport_error();

    std::cout << "\n[GEMSTREAM] Stream client tests passed!" << std::endl;
    return 0;
}
