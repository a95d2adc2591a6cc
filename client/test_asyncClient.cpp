//
// Client tests, asynchronous mode
//
// 1. Echo end-to-end through the worker threads
// 2. Payloads sent before start() are delivered after start()
// 3. FIFO: many sends arrive concatenated in order
// 4. receive() on an empty queue returns immediately with no data
// 5. close() unblocks the reader promptly against a silent peer
// 6. send() after close() is dropped without raising
// 7. start() failure leaves the client inert
// 8. Peer close is reported through receive(reason)
// 9. Bounded outbound queue with the Reject policy
// 10. Write failure against a vanished peer stops the writer, no SIGPIPE
// 11. Read timeouts in the inbound worker are retried, not treated as close
//

#include "Client.hpp"
#include "ClientErrors.hpp"
#include "ConnectionManager.hpp"
#include "mode/AsyncTransport.hpp"
#include "testing/LoopbackServer.hpp"
#include "transport/socket/posix/PosixSocket.hpp"
#include "logger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using namespace LineBridge;
using LineBridge::testing::LoopbackServer;

namespace {

ClientOptions async_options(int port) {
    ClientOptions opts;
    opts.mode = ClientMode::Async;
    opts.host = "127.0.0.1";
    opts.port = port;
    opts.idle_backoff = 10ms;
    return opts;
}

/// Poll receive() until `expected_size` bytes have been collected or `timeout` elapses.
std::string collect(Client& client, size_t expected_size, std::chrono::milliseconds timeout) {
    std::string out;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (out.size() < expected_size && std::chrono::steady_clock::now() < deadline) {
        if (auto chunk = client.receive()) {
            out += *chunk;
        } else {
            std::this_thread::sleep_for(5ms);
        }
    }
    return out;
}

} // namespace

void test_async_echo() {
    std::cout << "=== Test 1: Async echo ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Echo);
    Client client(async_options(server.port()));
    assert(client.mode() == ClientMode::Async);
    assert(client.start());
    assert(client.is_connected());

    client.send("hello");
    assert(collect(client, 5, 2s) == "hello");
    assert(client.bytes_sent() == 5);
    assert(client.bytes_received() == 5);
    client.close();
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_send_before_start() {
    std::cout << "=== Test 2: Send before start ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    Client client(async_options(server.port()));
    client.send("early;");
    std::this_thread::sleep_for(50ms);
    assert(server.received().empty());

    assert(client.start());
    assert(server.wait_for_bytes(6, 2s));
    assert(server.received() == "early;");
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_fifo() {
    std::cout << "=== Test 3: FIFO ordering ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    Client client(async_options(server.port()));
    assert(client.start());

    std::string expected;
    for (int i = 0; i < 200; ++i) {
        std::string p = "p" + std::to_string(i) + ";";
        expected += p;
        client.send(p);
    }
    assert(server.wait_for_bytes(expected.size(), 5s));
    assert(server.received() == expected);
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_receive_empty() {
    std::cout << "=== Test 4: Empty receive does not block ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    Client client(async_options(server.port()));
    assert(client.start());

    auto t0 = std::chrono::steady_clock::now();
    std::error_code reason;
    for (int i = 0; i < 100; ++i) {
        assert(!client.receive(reason).has_value());
        assert(reason == client_errc::no_data);
    }
    assert(std::chrono::steady_clock::now() - t0 < 500ms);
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_close_unblocks_reader() {
    std::cout << "=== Test 5: close() unblocks reader ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    Client client(async_options(server.port()));
    assert(client.start());
    std::this_thread::sleep_for(50ms);  // let the inbound worker block in its read

    auto t0 = std::chrono::steady_clock::now();
    client.close();
    auto elapsed = std::chrono::steady_clock::now() - t0;
    assert(elapsed < 1s);
    assert(!client.is_connected());
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_send_after_close() {
    std::cout << "=== Test 6: Send after close ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    Client client(async_options(server.port()));
    assert(client.start());
    client.close();

    client.send("dropped");  // must not throw
    std::this_thread::sleep_for(50ms);
    assert(server.received().empty());
    assert(!client.receive().has_value());
    assert(!client.is_connected());
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_start_failure() {
    std::cout << "=== Test 7: start() failure stays inert ===" << std::endl;

    Client client(async_options(LoopbackServer::unused_port()));
    client.send("queued");
    assert(!client.start());
    assert(client.last_error() == std::errc::connection_refused);
    assert(!client.is_connected());
    assert(!client.receive().has_value());
    client.close();
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_peer_close() {
    std::cout << "=== Test 8: Peer close ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    Client client(async_options(server.port()));
    assert(client.start());
    assert(server.wait_for_client(2s));
    assert(server.push("bye"));
    assert(collect(client, 3, 2s) == "bye");

    server.disconnect_client();
    std::error_code reason;
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        client.receive(reason);
        if (reason == client_errc::peer_closed) break;
        std::this_thread::sleep_for(5ms);
    }
    assert(reason == client_errc::peer_closed);
    client.close();
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_bounded_queue() {
    std::cout << "=== Test 9: Bounded outbound queue ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    ConnectionManager conn(transport::PosixSocket::create(), nullptr);
    AsyncTransport transport(conn, nullptr, 10ms, 2, OverflowPolicy::Reject);

    // Not started: the queue fills and the third payload is rejected
    transport.send("a;");
    transport.send("b;");
    transport.send("c;");
    assert(transport.pending_outbound() == 2);

    assert(!conn.connect(Endpoint("127.0.0.1", server.port())));
    transport.start();
    assert(server.wait_for_bytes(4, 2s));
    assert(server.received() == "a;b;");

    conn.interrupt();
    transport.stop();
    conn.close();
    assert(!transport.writer_failed());
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_write_failure_stops_writer() {
    std::cout << "=== Test 10: Write failure stops the writer ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::CloseOnAccept);
    auto capture = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("AsyncTest");
    logger->add_sink(capture);

    ConnectionManager conn(transport::PosixSocket::create(), logger);
    AsyncTransport transport(conn, logger, 10ms);
    assert(!conn.connect(Endpoint("127.0.0.1", server.port())));
    assert(server.wait_for_client(2s));
    transport.start();

    // The first writes may still be accepted locally; the RST makes a later one fail
    const std::string block(4096, 'x');
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!transport.writer_failed() && std::chrono::steady_clock::now() < deadline) {
        transport.send(block);
        std::this_thread::sleep_for(10ms);
    }
    assert(transport.writer_failed());
    assert(capture->contains("Outbound worker: write failed"));

    // The writer is gone; later payloads stay queued and unsent
    const auto sent_before = transport.get_bytes_sent();
    transport.send(block);
    std::this_thread::sleep_for(50ms);
    assert(transport.get_bytes_sent() == sent_before);
    assert(transport.pending_outbound() >= 1);

    auto t0 = std::chrono::steady_clock::now();
    conn.interrupt();
    transport.stop();
    conn.close();
    assert(std::chrono::steady_clock::now() - t0 < 1s);
    assert(transport.reader_finished());
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_read_timeout_is_retried() {
    std::cout << "=== Test 11: Read timeouts are retried ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    auto opts = async_options(server.port());
    opts.recv_timeout = 50ms;
    Client client(opts);
    assert(client.start());
    assert(server.wait_for_client(2s));

    // Several timeout periods pass with nothing to read
    std::error_code reason;
    const auto quiet_until = std::chrono::steady_clock::now() + 300ms;
    while (std::chrono::steady_clock::now() < quiet_until) {
        assert(!client.receive(reason).has_value());
        assert(reason == client_errc::no_data);
        std::this_thread::sleep_for(10ms);
    }
    assert(client.is_connected());

    assert(server.push("late"));
    std::string got;
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (got.size() < 4 && std::chrono::steady_clock::now() < deadline) {
        if (auto chunk = client.receive(reason)) {
            got += *chunk;
        } else {
            assert(reason != client_errc::peer_closed);
            std::this_thread::sleep_for(5ms);
        }
    }
    assert(got == "late");
    client.close();
    std::cout << "  OK" << std::endl << std::endl;
}

int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Client tests (async mode)" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_async_echo();
    test_async_send_before_start();
    test_async_fifo();
    test_async_receive_empty();
    test_async_close_unblocks_reader();
    test_async_send_after_close();
    test_async_start_failure();
    test_async_peer_close();
    test_async_bounded_queue();
    test_async_write_failure_stops_writer();
    test_async_read_timeout_is_retried();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}
