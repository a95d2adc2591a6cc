//
// BridgeSession relay tests
//
// 1. Sync relay: blank lines skipped, one reply printed per line
// 2. clear() sends the clear command and discards the reply
// 3. Async: reply collected within the wait, transcript accumulates
// 4. Async: silent peer yields an empty reply after the wait; newline framing
// 5. Sync relay against a peer that closed raises BrokenConnection
//

#include "BridgeSession.hpp"
#include "client/Client.hpp"
#include "client/ClientErrors.hpp"
#include "client/testing/LoopbackServer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using namespace LineBridge;
using LineBridge::testing::LoopbackServer;

namespace {

ClientOptions client_options(int port, ClientMode mode) {
    ClientOptions opts;
    opts.mode = mode;
    opts.host = "127.0.0.1";
    opts.port = port;
    opts.idle_backoff = 10ms;
    return opts;
}

} // namespace

void test_sync_relay() {
    std::cout << "=== Test 1: Sync relay ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Echo);
    Client client(client_options(server.port(), ClientMode::Sync));
    assert(client.start());

    BridgeSession session(client, BridgeOptions{}, nullptr);
    std::istringstream in("obj 10 10 osc~ 440;\n\n   \r\nobj 10 50 dac~;\r\n");
    std::ostringstream out;
    assert(session.relay(in, out) == 2);
    assert(session.lines_sent() == 2);

    assert(server.wait_for_bytes(34, 2s));
    assert(server.received() == "obj 10 10 osc~ 440;obj 10 50 dac~;");
    assert(out.str() == "obj 10 10 osc~ 440;\nobj 10 50 dac~;\n");
    assert(session.console_output() == "obj 10 10 osc~ 440;obj 10 50 dac~;");

    session.clear_console();
    assert(session.console_output().empty());
    std::cout << "  OK" << std::endl << std::endl;
}

void test_clear_command() {
    std::cout << "=== Test 2: Clear command ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Echo);
    Client client(client_options(server.port(), ClientMode::Sync));
    assert(client.start());

    BridgeSession session(client, BridgeOptions{}, nullptr);
    session.clear();
    assert(server.received() == "clear;");
    assert(session.console_output().empty());
    assert(session.lines_sent() == 0);
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_reply_collection() {
    std::cout << "=== Test 3: Async reply collection ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Echo);
    Client client(client_options(server.port(), ClientMode::Async));
    assert(client.start());

    BridgeOptions opts;
    opts.reply_wait = 2s;
    BridgeSession session(client, opts, nullptr);

    auto t0 = std::chrono::steady_clock::now();
    std::string reply = session.send_line("msg 1;");
    // Returns on the first reply, well before the wait expires
    assert(std::chrono::steady_clock::now() - t0 < 1500ms);
    assert(reply == "msg 1;");

    reply = session.send_line("msg 2;");
    assert(reply == "msg 2;");
    assert(session.console_output() == "msg 1;msg 2;");
    std::cout << "  OK" << std::endl << std::endl;
}

void test_async_silent_peer() {
    std::cout << "=== Test 4: Async silent peer ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::Silent);
    Client client(client_options(server.port(), ClientMode::Async));
    assert(client.start());

    BridgeOptions opts;
    opts.reply_wait = 100ms;
    opts.append_newline = true;
    BridgeSession session(client, opts, nullptr);

    auto t0 = std::chrono::steady_clock::now();
    std::string reply = session.send_line("obj 1 1 print;");
    auto waited = std::chrono::steady_clock::now() - t0;
    assert(reply.empty());
    assert(waited >= 90ms);
    assert(server.wait_for_bytes(15, 2s));
    assert(server.received() == "obj 1 1 print;\n");

    // Unsolicited output shows up with the next line's reply
    assert(server.push("print: late\n"));
    std::this_thread::sleep_for(100ms);
    reply = session.send_line("x;");
    assert(reply == "print: late\n");
    assert(session.console_output() == "print: late\n");
    std::cout << "  OK" << std::endl << std::endl;
}

void test_sync_relay_broken() {
    std::cout << "=== Test 5: Sync relay to closed peer ===" << std::endl;

    LoopbackServer server(LoopbackServer::Behavior::CloseOnAccept);
    Client client(client_options(server.port(), ClientMode::Sync));
    assert(client.start());
    assert(server.wait_for_client(2s));
    std::this_thread::sleep_for(100ms);

    BridgeSession session(client, BridgeOptions{}, nullptr);
    std::istringstream in("obj 10 10 osc~ 440;\n");
    std::ostringstream out;
    bool raised = false;
    try {
        session.relay(in, out);
    } catch (const BrokenConnection&) {
        raised = true;
    }
    assert(raised);
    assert(out.str().empty());
    std::cout << "  OK" << std::endl << std::endl;
}

int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "BridgeSession tests" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_sync_relay();
    test_clear_command();
    test_async_reply_collection();
    test_async_silent_peer();
    test_sync_relay_broken();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}
