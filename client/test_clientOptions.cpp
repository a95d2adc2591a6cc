//
// Client option parsing tests
//
// 1. Built-in defaults
// 2. JSON "client" section seeds values, CLI flags override them
// 3. Invalid values and malformed config files are parse errors
// 4. Mode and overflow-policy string helpers
//

#include "ClientOptions.hpp"
#include <options/Options.hpp>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace LineBridge;
using shared_opts::Options;

namespace {

Options::ParseResult parse(std::vector<std::string> args, std::string& err) {
    args.insert(args.begin(), "line-bridge");
    std::vector<const char*> argv;
    for (const auto& a : args) argv.push_back(a.c_str());
    return Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), err);
}

std::filesystem::path write_config(const std::string& name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << body;
    return path;
}

} // namespace

void test_defaults() {
    std::cout << "=== Test 1: Defaults ===" << std::endl;

    std::string err;
    assert(parse({}, err) == Options::ParseResult::Ok);
    auto opts = client_opts::current();
    assert(opts.mode == ClientMode::Sync);
    assert(opts.host == "localhost");
    assert(opts.port == 3001);
    assert(opts.recv_timeout.count() == 0);
    assert(opts.idle_backoff.count() == 50);
    assert(opts.queue_capacity == 0);
    assert(opts.overflow_policy == OverflowPolicy::Block);
    assert(!client_opts::get_socket_type().has_value());
    assert(!Options::get_config_file().has_value());
    std::cout << "  OK" << std::endl << std::endl;
}

void test_json_then_cli_override() {
    std::cout << "=== Test 2: JSON config with CLI override ===" << std::endl;

    auto path = write_config("line_bridge_test_client.json", R"({
        "client": {
            "host": "10.0.0.5",
            "port": 4000,
            "mode": "async",
            "recv_timeout_ms": 250,
            "queue_capacity": 16,
            "overflow_policy": "drop_oldest"
        }
    })");

    std::string err;
    assert(parse({"-c", path.string()}, err) == Options::ParseResult::Ok);
    auto opts = client_opts::current();
    assert(opts.host == "10.0.0.5");
    assert(opts.port == 4000);
    assert(opts.mode == ClientMode::Async);
    assert(opts.recv_timeout.count() == 250);
    assert(opts.queue_capacity == 16);
    assert(opts.overflow_policy == OverflowPolicy::DropOldest);
    assert(Options::get_config_dir().has_value());

    assert(parse({"-c", path.string(), "--port", "5000", "--mode", "sync"}, err) == Options::ParseResult::Ok);
    opts = client_opts::current();
    assert(opts.host == "10.0.0.5");
    assert(opts.port == 5000);
    assert(opts.mode == ClientMode::Sync);

    // A later parse without -c starts again from the built-in defaults
    assert(parse({}, err) == Options::ParseResult::Ok);
    assert(client_opts::current().host == "localhost");

    std::filesystem::remove(path);
    std::cout << "  OK" << std::endl << std::endl;
}

void test_parse_errors() {
    std::cout << "=== Test 3: Parse errors ===" << std::endl;

    std::string err;
    assert(parse({"--mode", "turbo"}, err) == Options::ParseResult::Error);
    assert(!err.empty());

    err.clear();
    assert(parse({"--port", "70000"}, err) == Options::ParseResult::Error);
    assert(!err.empty());

    err.clear();
    assert(parse({"--no-such-flag"}, err) == Options::ParseResult::Error);

    auto bad = write_config("line_bridge_test_bad.json", "{ \"client\": { \"port\": ");
    err.clear();
    assert(parse({"-c", bad.string()}, err) == Options::ParseResult::Error);
    assert(err.find("malformed") != std::string::npos);
    std::filesystem::remove(bad);

    err.clear();
    assert(parse({"-c", "/nonexistent/line-bridge.json"}, err) == Options::ParseResult::Error);
    assert(err.find("cannot open") != std::string::npos);
    std::cout << "  OK" << std::endl << std::endl;
}

void test_string_helpers() {
    std::cout << "=== Test 4: String helpers ===" << std::endl;

    assert(parse_client_mode("SYNC") == ClientMode::Sync);
    assert(parse_client_mode("blocking") == ClientMode::Sync);
    assert(parse_client_mode("async") == ClientMode::Async);
    assert(!parse_client_mode("threads").has_value());
    assert(to_string(ClientMode::Async) == "async");

    assert(parse_overflow_policy("reject") == OverflowPolicy::Reject);
    assert(!parse_overflow_policy("spill").has_value());
    assert(to_string(OverflowPolicy::DropOldest) == "drop_oldest");
    std::cout << "  OK" << std::endl << std::endl;
}

int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Client option tests" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_defaults();
    test_json_then_cli_override();
    test_parse_errors();
    test_string_helpers();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}
