/**
 * \file client/ClientOptions.cpp
 * \brief Client CLI and configuration option helpers.
 */
#include "ClientOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <atomic>
#include <cctype>
#include <mutex>

namespace LineBridge {

namespace {

std::string lowercase(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    return out;
}

} // namespace

std::string to_string(ClientMode mode) {
    return mode == ClientMode::Sync ? "sync" : "async";
}

std::optional<ClientMode> parse_client_mode(const std::string& text) {
    const auto lower = lowercase(text);
    if (lower == "sync" || lower == "blocking") return ClientMode::Sync;
    if (lower == "async") return ClientMode::Async;
    return std::nullopt;
}

std::string to_string(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::Block:      return "block";
        case OverflowPolicy::DropOldest: return "drop_oldest";
        case OverflowPolicy::Reject:     return "reject";
    }
    return "block";
}

std::optional<OverflowPolicy> parse_overflow_policy(const std::string& text) {
    const auto lower = lowercase(text);
    if (lower == "block") return OverflowPolicy::Block;
    if (lower == "drop_oldest") return OverflowPolicy::DropOldest;
    if (lower == "reject") return OverflowPolicy::Reject;
    return std::nullopt;
}

namespace client_opts {

/// Values bound to CLI11 options; seeded from the "client" JSON section.
static std::mutex g_mtx;
static std::string g_mode_str{"sync"};
static std::string g_host{"localhost"};
static int g_port{3001};
static int g_recv_timeout_ms{0};
static int g_connect_timeout_ms{0};
static int g_idle_backoff_ms{50};
static std::size_t g_queue_capacity{0};
static std::string g_overflow_policy{"block"};
static std::optional<std::string> g_socket_type;
static std::atomic<bool> g_registered{false};

ClientOptions current() {
    std::lock_guard<std::mutex> lk(g_mtx);
    ClientOptions opts;
    opts.mode = parse_client_mode(g_mode_str).value_or(ClientMode::Sync);
    opts.host = g_host;
    opts.port = g_port;
    opts.recv_timeout = std::chrono::milliseconds{g_recv_timeout_ms};
    opts.connect_timeout = std::chrono::milliseconds{g_connect_timeout_ms};
    opts.idle_backoff = std::chrono::milliseconds{g_idle_backoff_ms};
    opts.queue_capacity = g_queue_capacity;
    opts.overflow_policy = parse_overflow_policy(g_overflow_policy).value_or(OverflowPolicy::Block);
    return opts;
}

std::optional<std::string> get_socket_type() {
    std::lock_guard<std::mutex> lk(g_mtx);
    return g_socket_type;
}

void register_options() {
    bool expected = false;
    if (!g_registered.compare_exchange_strong(expected, true))
        return;
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        std::lock_guard<std::mutex> lk(g_mtx);
        // Reset to built-in defaults, then let the JSON section override them
        g_mode_str = "sync";
        g_host = "localhost";
        g_port = 3001;
        g_recv_timeout_ms = 0;
        g_connect_timeout_ms = 0;
        g_idle_backoff_ms = 50;
        g_queue_capacity = 0;
        g_overflow_policy = "block";
        g_socket_type.reset();

        if (j.contains("client") && j["client"].is_object()) {
            const auto& c = j["client"];
            if (c.contains("mode") && c["mode"].is_string()) g_mode_str = lowercase(c["mode"].get<std::string>());
            if (c.contains("host") && c["host"].is_string()) g_host = c["host"].get<std::string>();
            if (c.contains("port") && c["port"].is_number_integer()) g_port = c["port"].get<int>();
            if (c.contains("recv_timeout_ms") && c["recv_timeout_ms"].is_number_integer())
                g_recv_timeout_ms = c["recv_timeout_ms"].get<int>();
            if (c.contains("connect_timeout_ms") && c["connect_timeout_ms"].is_number_integer())
                g_connect_timeout_ms = c["connect_timeout_ms"].get<int>();
            if (c.contains("idle_backoff_ms") && c["idle_backoff_ms"].is_number_integer())
                g_idle_backoff_ms = c["idle_backoff_ms"].get<int>();
            if (c.contains("queue_capacity") && c["queue_capacity"].is_number_unsigned())
                g_queue_capacity = c["queue_capacity"].get<std::size_t>();
            if (c.contains("overflow_policy") && c["overflow_policy"].is_string())
                g_overflow_policy = lowercase(c["overflow_policy"].get<std::string>());
            if (c.contains("socket_type") && c["socket_type"].is_string())
                g_socket_type = c["socket_type"].get<std::string>();
        }

        app.add_option("--mode", g_mode_str, "Transport mode: sync|async")
            ->check(CLI::IsMember({"sync", "async"}))
            ->capture_default_str()
            ->group("Client");
        app.add_option("--host", g_host, "Remote host")
            ->capture_default_str()
            ->group("Client");
        app.add_option("--port", g_port, "Remote port")
            ->check(CLI::Range(1, 65535))
            ->capture_default_str()
            ->group("Client");
        app.add_option("--recv-timeout-ms", g_recv_timeout_ms, "Socket receive timeout in ms (0 = none)")
            ->check(CLI::NonNegativeNumber)
            ->capture_default_str()
            ->group("Client");
        app.add_option("--connect-timeout-ms", g_connect_timeout_ms, "Connect timeout in ms (0 = OS default)")
            ->check(CLI::NonNegativeNumber)
            ->capture_default_str()
            ->group("Client");
        app.add_option("--idle-backoff-ms", g_idle_backoff_ms, "Async outbound worker idle wait in ms")
            ->check(CLI::Range(1, 10000))
            ->capture_default_str()
            ->group("Client");
        app.add_option("--queue-capacity", g_queue_capacity, "Async queue capacity (0 = unbounded)")
            ->capture_default_str()
            ->group("Client");
        app.add_option("--overflow-policy", g_overflow_policy, "Full-queue policy: block|drop_oldest|reject")
            ->check(CLI::IsMember({"block", "drop_oldest", "reject"}))
            ->capture_default_str()
            ->group("Client");
        app.add_option("--socket-type", g_socket_type, "Socket backend type (posix)")
            ->group("Client");
    });
}

} // namespace client_opts

} // namespace LineBridge

namespace {
    struct ClientOptsAutoReg {
        ClientOptsAutoReg() { LineBridge::client_opts::register_options(); }
    } client_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
