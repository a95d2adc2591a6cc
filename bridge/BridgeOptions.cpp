/**
 * \file bridge/BridgeOptions.cpp
 * \brief Bridge CLI and configuration option helpers.
 */
#include "BridgeOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <atomic>
#include <mutex>

namespace LineBridge { namespace bridge_opts {

static std::mutex g_mtx;
static int g_reply_wait_ms{500};
static bool g_append_newline{false};
static bool g_clear_first{false};
static std::string g_log_level{"info"};
static std::atomic<bool> g_registered{false};

BridgeOptions current() {
    std::lock_guard<std::mutex> lk(g_mtx);
    BridgeOptions opts;
    opts.reply_wait = std::chrono::milliseconds{g_reply_wait_ms};
    opts.append_newline = g_append_newline;
    opts.clear_first = g_clear_first;
    return opts;
}

std::string get_log_level() {
    std::lock_guard<std::mutex> lk(g_mtx);
    return g_log_level;
}

void register_options() {
    bool expected = false;
    if (!g_registered.compare_exchange_strong(expected, true))
        return;
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        std::lock_guard<std::mutex> lk(g_mtx);
        g_reply_wait_ms = 500;
        g_append_newline = false;
        g_clear_first = false;
        g_log_level = "info";

        if (j.contains("bridge") && j["bridge"].is_object()) {
            const auto& b = j["bridge"];
            if (b.contains("reply_wait_ms") && b["reply_wait_ms"].is_number_integer())
                g_reply_wait_ms = b["reply_wait_ms"].get<int>();
            if (b.contains("append_newline") && b["append_newline"].is_boolean())
                g_append_newline = b["append_newline"].get<bool>();
            if (b.contains("clear_first") && b["clear_first"].is_boolean())
                g_clear_first = b["clear_first"].get<bool>();
        }
        if (j.contains("logging") && j["logging"].contains("level") && j["logging"]["level"].is_string()) {
            g_log_level = j["logging"]["level"].get<std::string>();
        }

        app.add_option("--reply-wait-ms", g_reply_wait_ms, "Async mode: wait for a reply per line, in ms")
            ->check(CLI::NonNegativeNumber)
            ->capture_default_str()
            ->group("Bridge");
        app.add_flag("--append-newline", g_append_newline, "Terminate each payload with a newline")
            ->group("Bridge");
        app.add_flag("--clear-first", g_clear_first, "Send the remote clear command before relaying")
            ->group("Bridge");
        app.add_option("--log-level", g_log_level, "Log level: debug|info|warning|error|critical")
            ->transform(CLI::IsMember({"debug", "info", "warning", "warn", "error", "critical"}, CLI::ignore_case))
            ->capture_default_str()
            ->group("Logging");
    });
}

} } // namespace LineBridge::bridge_opts

namespace {
    struct BridgeOptsAutoReg {
        BridgeOptsAutoReg() { LineBridge::bridge_opts::register_options(); }
    } bridge_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
