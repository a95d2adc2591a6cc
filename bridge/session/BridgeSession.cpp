/**
 * \file bridge/session/BridgeSession.cpp
 * \brief Implementation of the line relay.
 */
#include "BridgeSession.hpp"
#include "client/Client.hpp"

#include <chrono>
#include <istream>
#include <ostream>
#include <thread>

namespace LineBridge {

namespace {

constexpr std::chrono::milliseconds kPollInterval{5};

bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

} // namespace

BridgeSession::BridgeSession(Client& client, const BridgeOptions& opts, std::shared_ptr<Logger> logger)
    : client_(client), opts_(opts), logger_(std::move(logger)) {}

std::string BridgeSession::send_line(std::string_view line) {
    std::string payload(line);
    if (opts_.append_newline) {
        payload.push_back('\n');
    }
    client_.send(payload);
    ++lines_sent_;

    std::string reply = collect_reply();
    console_ += reply;
    if (logger_ && !reply.empty()) {
        logger_->debug("reply (" + std::to_string(reply.size()) + " B) for: " + std::string(line));
    }
    return reply;
}

void BridgeSession::clear() {
    client_.send(kClearCommand);
    collect_reply();
    if (logger_) logger_->info("Sent clear command");
}

std::size_t BridgeSession::relay(std::istream& in, std::ostream& out) {
    std::size_t sent = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line)) {
            continue;
        }
        std::string reply = send_line(line);
        ++sent;
        if (!reply.empty()) {
            out << reply;
            if (reply.back() != '\n') out << '\n';
            out.flush();
        }
    }
    if (logger_) logger_->info("Relayed " + std::to_string(sent) + " line(s)");
    return sent;
}

std::string BridgeSession::collect_reply() {
    if (client_.mode() == ClientMode::Sync) {
        return client_.receive().value_or(std::string{});
    }

    std::string reply;
    const auto deadline = std::chrono::steady_clock::now() + opts_.reply_wait;
    // Wait for the first chunk, then take whatever else is already queued
    while (reply.empty()) {
        if (auto chunk = client_.receive()) {
            reply += *chunk;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return reply;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    while (auto chunk = client_.receive()) {
        reply += *chunk;
    }
    return reply;
}

} // namespace LineBridge
