/**
 * \file client/mode/AsyncTransport.cpp
 * \brief Worker-thread implementation of the queue-mediated transport.
 */
#include "AsyncTransport.hpp"
#include "StreamIo.hpp"
#include "client/ClientErrors.hpp"
#include "client/ConnectionManager.hpp"
#include "transport/socket/IBlockingStream.hpp"
#include "processUtils.hpp"
#include "utf8.hpp"
#include "logger.hpp"

#include <array>
#include <exception>

namespace LineBridge {

AsyncTransport::AsyncTransport(ConnectionManager& connection, std::shared_ptr<Logger> logger,
                               std::chrono::milliseconds idle_backoff, std::size_t queue_capacity,
                               OverflowPolicy policy)
    : connection_(connection)
    , logger_(std::move(logger))
    , idle_backoff_(idle_backoff.count() > 0 ? idle_backoff : std::chrono::milliseconds{1})
    , outbound_(queue_capacity, policy)
    , inbound_(queue_capacity, policy) {}

AsyncTransport::~AsyncTransport() {
    stop();
}

void AsyncTransport::start() {
    std::lock_guard<std::mutex> lk(workers_mtx_);
    if (started_) {
        return;
    }
    started_ = true;
    outbound_thread_ = std::thread([this]() { outbound_loop(); });
    inbound_thread_ = std::thread([this]() { inbound_loop(); });
    if (logger_) {
        logger_->debug("Async workers started; " + std::to_string(outbound_.size()) + " payload(s) already queued");
    }
}

void AsyncTransport::send(std::string payload) {
    if (payload.empty()) {
        return;
    }
    const size_t size = payload.size();
    if (!outbound_.push(std::move(payload))) {
        if (logger_) {
            logger_->debug("send: dropped " + std::to_string(size) + " bytes (" +
                           (outbound_.is_shutdown() ? "transport stopped" : "outbound queue full") + ")");
        }
    }
}

std::optional<std::string> AsyncTransport::receive(std::error_code& reason) {
    auto chunk = inbound_.try_pop();
    if (!chunk) {
        reason = reader_finished() ? make_error_code(client_errc::peer_closed)
                                   : make_error_code(client_errc::no_data);
        return std::nullopt;
    }
    if (!text::is_valid_utf8(*chunk)) {
        if (logger_) logger_->warning("receive: dropping " + std::to_string(chunk->size()) + " bytes of invalid UTF-8");
        reason = make_error_code(client_errc::decode_failed);
        return std::nullopt;
    }
    reason.clear();
    return chunk;
}

void AsyncTransport::stop() {
    outbound_.shutdown();
    inbound_.shutdown();

    std::thread outbound;
    std::thread inbound;
    {
        std::lock_guard<std::mutex> lk(workers_mtx_);
        outbound = std::move(outbound_thread_);
        inbound = std::move(inbound_thread_);
    }
    // Join outside the lock; workers exit once they observe the exit signal
    if (outbound.joinable()) outbound.join();
    if (inbound.joinable()) inbound.join();
}

void AsyncTransport::outbound_loop() {
    ProcessUtils::set_current_thread_name("lb-outbound");
    if (logger_) logger_->debug("Outbound worker running (" + ProcessUtils::get_thread_info() + ")");
    const ExitSignal& exit_signal = connection_.exit_signal();
    IBlockingStream& stream = connection_.stream();

    try {
        while (!exit_signal.is_set()) {
            auto payload = outbound_.pop_for(idle_backoff_);
            if (!payload) {
                if (outbound_.is_shutdown()) break;
                continue;
            }
            if (exit_signal.is_set()) {
                break;
            }

            std::error_code ec;
            std::uint64_t written = 0;
            const bool ok = write_all(stream, *payload, written, ec);
            bytes_sent_.fetch_add(written, std::memory_order_relaxed);
            if (!ok) {
                if (exit_signal.is_set()) break;
                // No reconnect here; later payloads stay queued and unsent
                writer_failed_.store(true, std::memory_order_release);
                if (logger_) logger_->error("Outbound worker: write failed (" + ec.message() + "); stopping writes");
                break;
            }
        }
    } catch (const std::exception& e) {
        writer_failed_.store(true, std::memory_order_release);
        if (logger_) logger_->error(std::string{"Outbound worker exception: "} + e.what());
    }
    if (logger_) logger_->debug("Outbound worker exiting");
}

void AsyncTransport::inbound_loop() {
    ProcessUtils::set_current_thread_name("lb-inbound");
    if (logger_) logger_->debug("Inbound worker running (" + ProcessUtils::get_thread_info() + ")");
    const ExitSignal& exit_signal = connection_.exit_signal();
    IBlockingStream& stream = connection_.stream();
    std::array<char, kReceiveChunk> buffer{};

    try {
        while (!exit_signal.is_set()) {
            size_t br = 0;
            std::error_code ec;
            stream.read(buffer.data(), buffer.size(), br, ec);

            if (ec == std::errc::timed_out) {
                continue;
            }
            if (exit_signal.is_set()) {
                break;
            }
            if (ec) {
                if (logger_) logger_->warning("Inbound worker: read failed (" + ec.message() + "); stopping reads");
                break;
            }
            if (br == 0) {
                if (logger_) logger_->info("Inbound worker: peer closed the connection");
                break;
            }

            bytes_received_.fetch_add(static_cast<std::uint64_t>(br), std::memory_order_relaxed);
            inbound_.push(std::string(buffer.data(), br));
        }
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string{"Inbound worker exception: "} + e.what());
    }
    reader_finished_.store(true, std::memory_order_release);
    if (logger_) logger_->debug("Inbound worker exiting");
}

std::uint64_t AsyncTransport::get_bytes_sent() const {
    return bytes_sent_.load(std::memory_order_relaxed);
}

std::uint64_t AsyncTransport::get_bytes_received() const {
    return bytes_received_.load(std::memory_order_relaxed);
}

} // namespace LineBridge
