/**
 * \file client/mode/AsyncTransport.hpp
 * \brief Queue-mediated implementation of \c ITransportMode with two worker threads.
 */
#pragma once

#include "ITransportMode.hpp"
#include "threadSafeQueue.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class Logger;

namespace LineBridge {

class ConnectionManager;

/**
 * \brief Decouples callers from the socket through two FIFO queues.
 *
 * send() only enqueues; an outbound worker drains the queue onto the socket.
 * An inbound worker reads chunks of up to kReceiveChunk bytes and enqueues them
 * verbatim; receive() pops without blocking. Payloads sent before start() stay
 * queued until the workers run. Both workers stop once the connection's exit
 * signal is raised.
 */
class AsyncTransport : public ITransportMode {
public:
    /** \brief Read size of one inbound worker iteration. */
    static constexpr size_t kReceiveChunk = 1024;

    /**
     * \param connection Connection whose stream and exit signal the workers use.
     * \param idle_backoff How long the outbound worker waits on an empty queue before re-checking the exit signal.
     * \param queue_capacity 0 for unbounded queues.
     * \param policy Applied to both queues when bounded.
     */
    AsyncTransport(ConnectionManager& connection, std::shared_ptr<Logger> logger,
                   std::chrono::milliseconds idle_backoff = std::chrono::milliseconds{50},
                   std::size_t queue_capacity = 0, OverflowPolicy policy = OverflowPolicy::Block);
    ~AsyncTransport() override;

    /** \brief Launch the outbound and inbound workers (once). */
    void start() override;
    /** \brief Enqueue; never touches the socket. Dropped (and logged) after stop(). */
    void send(std::string payload) override;
    /** \brief Non-blocking pop of the next received chunk. */
    std::optional<std::string> receive(std::error_code& reason) override;
    /** \brief Wake and join both workers. */
    void stop() override;
    const char* name() const override { return "async"; }
    std::uint64_t get_bytes_sent() const override;
    std::uint64_t get_bytes_received() const override;

    /** \brief Payloads waiting for the outbound worker. */
    std::size_t pending_outbound() const { return outbound_.size(); }
    /** \brief True once the outbound worker gave up after a failed write. */
    bool writer_failed() const { return writer_failed_.load(std::memory_order_acquire); }
    /** \brief True once the inbound worker saw end-of-stream or a read error. */
    bool reader_finished() const { return reader_finished_.load(std::memory_order_acquire); }

private:
    void outbound_loop();
    void inbound_loop();

    ConnectionManager& connection_;
    std::shared_ptr<Logger> logger_;
    const std::chrono::milliseconds idle_backoff_;

    ThreadSafeQueue<std::string> outbound_;
    ThreadSafeQueue<std::string> inbound_;

    std::mutex workers_mtx_;
    std::thread outbound_thread_;
    std::thread inbound_thread_;
    bool started_{false};

    std::atomic<bool> writer_failed_{false};
    std::atomic<bool> reader_finished_{false};
    std::atomic<std::uint64_t> bytes_sent_{0};
    std::atomic<std::uint64_t> bytes_received_{0};
};

} // namespace LineBridge
