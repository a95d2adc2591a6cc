/**
 * \file client/ConnectionManager.hpp
 * \brief Owns the client's socket and its Unconnected -> Connected -> Closed lifecycle.
 */
#pragma once

#include "Endpoint.hpp"
#include "exitSignal.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

class Logger;
struct IBlockingStream;

namespace LineBridge {

/** \brief Connection lifecycle; Closed is terminal. */
enum class ConnectionState { Unconnected, Connected, Closed };

std::string to_string(ConnectionState state);

/**
 * \brief Establishes and tears down the single connection of a client.
 *
 * Also owns the ExitSignal the async workers observe. Teardown is split in two
 * so the facade can join its workers between the steps: interrupt() raises the
 * signal and shuts the stream down (a blocked read returns), close() releases
 * the descriptor and enters Closed.
 */
class ConnectionManager {
public:
    /**
     * \param socket Stream to connect; exclusively owned by this manager from now on.
     * \param logger Optional diagnostics sink.
     */
    ConnectionManager(std::shared_ptr<IBlockingStream> socket, std::shared_ptr<Logger> logger);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * \brief Connect to `endpoint`; never throws.
     * \return Empty on success. Otherwise the OS/resolver reason, or
     *  client_errc::connection_closed when called after close().
     */
    std::error_code connect(const Endpoint& endpoint,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    /** \brief True after a successful connect() until interrupt()/close(). */
    bool is_connected() const;
    ConnectionState state() const { return state_.load(std::memory_order_acquire); }

    /** \brief Raise the exit signal and unblock any thread blocked on the socket. Idempotent. */
    void interrupt();
    /** \brief interrupt(), then release the socket and enter Closed. Idempotent; safe before connect(). */
    void close();

    IBlockingStream& stream() const { return *socket_; }
    const ExitSignal& exit_signal() const { return exit_signal_; }

    /** \brief Endpoint of the last connect() attempt, if any. */
    std::optional<Endpoint> endpoint() const;
    std::string local_endpoint() const;
    std::string remote_endpoint() const;

private:
    std::shared_ptr<IBlockingStream> socket_;
    std::shared_ptr<Logger> logger_;
    ExitSignal exit_signal_;
    std::atomic<ConnectionState> state_{ConnectionState::Unconnected};
    std::atomic<bool> released_{false};
    mutable std::mutex endpoint_mtx_;
    std::optional<Endpoint> endpoint_;
};

} // namespace LineBridge
