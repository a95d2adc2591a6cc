/**
 * \file PosixSocket.hpp
 * \brief BSD-socket implementation of IBlockingStream.
 * \ingroup socket_backend
 * \details Blocking TCP stream backed by the host network stack. Connect is
 *  driven in non-blocking mode with a poll loop so that shutdown() from another
 *  thread can abandon it; once connected the descriptor is switched back to
 *  blocking mode for read/write.
 */
#pragma once

#include "transport/socket/IBlockingStream.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

class Logger;

namespace transport {

/** \brief Host TCP stream implementing the blocking client role.
 *  \ingroup socket_backend
 */
class PosixSocket : public virtual IBlockingStream {
public:
    // === Construction & Lifecycle ===
    /** \brief Create an unopened client socket; the descriptor is created by connect(). */
    PosixSocket();

    /** \brief Create an unopened client socket with logger injection. */
    explicit PosixSocket(std::shared_ptr<Logger> logger);

    /** \brief Closes the descriptor if still open. */
    ~PosixSocket() override;

    PosixSocket(const PosixSocket&) = delete;
    PosixSocket& operator=(const PosixSocket&) = delete;

    // === IClientSocket ===
    /** \brief Resolve `host` and connect to the first address that accepts.
     *  \param host Hostname or numeric address; resolver failures are reported via resolver_category().
     *  \param port Port number (1..65535).
     *  \param error Cleared on success; otherwise the reason of the last failed attempt.
     *  \param timeout Per-address handshake limit; zero waits for the OS.
     */
    void connect(const std::string& host, int port, std::error_code& error,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) override;

    // === IBlockingStream ===
    void read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) override;
    void write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) override;
    bool set_receive_timeout(std::chrono::milliseconds timeout) override;
    bool peer_closed() const override;

    // === Closing / teardown ===
    /** \brief Release the descriptor. Call shutdown() first if another thread may be blocked on it. */
    void close() override;

    /** \brief Interrupt blocked reads and any in-progress connect.
     *  \details Sets a flag observed by the connect poll loop and shuts both
     *  directions of the stream down; the descriptor stays valid until close().
     */
    void shutdown() override;

    // === Status & information ===
    bool is_open() const override;
    int get_handle() const override;
    std::string local_endpoint() const override;
    std::string remote_endpoint() const override;
    std::string socket_type() const override;

    /** \brief Enable or disable TCP_NODELAY. Call after the connection is established. */
    bool set_no_delay(bool enable);

    // === Factory helpers ===
    static std::shared_ptr<PosixSocket> create(std::shared_ptr<Logger> logger = nullptr);

private:
    /** \brief Try one resolved address; on success the fd is left in socket_fd_. */
    bool connect_one(const void* addr, unsigned addr_len, int family, std::chrono::milliseconds timeout,
                     std::error_code& error);

    /** \brief Apply per-descriptor options (cloexec, nosigpipe, receive timeout). */
    void setup_socket(int fd);

    /** \brief Snapshot the descriptor under lock. */
    int current_fd() const;

    mutable std::mutex socket_mtx_;  // Protects socket_fd_
    int socket_fd_{-1};
    std::atomic<bool> shutdown_requested_{false};
    std::chrono::milliseconds recv_timeout_{0};

    std::shared_ptr<Logger> logger_{};
};

} // namespace transport
