/**
 * \file client/Client.hpp
 * \brief Dual-mode socket client: the single public surface of the core.
 */
#pragma once

#include "ClientOptions.hpp"
#include "Endpoint.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

class Logger;
struct IBlockingStream;

namespace LineBridge {

class ConnectionManager;
class ITransportMode;

/**
 * \brief Persistent TCP client with a synchronous or an asynchronous transport.
 *
 * Lifecycle is Created -> Started -> Closed. The mode is chosen at construction
 * and callers use the same send()/receive() either way:
 *  - Sync: send() writes on the calling thread and throws BrokenConnection on
 *    failure; receive() performs one blocking read.
 *  - Async: send() enqueues and returns; receive() pops without blocking.
 *
 * receive() returns std::nullopt for "no data" in both modes; it never throws.
 * The client is not restartable: after close() create a new one.
 */
class Client {
public:
    explicit Client(const ClientOptions& opts, std::shared_ptr<Logger> logger = nullptr);
    Client(const std::string& host, int port, ClientMode mode, std::shared_ptr<Logger> logger = nullptr);
    /** \brief For callers that supply their own stream implementation. */
    Client(const ClientOptions& opts, std::shared_ptr<IBlockingStream> stream, std::shared_ptr<Logger> logger);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /**
     * \brief Connect and, in async mode, launch the workers.
     * \return false if the connection could not be established; the reason is
     *  logged and available from last_error(). The client stays inert.
     */
    bool start();

    /** \brief See class description. Throws BrokenConnection in sync mode only. */
    void send(std::string_view payload);

    /** \brief Next reply as UTF-8 text, or std::nullopt. */
    std::optional<std::string> receive();
    /** \brief As receive(); `reason` tells why nothing was returned (client_errc or OS error). */
    std::optional<std::string> receive(std::error_code& reason);

    /** \brief Stop workers, close the socket. Idempotent; also run by the destructor. */
    void close();

    bool is_connected() const;
    /** \brief Reason of the last failed start(); empty if none. */
    std::error_code last_error() const;

    ClientMode mode() const { return opts_.mode; }
    const Endpoint& endpoint() const { return endpoint_; }
    std::uint64_t bytes_sent() const;
    std::uint64_t bytes_received() const;

private:
    ClientOptions opts_;
    Endpoint endpoint_;
    std::shared_ptr<Logger> logger_;

    std::unique_ptr<ConnectionManager> connection_;
    std::unique_ptr<ITransportMode> transport_;

    mutable std::mutex lifecycle_mtx_;  // Orders transport start against close
    std::error_code last_error_;
    bool closed_{false};
};

} // namespace LineBridge
