/**
 * \file client/ClientOptions.hpp
 * \brief Client configuration and its CLI/config option helpers.
 */
#pragma once

#include "threadSafeQueue.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace LineBridge {

/** \brief Transport strategy selected for a client; fixed at construction. */
enum class ClientMode { Sync, Async };

/** \brief Aggregated client connection and transport configuration. */
struct ClientOptions {
    ClientMode mode{ClientMode::Async};                  ///< Blocking or queue-mediated transport.
    std::string host{"localhost"};                      ///< Remote host name or IP.
    int port{3001};                                      ///< Remote port.
    std::chrono::milliseconds recv_timeout{0};           ///< SO_RCVTIMEO; 0 blocks indefinitely.
    std::chrono::milliseconds connect_timeout{0};        ///< 0 waits as long as the OS does.
    std::chrono::milliseconds idle_backoff{50};          ///< Outbound worker wait per empty poll.
    std::size_t queue_capacity{0};                       ///< 0 = unbounded queues.
    OverflowPolicy overflow_policy{OverflowPolicy::Block};
};

std::string to_string(ClientMode mode);
std::optional<ClientMode> parse_client_mode(const std::string& text);
std::string to_string(OverflowPolicy policy);
std::optional<OverflowPolicy> parse_overflow_policy(const std::string& text);

namespace client_opts {
    /** \brief Register the "Client" option group (idempotent; also runs at static init). */
    void register_options();
    /** \brief Options as resolved by the last Options::load_and_parse(). */
    ClientOptions current();
    /** \brief Raw --socket-type value, if any. */
    std::optional<std::string> get_socket_type();
} // namespace client_opts

} // namespace LineBridge
