/**
 * \file client/ClientErrors.hpp
 * \brief Error codes and exceptions reported by the client core.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace LineBridge {

/** \brief Client-level failure reasons (category "line-bridge.client"). */
enum class client_errc {
    no_data = 1,        ///< Nothing queued for the caller yet.
    peer_closed,        ///< The remote end closed the stream.
    decode_failed,      ///< Received bytes are not valid UTF-8.
    not_connected,      ///< Operation on a client that is not started.
    connection_closed,  ///< The connection was closed; it cannot be reopened.
    write_failed        ///< The socket accepted zero bytes.
};

const std::error_category& client_category() noexcept;

inline std::error_code make_error_code(client_errc e) noexcept {
    return {static_cast<int>(e), client_category()};
}

/**
 * \brief Raised by synchronous send() when the peer is gone or the write fails.
 * \details code() carries the underlying reason (e.g. broken_pipe,
 *  connection_reset, client_errc::peer_closed). The client should not be used
 *  afterwards.
 */
class BrokenConnection : public std::system_error {
public:
    explicit BrokenConnection(std::error_code ec)
        : std::system_error(ec, "Socket connection broken") {}
    BrokenConnection(std::error_code ec, const std::string& what)
        : std::system_error(ec, what) {}
};

} // namespace LineBridge

namespace std {
template <>
struct is_error_code_enum<LineBridge::client_errc> : true_type {};
}
