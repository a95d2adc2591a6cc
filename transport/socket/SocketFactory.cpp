/**
 * \file SocketFactory.cpp
 * \brief Backend resolution and construction logic for role-based sockets.
 * \ingroup socket_backend
 */
#include "SocketFactory.hpp"
#include "IBlockingStream.hpp"
#include "posix/PosixSocket.hpp" // kept private to implementation
#include "logger.hpp"
#include <cctype>
#include <stdexcept>

namespace transport {

std::optional<SocketType> parse_socket_type(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "posix" || lower == "tcp" || lower == "posix_tcp") {
        return SocketType::PosixTcp;
    }
    return std::nullopt;
}

void SocketFactory::set_default_socket_type(SocketType type) noexcept { default_type_ = type; }
SocketType SocketFactory::get_default_socket_type() noexcept { return default_type_; }

std::shared_ptr<IBlockingStream> SocketFactory::create_blocking_client(std::shared_ptr<Logger> logger) {
    switch (default_type_) {
        case SocketType::PosixTcp:
            return PosixSocket::create(std::move(logger));
        default:
            throw std::invalid_argument("Unsupported socket type for SocketFactory blocking client");
    }
}

} // namespace transport
