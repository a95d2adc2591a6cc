/**
 * \file SocketFactory.hpp
 * \brief Factory helpers for creating role-based socket implementations.
 * \ingroup socket_backend
 * \details Centralizes backend resolution and construction so the client core
 *  only sees IBlockingStream.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

struct IBlockingStream;
class Logger;

namespace transport {

/** \brief Supported socket backend types for factory resolution. */
enum class SocketType
{
    PosixTcp
};

/** \brief Map a backend name ("posix", "tcp") to a SocketType; nullopt if unknown. */
std::optional<SocketType> parse_socket_type(const std::string& name);

/** \brief Static factory for creating role-based socket implementations.
 *  \ingroup socket_backend
 */
class SocketFactory {
public:
    /** \brief Set default backend type. */
    static void set_default_socket_type(SocketType type) noexcept;
    /** \brief Retrieve current default backend type. */
    static SocketType get_default_socket_type() noexcept;

    /** \brief Create a blocking client stream with optional logger injection. */
    static std::shared_ptr<IBlockingStream> create_blocking_client(std::shared_ptr<Logger> logger);

private:
    SocketFactory() = delete;

    static inline SocketType default_type_ = SocketType::PosixTcp;
};

} // namespace transport
