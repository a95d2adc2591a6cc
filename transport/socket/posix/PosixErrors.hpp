/**
 * \file PosixErrors.hpp
 * \brief errno and resolver (getaddrinfo) error translation for the POSIX backend.
 * \ingroup socket_backend
 */
#pragma once

#include <cerrno>
#include <system_error>

namespace transport { namespace posix {

/** \brief Category for getaddrinfo() EAI_* failures; message() uses gai_strerror. */
const std::error_category& resolver_category() noexcept;

/** \brief Wrap an EAI_* code; EAI_SYSTEM is unwrapped to the current errno. */
std::error_code make_resolver_error(int eai_code);

/** \brief True for errno values that mean "try again" on a socket call. */
inline bool is_would_block_errno(int err) {
#if defined(EWOULDBLOCK) && (EWOULDBLOCK != EAGAIN)
    if (err == EWOULDBLOCK) return true;
#endif
    return err == EAGAIN;
}

/**
 * \brief Convert an errno value to std::error_code (generic category).
 * \details EPIPE and ESHUTDOWN are folded into broken_pipe so callers have one
 *  value for "peer is gone" on the write side.
 */
inline std::error_code translate_errno(int err) {
    switch (err) {
        case EPIPE:
#ifdef ESHUTDOWN
        case ESHUTDOWN:
#endif
            return std::make_error_code(std::errc::broken_pipe);
        default:
            return std::error_code(err, std::generic_category());
    }
}

}} // namespace transport::posix
