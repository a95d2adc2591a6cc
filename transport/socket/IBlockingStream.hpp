/**
 * \file IBlockingStream.hpp
 * \brief Blocking stream interface (read/write + connect).
 * \ingroup socket_backend
 * \details Used by both the synchronous path and the dedicated worker threads
 *  of the asynchronous path.
 * \see IClientSocket
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <system_error>
#include "IClientSocket.hpp"

/** \brief Blocking stream role interface (client + read/write).
 *  \ingroup socket_backend
 */
struct IBlockingStream : public virtual IClientSocket {
    /**
     * \brief Blocking read of at most `size` bytes.
     * \details `bytes_read == 0` with no error means the peer closed the stream.
     *  An expired receive timeout sets `std::errc::timed_out`.
     */
    virtual void read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) = 0;
    /** \brief Single blocking write; fills `bytes_written` (may be short), sets `error` on failure. */
    virtual void write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) = 0;
    /** \brief Receive timeout applied to read(); zero disables it (reads block indefinitely). */
    virtual bool set_receive_timeout(std::chrono::milliseconds timeout) = 0;
    /** \brief Non-consuming check whether the peer has already sent end-of-stream. */
    virtual bool peer_closed() const = 0;
};
