/**
 * \file ISocketLifecycle.hpp
 * \brief Common lifecycle and endpoint query interface for all socket roles.
 * \ingroup socket_backend
 */
#pragma once

#include <string>

/** \defgroup socket_backend Socket Backend
 *  \brief Role-based socket interfaces and the POSIX TCP backend used by the client core.
 */

/** \brief Base interface for common socket lifecycle and endpoint methods.
 *  \ingroup socket_backend
 */
struct ISocketLifecycle {
    virtual ~ISocketLifecycle() = default;

    /** \brief Close the underlying handle; subsequent operations fail with bad_file_descriptor. */
    virtual void close() = 0;
    /** \brief Shut both directions down - interrupts blocking reads and connects without releasing the handle. */
    virtual void shutdown() {}
    /** \brief True if the underlying handle is open. */
    virtual bool is_open() const = 0;
    /** \brief Native handle (or -1 if closed). */
    virtual int get_handle() const = 0;
    /** \brief Local endpoint string representation ("ip:port"). */
    virtual std::string local_endpoint() const = 0;
    /** \brief Remote endpoint string representation ("ip:port"). */
    virtual std::string remote_endpoint() const = 0;
    /** \brief Transport/backend type identifier (e.g. "posix_tcp"). */
    virtual std::string socket_type() const = 0;
};
