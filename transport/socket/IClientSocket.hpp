/**
 * \file IClientSocket.hpp
 * \brief Client connection interface.
 * \ingroup socket_backend
 */
#pragma once

#include <chrono>
#include <string>
#include <system_error>
#include "ISocketLifecycle.hpp"

/** \brief Client socket role interface.
 *  \ingroup socket_backend
 */
struct IClientSocket : public virtual ISocketLifecycle {
    /**
     * \brief Establish a blocking connection; sets `error` on failure (non-throwing).
     * \param timeout Upper bound for the handshake; zero waits as long as the OS does.
     */
    virtual void connect(const std::string& host, int port, std::error_code& error,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) = 0;
};
