/**
 * \file client/mode/ITransportMode.hpp
 * \brief Strategy interface hiding the sync/async distinction from the client facade.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace LineBridge {

/** \brief One way of moving payloads between the caller and the connection. */
class ITransportMode {
public:
    virtual ~ITransportMode() = default;

    /** \brief Called once after the connection is established. */
    virtual void start() = 0;
    /** \brief Hand one payload to the transport. Empty payloads are ignored. */
    virtual void send(std::string payload) = 0;
    /**
     * \brief Fetch the next reply as UTF-8 text.
     * \param reason Cleared when text is returned; otherwise why nothing was returned.
     */
    virtual std::optional<std::string> receive(std::error_code& reason) = 0;
    /** \brief Stop background activity. Requires the exit signal to be raised first. */
    virtual void stop() = 0;
    /** \brief "sync" or "async". */
    virtual const char* name() const = 0;

    /** \brief Raw bytes written to the socket. */
    virtual std::uint64_t get_bytes_sent() const = 0;
    /** \brief Raw bytes read from the socket. */
    virtual std::uint64_t get_bytes_received() const = 0;
};

} // namespace LineBridge
