/**
 * \file client/Endpoint.hpp
 * \brief Immutable host/port pair identifying the remote peer.
 */
#pragma once

#include <string>
#include <utility>

namespace LineBridge {

class Endpoint {
public:
    Endpoint(std::string host, int port) : host_(std::move(host)), port_(port) {}

    const std::string& host() const { return host_; }
    int port() const { return port_; }

    /** \brief "host:port" for logs. */
    std::string to_string() const { return host_ + ":" + std::to_string(port_); }

private:
    std::string host_;
    int port_;
};

} // namespace LineBridge
