/**
 * \file client/ConnectionManager.cpp
 * \brief Connection lifecycle implementation.
 */
#include "ConnectionManager.hpp"
#include "ClientErrors.hpp"
#include "transport/socket/IBlockingStream.hpp"
#include "logger.hpp"

namespace LineBridge {

std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Unconnected: return "Unconnected";
        case ConnectionState::Connected:   return "Connected";
        case ConnectionState::Closed:      return "Closed";
    }
    return "Unknown";
}

ConnectionManager::ConnectionManager(std::shared_ptr<IBlockingStream> socket, std::shared_ptr<Logger> logger)
    : socket_(std::move(socket)), logger_(std::move(logger)) {}

ConnectionManager::~ConnectionManager() {
    close();
}

std::error_code ConnectionManager::connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
    switch (state()) {
        case ConnectionState::Connected:
            return std::make_error_code(std::errc::already_connected);
        case ConnectionState::Closed:
            return make_error_code(client_errc::connection_closed);
        case ConnectionState::Unconnected:
            break;
    }

    {
        std::lock_guard<std::mutex> lk(endpoint_mtx_);
        endpoint_ = endpoint;
    }

    std::error_code ec;
    socket_->connect(endpoint.host(), endpoint.port(), ec, timeout);
    if (ec) {
        if (logger_) logger_->debug("connect " + endpoint.to_string() + " failed: " + ec.message());
        return ec;
    }

    // close() may have raced with the handshake; Closed must stay terminal
    auto expected = ConnectionState::Unconnected;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Connected, std::memory_order_acq_rel)) {
        socket_->shutdown();
        socket_->close();
        return make_error_code(client_errc::connection_closed);
    }
    if (logger_) logger_->debug("Connected " + local_endpoint() + " -> " + remote_endpoint());
    return {};
}

bool ConnectionManager::is_connected() const {
    return state() == ConnectionState::Connected && !exit_signal_.is_set();
}

void ConnectionManager::interrupt() {
    if (exit_signal_.set()) {
        socket_->shutdown();
    }
}

void ConnectionManager::close() {
    interrupt();
    state_.store(ConnectionState::Closed, std::memory_order_release);
    if (!released_.exchange(true)) {
        socket_->close();
    }
}

std::optional<Endpoint> ConnectionManager::endpoint() const {
    std::lock_guard<std::mutex> lk(endpoint_mtx_);
    return endpoint_;
}

std::string ConnectionManager::local_endpoint() const {
    return socket_->local_endpoint();
}

std::string ConnectionManager::remote_endpoint() const {
    return socket_->remote_endpoint();
}

} // namespace LineBridge
