/**
 * \file client/Client.cpp
 * \brief Client facade: dispatch to the transport chosen at construction.
 */
#include "Client.hpp"
#include "ClientErrors.hpp"
#include "ConnectionManager.hpp"
#include "mode/ITransportMode.hpp"
#include "mode/SyncTransport.hpp"
#include "mode/AsyncTransport.hpp"
#include "transport/socket/SocketFactory.hpp"
#include "transport/socket/IBlockingStream.hpp"
#include "logger.hpp"

namespace LineBridge {

Client::Client(const ClientOptions& opts, std::shared_ptr<Logger> logger)
    : Client(opts, ::transport::SocketFactory::create_blocking_client(logger), logger) {}

Client::Client(const std::string& host, int port, ClientMode mode, std::shared_ptr<Logger> logger)
    : Client([&]() {
          ClientOptions o;
          o.host = host;
          o.port = port;
          o.mode = mode;
          return o;
      }(), std::move(logger)) {}

Client::Client(const ClientOptions& opts, std::shared_ptr<IBlockingStream> stream, std::shared_ptr<Logger> logger)
    : opts_(opts)
    , endpoint_(opts.host, opts.port)
    , logger_(std::move(logger))
{
    if (opts_.recv_timeout.count() > 0) {
        stream->set_receive_timeout(opts_.recv_timeout);
    }
    connection_ = std::make_unique<ConnectionManager>(std::move(stream), logger_);

    // Create transport based on mode, encapsulating ITransportMode behind the facade
    if (opts_.mode == ClientMode::Sync) {
        transport_ = std::make_unique<SyncTransport>(*connection_, logger_);
    } else {
        transport_ = std::make_unique<AsyncTransport>(*connection_, logger_, opts_.idle_backoff,
                                                      opts_.queue_capacity, opts_.overflow_policy);
    }
}

Client::~Client() {
    close();
}

bool Client::start() {
    {
        std::lock_guard<std::mutex> lk(lifecycle_mtx_);
        if (closed_) {
            last_error_ = make_error_code(client_errc::connection_closed);
            if (logger_) logger_->error("Client start refused: client already closed");
            return false;
        }
    }

    // Connect without holding the lifecycle lock so close() can abandon it
    std::error_code ec = connection_->connect(endpoint_, opts_.connect_timeout);
    if (ec == std::errc::already_connected) {
        return true;
    }

    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (!ec && closed_) {
        ec = make_error_code(client_errc::connection_closed);
    }
    if (ec) {
        last_error_ = ec;
        if (logger_) logger_->error("Socket error: failed to connect to " + endpoint_.to_string() + ": " + ec.message());
        return false;
    }

    last_error_.clear();
    transport_->start();
    if (logger_) {
        logger_->info("Client started (mode=" + std::string(transport_->name()) + ", peer=" +
                      connection_->remote_endpoint() + ")");
    }
    return true;
}

void Client::send(std::string_view payload) {
    transport_->send(std::string(payload));
}

std::optional<std::string> Client::receive() {
    std::error_code ignored;
    return transport_->receive(ignored);
}

std::optional<std::string> Client::receive(std::error_code& reason) {
    return transport_->receive(reason);
}

void Client::close() {
    // Raise the exit signal and shut the socket down first so blocked workers return
    connection_->interrupt();

    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (closed_) {
        return;
    }
    closed_ = true;
    transport_->stop();
    connection_->close();
    if (logger_) {
        logger_->info("Client closed (sent " + std::to_string(transport_->get_bytes_sent()) + " B, received " +
                      std::to_string(transport_->get_bytes_received()) + " B)");
    }
}

bool Client::is_connected() const {
    return connection_->is_connected();
}

std::error_code Client::last_error() const {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    return last_error_;
}

std::uint64_t Client::bytes_sent() const {
    return transport_->get_bytes_sent();
}

std::uint64_t Client::bytes_received() const {
    return transport_->get_bytes_received();
}

} // namespace LineBridge
