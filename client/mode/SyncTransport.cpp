/**
 * \file client/mode/SyncTransport.cpp
 * \brief Blocking \c ITransportMode implementation backed by \c IBlockingStream.
 */
#include "SyncTransport.hpp"
#include "StreamIo.hpp"
#include "client/ClientErrors.hpp"
#include "client/ConnectionManager.hpp"
#include "transport/socket/IBlockingStream.hpp"
#include "utf8.hpp"
#include "logger.hpp"

#include <string>

namespace LineBridge {

SyncTransport::SyncTransport(ConnectionManager& connection, std::shared_ptr<Logger> logger)
    : connection_(connection), logger_(std::move(logger)) {}

void SyncTransport::start() {}

void SyncTransport::send(std::string payload) {
    if (!connection_.is_connected()) {
        throw BrokenConnection(make_error_code(client_errc::not_connected), "send on a client that is not connected");
    }
    if (payload.empty()) {
        return;
    }

    IBlockingStream& stream = connection_.stream();
    // A FIN already queued by the peer would only surface after a successful write
    if (stream.peer_closed()) {
        if (logger_) logger_->warning("send: peer has closed the connection");
        throw BrokenConnection(make_error_code(client_errc::peer_closed));
    }

    std::error_code ec;
    std::uint64_t written = 0;
    const bool ok = write_all(stream, payload, written, ec);
    bytes_sent_.fetch_add(written, std::memory_order_relaxed);
    if (!ok) {
        if (logger_) logger_->error("send failed: " + ec.message());
        throw BrokenConnection(ec);
    }
}

std::optional<std::string> SyncTransport::receive(std::error_code& reason) {
    if (!connection_.is_connected()) {
        reason = make_error_code(client_errc::not_connected);
        return std::nullopt;
    }

    std::string buffer(kReceiveChunk, '\0');
    size_t br = 0;
    connection_.stream().read(buffer.data(), buffer.size(), br, reason);
    if (reason) {
        if (logger_) logger_->debug("receive: " + reason.message());
        return std::nullopt;
    }
    if (br == 0) {
        reason = make_error_code(client_errc::peer_closed);
        return std::nullopt;
    }
    bytes_received_.fetch_add(static_cast<std::uint64_t>(br), std::memory_order_relaxed);
    buffer.resize(br);

    if (!text::is_valid_utf8(buffer)) {
        if (logger_) logger_->warning("receive: dropping " + std::to_string(br) + " bytes of invalid UTF-8");
        reason = make_error_code(client_errc::decode_failed);
        return std::nullopt;
    }
    reason.clear();
    return buffer;
}

void SyncTransport::stop() {}

std::uint64_t SyncTransport::get_bytes_sent() const {
    return bytes_sent_.load(std::memory_order_relaxed);
}

std::uint64_t SyncTransport::get_bytes_received() const {
    return bytes_received_.load(std::memory_order_relaxed);
}

} // namespace LineBridge
