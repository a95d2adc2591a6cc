/**
 * \file client/mode/SyncTransport.hpp
 * \brief Blocking implementation of \c ITransportMode.
 */
#pragma once

#include "ITransportMode.hpp"
#include <atomic>
#include <cstdint>
#include <memory>

class Logger;

namespace LineBridge {

class ConnectionManager;

/** \brief Direct blocking send/receive on the caller's thread; no background threads. */
class SyncTransport : public ITransportMode {
public:
    /** \brief Read size of one receive() call. */
    static constexpr size_t kReceiveChunk = 8192;

    SyncTransport(ConnectionManager& connection, std::shared_ptr<Logger> logger);

    void start() override;
    /** \brief One blocking full write; throws BrokenConnection on any failure. */
    void send(std::string payload) override;
    /** \brief One blocking read; std::nullopt on any failure (reason says which). */
    std::optional<std::string> receive(std::error_code& reason) override;
    void stop() override;
    const char* name() const override { return "sync"; }
    std::uint64_t get_bytes_sent() const override;
    std::uint64_t get_bytes_received() const override;

private:
    ConnectionManager& connection_;
    std::shared_ptr<Logger> logger_;

    std::atomic<std::uint64_t> bytes_sent_{0};
    std::atomic<std::uint64_t> bytes_received_{0};
};

} // namespace LineBridge
