/**
 * \file client/ClientErrors.cpp
 * \brief client_errc category.
 */
#include "ClientErrors.hpp"

namespace LineBridge {

namespace {

class ClientCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "line-bridge.client"; }

    std::string message(int ev) const override {
        switch (static_cast<client_errc>(ev)) {
            case client_errc::no_data:           return "no data available";
            case client_errc::peer_closed:       return "peer closed the connection";
            case client_errc::decode_failed:     return "received bytes are not valid UTF-8";
            case client_errc::not_connected:     return "client is not connected";
            case client_errc::connection_closed: return "connection already closed";
            case client_errc::write_failed:      return "socket accepted zero bytes";
        }
        return "unknown client error";
    }

    std::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<client_errc>(ev)) {
            case client_errc::not_connected:
            case client_errc::connection_closed:
                return std::errc::not_connected;
            case client_errc::peer_closed:
                return std::errc::connection_reset;
            case client_errc::write_failed:
                return std::errc::broken_pipe;
            default:
                return std::error_condition(ev, *this);
        }
    }
};

} // namespace

const std::error_category& client_category() noexcept {
    static const ClientCategory category;
    return category;
}

} // namespace LineBridge
