/**
 * \file client/mode/StreamIo.hpp
 * \brief Whole-buffer write helper shared by both transports.
 */
#pragma once

#include "client/ClientErrors.hpp"
#include "transport/socket/IBlockingStream.hpp"
#include <cstdint>
#include <string_view>
#include <system_error>

namespace LineBridge {

/**
 * \brief Write all of `payload`, continuing after short writes.
 * \param bytes_written Out: bytes accepted by the socket, also on failure.
 * \return false with `ec` set on an OS error, or client_errc::write_failed if
 *  the socket accepted zero bytes.
 */
inline bool write_all(IBlockingStream& stream, std::string_view payload, std::uint64_t& bytes_written,
                      std::error_code& ec) {
    ec.clear();
    bytes_written = 0;
    while (bytes_written < payload.size()) {
        size_t bw = 0;
        const auto offset = static_cast<size_t>(bytes_written);
        stream.write(payload.data() + offset, payload.size() - offset, bw, ec);
        if (ec) {
            return false;
        }
        if (bw == 0) {
            ec = make_error_code(client_errc::write_failed);
            return false;
        }
        bytes_written += bw;
    }
    return true;
}

} // namespace LineBridge
