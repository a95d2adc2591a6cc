/**
 * \file bridge/BridgeOptions.hpp
 * \brief Relay and logging options for the line-bridge executable.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace LineBridge {

/** \brief How the relay forwards lines and waits for replies. */
struct BridgeOptions {
    std::chrono::milliseconds reply_wait{500}; ///< Async mode: how long to wait for the first reply chunk.
    bool append_newline{false};                ///< Terminate each payload with '\n'.
    bool clear_first{false};                   ///< Send the remote clear command before relaying.
};

/** \brief Helper API for the "Bridge" and "Logging" option groups. */
namespace bridge_opts {
    void register_options();
    BridgeOptions current();
    /** \brief Log level name from --log-level / logging.level. */
    std::string get_log_level();
} // namespace bridge_opts

} // namespace LineBridge
