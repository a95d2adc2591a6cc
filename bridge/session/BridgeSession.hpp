/**
 * \file bridge/session/BridgeSession.hpp
 * \brief Line relay between a text stream and a started Client.
 */
#pragma once

#include "bridge/BridgeOptions.hpp"
#include "logger.hpp"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace LineBridge {

class Client;

/**
 * \brief Sends one payload per input line and collects the replies.
 *
 * Replies are appended to an accumulated console transcript in arrival order.
 * In sync mode each line gets exactly one blocking receive; in async mode the
 * session polls for up to reply_wait and then drains whatever else has
 * already arrived. BrokenConnection from a sync client propagates.
 */
class BridgeSession {
public:
    /** \brief Remote command that empties the receiving patch. */
    static constexpr const char* kClearCommand = "clear;";

    BridgeSession(Client& client, const BridgeOptions& opts, std::shared_ptr<Logger> logger);

    /** \brief Send one line; returns the reply text collected for it (may be empty). */
    std::string send_line(std::string_view line);

    /** \brief Send the clear command and discard its reply. */
    void clear();

    /**
     * \brief Relay every non-blank line of `in`, printing replies to `out`.
     * \return Number of lines sent.
     */
    std::size_t relay(std::istream& in, std::ostream& out);

    /** \brief Every reply received so far, concatenated. */
    const std::string& console_output() const { return console_; }
    void clear_console() { console_.clear(); }

    std::size_t lines_sent() const { return lines_sent_; }

private:
    std::string collect_reply();

    Client& client_;
    BridgeOptions opts_;
    std::shared_ptr<Logger> logger_;
    std::string console_;
    std::size_t lines_sent_{0};
};

} // namespace LineBridge
