/**
 * \file bridge/bridgeMain.cpp
 * \brief Entrypoint for line-bridge: relay stdin lines to a TCP peer and print its replies.
 */

#include "session/BridgeSession.hpp"
#include "BridgeOptions.hpp"
#include "client/Client.hpp"
#include "client/ClientErrors.hpp"
#include "client/ClientOptions.hpp"
#include "transport/socket/SocketFactory.hpp"
#include "logger.hpp"
#include <options/Options.hpp>
#include <iostream>

/** \brief Entrypoint for the line-bridge binary. */
int main(int argc, char* argv[]) {
    try {
        std::string opt_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        }
        if (parse_res == shared_opts::Options::ParseResult::Error) {
            std::cerr << "line-bridge option parse error: " << opt_err << std::endl;
            return 2;
        }

        namespace co = LineBridge::client_opts;
        namespace bo = LineBridge::bridge_opts;
        LineBridge::ClientOptions client_options = co::current();
        LineBridge::BridgeOptions bridge_options = bo::current();

        // Setup logger; replies go to stdout, so diagnostics stay on stderr
        auto logger = std::make_shared<Logger>("Bridge");
        auto sink = std::make_shared<StderrSink>();
        logger->add_sink(sink);
        logger->set_level(parse_log_level(bo::get_log_level()).value_or(LogLevel::Info));

        auto socket_type = transport::parse_socket_type(co::get_socket_type().value_or("posix"));
        if (!socket_type) {
            logger->error("Unknown socket type '" + co::get_socket_type().value_or("") + "'");
            return 2;
        }
        transport::SocketFactory::set_default_socket_type(*socket_type);
        auto stream = transport::SocketFactory::create_blocking_client(logger);

        LineBridge::Client client(client_options, stream, logger);
        logger->info("line-bridge target=" + client.endpoint().to_string() +
                     " mode=" + LineBridge::to_string(client_options.mode));
        if (!client.start()) {
            return 1;
        }

        int rc = 0;
        try {
            LineBridge::BridgeSession session(client, bridge_options, logger);
            if (bridge_options.clear_first) {
                session.clear();
            }
            session.relay(std::cin, std::cout);
        } catch (const LineBridge::BrokenConnection& e) {
            logger->error(std::string{"Connection lost: "} + e.what() + " (" + e.code().message() + ")");
            rc = 1;
        }

        client.close();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "line-bridge error: " << e.what() << std::endl;
        return 1;
    }
}
