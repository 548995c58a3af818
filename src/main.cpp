#include "ntftp/cli/progress_display.hpp"
#include "ntftp/cli/readline_console.hpp"
#include "ntftp/cli/session_loop.hpp"
#include "ntftp/core/config.hpp"
#include "ntftp/events/components.hpp"
#include "ntftp/events/event_bus.hpp"
#include "ntftp/io/posix_file_system.hpp"
#include "ntftp/remote/udp_endpoint.hpp"
#include "ntftp/session/controller.hpp"
#include "ntftp/session/session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>

namespace asio = boost::asio;

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);

    auto parsed = ntftp::parse_command_line(argc, argv);
    if (parsed.is_error()) {
        std::cerr << "Error: " << parsed.error() << "\n\n" << ntftp::usage_text();
        return 1;
    }
    const ntftp::ClientConfig& config = parsed.value();
    if (config.show_help) {
        std::cout << ntftp::usage_text();
        return 0;
    }
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    asio::io_context io_context;

    ntftp::events::EventBus event_bus;
    ntftp::events::LoggerComponent logger(event_bus);

    ntftp::io::PosixFileSystem file_system(io_context);
    ntftp::remote::UdpEndpoint endpoint(io_context, ntftp::normalized(config));

    ntftp::session::Session session;
    ntftp::session::TransferController controller(session, file_system, endpoint, event_bus);
    ntftp::cli::ReadlineConsole console(io_context);
    ntftp::cli::ProgressDisplay progress(event_bus, console);

    ntftp::cli::SessionLoop loop(io_context, session, controller, console, event_bus, []() {
        // Second interrupt inside the grace window: leave without further cleanup
        std::exit(0);
    });

    asio::signal_set signals(io_context, SIGINT);
    std::function<void()> wait_for_interrupt = [&]() {
        signals.async_wait([&](const boost::system::error_code& ec, int /*signal_number*/) {
            if (ec) {
                return;
            }
            loop.on_interrupt();
            wait_for_interrupt();
        });
    };

    loop.set_close_handler([&signals]() {
        boost::system::error_code ignored;
        signals.cancel(ignored);
    });

    spdlog::debug("Client for {}:{} ready", config.address, endpoint.settings().port);

    wait_for_interrupt();
    loop.start();
    io_context.run();

    return 0;
}
