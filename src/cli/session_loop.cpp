#include "ntftp/cli/session_loop.hpp"
#include "ntftp/events/events.hpp"
#include "ntftp/session/transfer.hpp"

#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace ntftp::cli {

SessionLoop::SessionLoop(asio::io_context& io_context,
                         session::Session& session,
                         session::TransferController& controller,
                         Console& console,
                         events::EventBus& bus,
                         TerminateHandler terminate,
                         std::chrono::milliseconds grace_window)
    : io_context_(io_context),
      session_(session),
      controller_(controller),
      console_(console),
      bus_(bus),
      terminate_(std::move(terminate)),
      grace_window_(grace_window) {
    register_commands();
}

void SessionLoop::register_commands() {
    auto done = [this](const std::optional<std::string>& error) { finish_command(error); };

    // get <remote> [<local>]
    dispatcher_.add("get", 1, 2, [this, done](const ParsedCommand& command) {
        std::optional<std::string> local;
        if (command.has_arg(1)) {
            local = command.arg(1);
        }
        controller_.get(command.arg(0), local, done);
    });

    // put <local> [<remote>]
    dispatcher_.add("put", 1, 2, [this, done](const ParsedCommand& command) {
        std::optional<std::string> remote;
        if (command.has_arg(1)) {
            remote = command.arg(1);
        }
        controller_.put(command.arg(0), remote, done);
    });
}

void SessionLoop::start() {
    console_.set_completions(dispatcher_.completions(""));
    console_.start([this](const std::string& line) { handle_line(line); },
                   [this]() { on_end_of_input(); });
    console_.prompt();
}

void SessionLoop::handle_line(const std::string& line) {
    if (line.empty()) {
        console_.prompt();
        return;
    }

    auto routed = dispatcher_.dispatch(split_words(line));
    if (routed.is_error()) {
        finish_command(routed.error());
    }
}

void SessionLoop::finish_command(const std::optional<std::string>& error) {
    if (error) {
        console_.error(*error);
    }
    if (input_ended_) {
        close();
        return;
    }
    console_.prompt();
}

void SessionLoop::on_interrupt() {
    const bool transfer_active = !session_.idle();

    if (session_.grace_window_open()) {
        bus_.emit(events::InterruptReceivedEvent{transfer_active, true});
        console_.stop();
        terminate_();
        return;
    }

    bus_.emit(events::InterruptReceivedEvent{transfer_active, false});
    arm_grace_window();
    console_.clear_line();
    console_.notice(kQuitHint);

    if (auto transfer = session_.active_transfer()) {
        // The transfer's completion shows the prompt once cleanup is done
        transfer->abort();
        return;
    }

    if (controller_.cancel_pending()) {
        spdlog::debug("Interrupt dropped a command waiting to start");
    }
    if (input_ended_) {
        close();
        return;
    }
    console_.prompt();
}

void SessionLoop::on_end_of_input() {
    input_ended_ = true;
    if (!controller_.busy()) {
        close();
    }
}

void SessionLoop::arm_grace_window() {
    auto timer = std::make_unique<asio::steady_timer>(io_context_, grace_window_);
    timer->async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        spdlog::debug("Interrupt grace window expired");
        session_.disarm_interrupt();
    });
    session_.arm_interrupt(std::move(timer));
}

void SessionLoop::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    session_.disarm_interrupt();
    console_.stop();
    if (on_close_) {
        on_close_();
    }
}

} // namespace ntftp::cli
