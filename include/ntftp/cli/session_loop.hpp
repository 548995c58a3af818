#pragma once

#include "ntftp/cli/command_dispatcher.hpp"
#include "ntftp/cli/console.hpp"
#include "ntftp/events/event_bus.hpp"
#include "ntftp/session/controller.hpp"
#include "ntftp/session/session.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace ntftp::cli {

namespace asio = boost::asio;

/**
 * @brief The read-eval-print cycle and the two-stage interrupt protocol
 *
 * The prompt is shown once per finished unit of work: after an empty or
 * rejected line, after a command reports back, after an idle interrupt.
 * An interrupt during a transfer aborts it and leaves the prompt to the
 * transfer's completion.
 *
 * The first interrupt arms a grace window; a second one inside it calls
 * the terminate handler. When the window expires the next interrupt
 * counts as a first one again.
 */
class SessionLoop {
public:
    using TerminateHandler = std::function<void()>;
    using CloseHandler = std::function<void()>;

    static constexpr std::chrono::milliseconds kGraceWindow{3000};
    static constexpr const char* kQuitHint = "(^C again to quit)";

    SessionLoop(asio::io_context& io_context,
                session::Session& session,
                session::TransferController& controller,
                Console& console,
                events::EventBus& bus,
                TerminateHandler terminate,
                std::chrono::milliseconds grace_window = kGraceWindow);

    SessionLoop(const SessionLoop&) = delete;
    SessionLoop& operator=(const SessionLoop&) = delete;

    void start();

    void handle_line(const std::string& line);
    void on_interrupt();
    void on_end_of_input();

    // Called once input has ended and no command is left running.
    void set_close_handler(CloseHandler handler) { on_close_ = std::move(handler); }

    [[nodiscard]] bool closed() const noexcept { return closed_; }

private:
    void register_commands();
    void finish_command(const std::optional<std::string>& error);
    void arm_grace_window();
    void close();

    asio::io_context& io_context_;
    session::Session& session_;
    session::TransferController& controller_;
    Console& console_;
    events::EventBus& bus_;
    TerminateHandler terminate_;
    std::chrono::milliseconds grace_window_;
    CommandDispatcher dispatcher_;
    CloseHandler on_close_;
    bool input_ended_ = false;
    bool closed_ = false;
};

} // namespace ntftp::cli
