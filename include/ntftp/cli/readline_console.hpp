#pragma once

#include "ntftp/cli/console.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <string>
#include <vector>

namespace ntftp::cli {

namespace asio = boost::asio;

/**
 * @brief Console on top of GNU readline's callback interface
 *
 * stdin readiness is awaited on the io_context and fed to
 * rl_callback_read_char(), so line editing never blocks the event loop.
 * When stdin is a regular file (epoll refuses those), reads are driven
 * by posted handlers instead, since they never block.
 * The readline handler is installed by prompt() and removed as soon as a
 * line is accepted. Readline's own signal handling is turned off;
 * SIGINT belongs to the session loop.
 *
 * Only one instance may be started at a time (readline's callbacks carry
 * no user data).
 */
class ReadlineConsole : public Console {
public:
    explicit ReadlineConsole(asio::io_context& io_context, std::string prompt_text = "> ");
    ~ReadlineConsole() override;

    ReadlineConsole(const ReadlineConsole&) = delete;
    ReadlineConsole& operator=(const ReadlineConsole&) = delete;

    void start(LineHandler on_line, EofHandler on_eof) override;
    void set_completions(std::vector<std::string> candidates) override;
    void prompt() override;
    void error(const std::string& message) override;
    void notice(const std::string& message) override;
    void status(const std::string& message) override;
    void clear_line() override;
    void stop() override;

private:
    static void on_readline_line(char* line);
    static char** on_complete(const char* text, int start, int end);
    static char* next_completion(const char* text, int state);

    void end_status();
    void install();
    void uninstall();
    void wait_for_input();
    void read_ready(const boost::system::error_code& ec);

    asio::io_context& io_context_;
    asio::posix::stream_descriptor input_;
    std::string prompt_text_;
    std::vector<std::string> completions_;
    LineHandler on_line_;
    EofHandler on_eof_;
    bool installed_ = false;
    bool waiting_ = false;
    bool stopped_ = false;
    bool pollable_ = true;
    bool status_shown_ = false;

    static ReadlineConsole* active_;
};

} // namespace ntftp::cli
