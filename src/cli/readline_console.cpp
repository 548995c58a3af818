#include "ntftp/cli/readline_console.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <readline/history.h>
#include <readline/readline.h>
#include <unistd.h>

namespace ntftp::cli {

ReadlineConsole* ReadlineConsole::active_ = nullptr;

ReadlineConsole::ReadlineConsole(asio::io_context& io_context, std::string prompt_text)
    : io_context_(io_context),
      input_(io_context),
      prompt_text_(std::move(prompt_text)) {}

ReadlineConsole::~ReadlineConsole() {
    stop();
}

void ReadlineConsole::start(LineHandler on_line, EofHandler on_eof) {
    on_line_ = std::move(on_line);
    on_eof_ = std::move(on_eof);
    active_ = this;

    // stream_descriptor closes what it owns, so give it a duplicate of stdin
    const int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        spdlog::error("Cannot watch stdin: {}", std::strerror(errno));
        stopped_ = true;
        return;
    }
    boost::system::error_code ec;
    input_.assign(fd, ec);
    if (ec) {
        spdlog::error("Cannot watch stdin: {}", ec.message());
        ::close(fd);
        stopped_ = true;
        return;
    }

    rl_catch_signals = 0;
    rl_catch_sigwinch = 1;
    rl_attempted_completion_function = &ReadlineConsole::on_complete;
}

void ReadlineConsole::set_completions(std::vector<std::string> candidates) {
    completions_ = std::move(candidates);
}

void ReadlineConsole::prompt() {
    // Deferred so it never runs inside readline's own line callback
    asio::post(io_context_, [this]() {
        if (stopped_) {
            return;
        }
        if (installed_) {
            rl_on_new_line();
            rl_redisplay();
        } else {
            install();
        }
    });
}

void ReadlineConsole::error(const std::string& message) {
    end_status();
    std::cerr << "Error: " << message << std::endl;
}

void ReadlineConsole::notice(const std::string& message) {
    end_status();
    if (installed_) {
        std::cout << '\n';
    }
    std::cout << message << std::endl;
}

void ReadlineConsole::status(const std::string& message) {
    std::cout << '\r' << message << std::flush;
    status_shown_ = true;
}

void ReadlineConsole::end_status() {
    if (status_shown_) {
        std::cout << std::endl;
        status_shown_ = false;
    }
}

void ReadlineConsole::clear_line() {
    if (installed_) {
        rl_replace_line("", 0);
        rl_point = 0;
    }
}

void ReadlineConsole::stop() {
    if (stopped_ && !installed_) {
        return;
    }
    stopped_ = true;
    uninstall();
    boost::system::error_code ignored;
    input_.cancel(ignored);
    input_.close(ignored);
    if (active_ == this) {
        active_ = nullptr;
    }
}

void ReadlineConsole::install() {
    end_status();
    rl_callback_handler_install(prompt_text_.c_str(), &ReadlineConsole::on_readline_line);
    installed_ = true;
    wait_for_input();
}

void ReadlineConsole::uninstall() {
    if (installed_) {
        rl_callback_handler_remove();
        installed_ = false;
    }
}

void ReadlineConsole::wait_for_input() {
    if (waiting_ || !input_.is_open()) {
        return;
    }
    waiting_ = true;

    if (!pollable_) {
        // Regular files are always readable; feed readline one step per handler
        asio::post(io_context_, [this]() { read_ready({}); });
        return;
    }
    input_.async_wait(asio::posix::stream_descriptor::wait_read,
                      [this](const boost::system::error_code& ec) { read_ready(ec); });
}

void ReadlineConsole::read_ready(const boost::system::error_code& ec) {
    waiting_ = false;
    if (ec == asio::error::operation_aborted || stopped_ || !installed_) {
        return;
    }
    if (ec == asio::error::operation_not_supported) {
        spdlog::debug("stdin cannot be polled, reading it directly");
        pollable_ = false;
        wait_for_input();
        return;
    }
    if (ec) {
        spdlog::warn("Cannot read stdin: {}", ec.message());
        uninstall();
        if (on_eof_) {
            on_eof_();
        }
        return;
    }

    rl_callback_read_char();
    if (installed_) {
        wait_for_input();
    }
}

void ReadlineConsole::on_readline_line(char* line) {
    ReadlineConsole* self = active_;
    if (self == nullptr) {
        std::free(line);
        return;
    }

    self->uninstall();

    if (line == nullptr) {
        std::cout << std::endl;
        if (self->on_eof_) {
            self->on_eof_();
        }
        return;
    }

    std::string text(line);
    if (!text.empty()) {
        add_history(line);
    }
    std::free(line);

    if (self->on_line_) {
        self->on_line_(text);
    }
}

char** ReadlineConsole::on_complete(const char* text, int start, int /*end*/) {
    rl_attempted_completion_over = 1;
    rl_completion_append_character = '\0';
    if (start != 0) {
        return nullptr;
    }
    return rl_completion_matches(text, &ReadlineConsole::next_completion);
}

char* ReadlineConsole::next_completion(const char* text, int state) {
    static std::size_t index = 0;
    if (state == 0) {
        index = 0;
    }
    if (active_ == nullptr) {
        return nullptr;
    }

    const std::size_t length = std::strlen(text);
    while (index < active_->completions_.size()) {
        const std::string& candidate = active_->completions_[index++];
        if (candidate.compare(0, length, text) == 0) {
            return strdup(candidate.c_str());
        }
    }
    return nullptr;
}

} // namespace ntftp::cli
