#pragma once

#include <functional>
#include <string>
#include <vector>

namespace ntftp::cli {

/**
 * @brief The terminal as seen by the session loop
 *
 * Input is only consumed while a prompt is showing: after a line is
 * handed to on_line, nothing more is read until the next prompt().
 */
class Console {
public:
    using LineHandler = std::function<void(const std::string&)>;
    using EofHandler = std::function<void()>;

    virtual ~Console() = default;

    virtual void start(LineHandler on_line, EofHandler on_eof) = 0;

    // Tab-completion candidates for the first word of a line
    virtual void set_completions(std::vector<std::string> candidates) = 0;

    virtual void prompt() = 0;

    // Prints "Error: <message>"
    virtual void error(const std::string& message) = 0;

    // Prints the message on a line of its own
    virtual void notice(const std::string& message) = 0;

    // Replaces the transient status line (transfer progress). The next
    // prompt, error or notice starts on a fresh line.
    virtual void status(const std::string& message) = 0;

    // Discards whatever has been typed on the current line
    virtual void clear_line() = 0;

    // Stops reading and restores the terminal. Safe to call twice.
    virtual void stop() = 0;
};

} // namespace ntftp::cli
