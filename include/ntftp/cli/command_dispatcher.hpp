#pragma once

#include "ntftp/core/result.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ntftp::cli {

/**
 * @brief A command line after tokenizing and arity checks
 */
struct ParsedCommand {
    std::string name;
    std::vector<std::string> positionals;

    [[nodiscard]] const std::string& arg(std::size_t index) const { return positionals.at(index); }
    [[nodiscard]] bool has_arg(std::size_t index) const noexcept { return index < positionals.size(); }
};

using CommandHandler = std::function<void(const ParsedCommand&)>;

/**
 * @brief Routes tokenized prompt input to registered command handlers
 *
 * Tokens starting with '-' are treated as options nobody defined and are
 * skipped, so `get --md5sum remote local` still reaches `get`.
 *
 * Example usage:
 * @code
 * CommandDispatcher dispatcher;
 * dispatcher.add("get", 1, 2, [](const ParsedCommand& cmd) { ... });
 * auto routed = dispatcher.dispatch(split_words(line));
 * if (routed.is_error()) show(routed.error());
 * @endcode
 */
class CommandDispatcher {
public:
    static constexpr const char* kInvalidCommand = "Invalid command";
    static constexpr const char* kMissingArgument = "Missing argument";
    static constexpr const char* kTooManyArguments = "Too many arguments";

    void add(std::string name, std::size_t min_args, std::size_t max_args, CommandHandler handler);

    // Invokes the matching handler, or returns the parse error without invoking anything.
    Result<void> dispatch(const std::vector<std::string>& tokens) const;

    // Registered names followed by a space, in registration order ("get ", "put ").
    [[nodiscard]] std::vector<std::string> completions(const std::string& prefix) const;

private:
    struct Command {
        std::string name;
        std::size_t min_args;
        std::size_t max_args;
        CommandHandler handler;
    };

    std::vector<Command> commands_;
};

std::vector<std::string> split_words(const std::string& line);

} // namespace ntftp::cli
