#include "ntftp/cli/command_dispatcher.hpp"

#include <algorithm>
#include <sstream>

namespace ntftp::cli {

void CommandDispatcher::add(std::string name, std::size_t min_args, std::size_t max_args,
                            CommandHandler handler) {
    commands_.push_back(Command{std::move(name), min_args, max_args, std::move(handler)});
}

Result<void> CommandDispatcher::dispatch(const std::vector<std::string>& tokens) const {
    if (tokens.empty()) {
        return Err<void>(std::string(kInvalidCommand));
    }

    const auto it = std::find_if(commands_.begin(), commands_.end(),
                                 [&](const Command& command) { return command.name == tokens.front(); });
    if (it == commands_.end()) {
        return Err<void>(std::string(kInvalidCommand));
    }

    ParsedCommand parsed;
    parsed.name = it->name;
    for (auto token = tokens.begin() + 1; token != tokens.end(); ++token) {
        if (token->size() > 1 && token->front() == '-') {
            continue;
        }
        parsed.positionals.push_back(*token);
    }

    if (parsed.positionals.size() < it->min_args) {
        return Err<void>(std::string(kMissingArgument));
    }
    if (parsed.positionals.size() > it->max_args) {
        return Err<void>(std::string(kTooManyArguments));
    }

    it->handler(parsed);
    return Ok();
}

std::vector<std::string> CommandDispatcher::completions(const std::string& prefix) const {
    std::vector<std::string> hits;
    for (const auto& command : commands_) {
        const std::string candidate = command.name + " ";
        if (candidate.compare(0, prefix.size(), prefix) == 0) {
            hits.push_back(candidate);
        }
    }
    return hits;
}

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream stream(line);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace ntftp::cli
