#include "ntftp/core/config.hpp"

#include <stdexcept>
#include <vector>

namespace ntftp {
namespace {

Result<long> parse_number(const std::string& option, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long value = std::stol(text, &consumed, 10);
        if (consumed != text.size()) {
            return Fail<long>("Invalid value for " + option);
        }
        return Ok(value);
    } catch (const std::exception&) {
        return Fail<long>("Invalid value for " + option);
    }
}

std::optional<long>* numeric_slot(ClientConfig& config, const std::string& name) {
    if (name == "-b" || name == "--blksize") return &config.block_size;
    if (name == "-r" || name == "--retries") return &config.retries;
    if (name == "-t" || name == "--timeout") return &config.timeout_ms;
    if (name == "-w" || name == "--windowsize") return &config.window_size;
    return nullptr;
}

Result<void> set_server(ClientConfig& config, const std::string& argument) {
    if (!config.address.empty()) {
        return Err<void>(std::string("Too many arguments"));
    }
    const auto colon = argument.find(':');
    config.address = argument.substr(0, colon);
    if (config.address.empty()) {
        return Err<void>(std::string("Missing server address"));
    }
    if (colon != std::string::npos) {
        auto port = parse_number("<port>", argument.substr(colon + 1));
        if (port.is_error()) {
            return Err<void>(port.error());
        }
        config.port = port.value();
    }
    return Ok();
}

template<typename T>
T in_range_or(const std::optional<long>& value, long min, long max, T fallback) {
    if (!value || *value < min || *value > max) {
        return fallback;
    }
    return static_cast<T>(*value);
}

} // namespace

Result<ClientConfig> parse_command_line(int argc, const char* const argv[]) {
    ClientConfig config;
    const std::vector<std::string> args(argv + 1, argv + argc);

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return Ok(config);
        }
        if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            std::optional<std::string> inline_value;
            const auto eq = arg.find('=');
            if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }

            auto* slot = numeric_slot(config, arg);
            if (slot == nullptr) {
                return Fail<ClientConfig>("Unknown option: " + arg);
            }

            std::string text;
            if (inline_value) {
                text = *inline_value;
            } else if (i + 1 < args.size()) {
                text = args[++i];
            } else {
                return Fail<ClientConfig>("Invalid value for " + arg);
            }

            auto number = parse_number(arg, text);
            if (number.is_error()) {
                return Err<ClientConfig>(number.error());
            }
            *slot = number.value();
            continue;
        }

        if (auto res = set_server(config, arg); res.is_error()) {
            return Err<ClientConfig>(res.error());
        }
    }

    if (config.address.empty()) {
        return Fail<ClientConfig>("Missing server address");
    }
    return Ok(config);
}

EndpointSettings normalized(const ClientConfig& config) {
    EndpointSettings settings;
    settings.address = config.address;
    settings.port = in_range_or<std::uint16_t>(config.port, 1, 65535, ClientConfig::kDefaultPort);
    settings.block_size = in_range_or<std::uint32_t>(
        config.block_size, ClientConfig::kMinBlockSize, ClientConfig::kMaxBlockSize,
        ClientConfig::kDefaultBlockSize);
    settings.retries = in_range_or<std::uint32_t>(config.retries, 0, 1000, ClientConfig::kDefaultRetries);
    settings.timeout_ms = in_range_or<std::uint32_t>(config.timeout_ms, 1, 3600 * 1000,
                                                     ClientConfig::kDefaultTimeoutMs);
    settings.window_size = in_range_or<std::uint32_t>(
        config.window_size, 1, ClientConfig::kMaxWindowSize, ClientConfig::kDefaultWindowSize);
    return settings;
}

const char* usage_text() {
    return
        "Usage: ntftp [options] <host>[:<port>]\n"
        "\n"
        "Once ntftp is running, it shows a prompt and recognizes the following commands:\n"
        "  > get <remote> [<local>]\n"
        "    Gets a file from the remote server.\n"
        "  > put <local> [<remote>]\n"
        "    Puts a file to the remote server.\n"
        "\n"
        "To quit the program press ctrl-c two times.\n"
        "\n"
        "Arguments:\n"
        "  <host>[:<port>]          The address and port of the remote server.\n"
        "                           Default port is 69\n"
        "\n"
        "Options:\n"
        "  -b, --blksize SIZE       Block size. Valid range: [8, 65464]. Default is 1468\n"
        "  -r, --retries NUM        Retries before giving up on an unresponsive server.\n"
        "                           Default is 3\n"
        "  -t, --timeout MILLISECONDS\n"
        "                           Retransmission timeout. Default is 3000ms\n"
        "  -w, --windowsize SIZE    Window size. Valid range: [1, 65535]. Default is 64\n"
        "  -v, --verbose            Log diagnostics to stderr\n"
        "  -h, --help               Show this help and exit\n";
}

} // namespace ntftp
