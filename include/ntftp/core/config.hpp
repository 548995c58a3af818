#pragma once

#include "ntftp/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ntftp {

/**
 * @brief Client configuration, built once from the command line
 *
 * Numeric values are carried unchecked. The remote endpoint decides what
 * to do with out-of-range or missing ones (see normalized()).
 */
struct ClientConfig {
    static constexpr std::uint16_t kDefaultPort = 69;
    static constexpr std::uint32_t kDefaultBlockSize = 1468;
    static constexpr std::uint32_t kMinBlockSize = 8;
    static constexpr std::uint32_t kMaxBlockSize = 65464;
    static constexpr std::uint32_t kDefaultRetries = 3;
    static constexpr std::uint32_t kDefaultTimeoutMs = 3000;
    static constexpr std::uint32_t kDefaultWindowSize = 64;
    static constexpr std::uint32_t kMaxWindowSize = 65535;

    std::string address;
    std::optional<long> port;
    std::optional<long> block_size;
    std::optional<long> retries;
    std::optional<long> timeout_ms;
    std::optional<long> window_size;
    bool verbose = false;
    bool show_help = false;
};

/**
 * @brief Effective values after replacing invalid ones with defaults
 */
struct EndpointSettings {
    std::string address;
    std::uint16_t port = ClientConfig::kDefaultPort;
    std::uint32_t block_size = ClientConfig::kDefaultBlockSize;
    std::uint32_t retries = ClientConfig::kDefaultRetries;
    std::uint32_t timeout_ms = ClientConfig::kDefaultTimeoutMs;
    std::uint32_t window_size = ClientConfig::kDefaultWindowSize;
};

/**
 * @brief Parse `ntftp [options] <host>[:<port>]`
 *
 * Accepts -b/--blksize, -r/--retries, -t/--timeout, -w/--windowsize,
 * -v/--verbose and -h/--help. Option values may be given as the next
 * argument or inline (--timeout=500).
 */
Result<ClientConfig> parse_command_line(int argc, const char* const argv[]);

EndpointSettings normalized(const ClientConfig& config);

const char* usage_text();

} // namespace ntftp
