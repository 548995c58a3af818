#pragma once

#include "ntftp/core/result.hpp"
#include "ntftp/io/file_system.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ntftp::remote {

struct TransferProgress {
    std::uint64_t bytes = 0;
    std::optional<std::uint64_t> total;
};

/**
 * @brief Events shared by both remote stream directions
 *
 * `on_end` fires once when the remote side is done: the last block was
 * received (get) or acknowledged (put), or an abort() completed.
 * `on_error` and `on_end` are mutually exclusive.
 */
struct RemoteHandlers {
    std::function<void(const std::string&)> on_error;
    std::function<void(const TransferProgress&)> on_progress;
    std::function<void()> on_end;
};

/**
 * @brief Readable stream for one remote file (download)
 */
class GetStream {
public:
    virtual ~GetStream() = default;

    virtual void start(RemoteHandlers handlers, std::function<void(io::Bytes)> on_data) = 0;

    // Stops the transfer. Exactly one on_end follows, nothing else.
    virtual void abort() = 0;
};

/**
 * @brief Writable stream for one remote file (upload)
 */
class PutStream {
public:
    virtual ~PutStream() = default;

    virtual void start(RemoteHandlers handlers, std::function<void()> on_drain) = 0;

    // Returns false when the caller should wait for on_drain before writing more.
    virtual bool write(io::Bytes chunk) = 0;
    virtual void end() = 0;

    // Stops the transfer. Exactly one on_end follows, nothing else.
    virtual void abort() = 0;
};

/**
 * @brief The remote peer speaking the file-transfer protocol
 */
class RemoteEndpoint {
public:
    static constexpr std::size_t kMaxRemotePathLength = 255;

    virtual ~RemoteEndpoint() = default;

    virtual Result<void> validate_remote(const std::string& remote_path) const = 0;
    virtual std::shared_ptr<GetStream> create_get_stream(const std::string& remote_path) = 0;
    virtual std::shared_ptr<PutStream> create_put_stream(const std::string& remote_path,
                                                         std::uint64_t size) = 0;
};

/**
 * @brief Path rule shared by the bundled endpoint and test doubles
 */
Result<void> check_remote_path(const std::string& remote_path);

} // namespace ntftp::remote
