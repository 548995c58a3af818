#pragma once

#include "ntftp/core/result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ntftp::io {

using Bytes = std::vector<std::uint8_t>;

struct FileStatus {
    bool exists = false;
    bool is_directory = false;
    std::uint64_t size = 0;
};

/**
 * @brief Byte sink bound to a local path
 *
 * Events are delivered asynchronously, never from inside start/write/end.
 * After `on_error` fires, `on_finish` never does.
 */
class LocalWriteStream {
public:
    struct Handlers {
        std::function<void()> on_finish;
        std::function<void(const std::string&)> on_error;
    };

    virtual ~LocalWriteStream() = default;

    // Creates or truncates the file. An open failure arrives as on_error.
    virtual void start(Handlers handlers) = 0;
    virtual void write(Bytes chunk) = 0;
    // Flushes and closes; on_finish follows.
    virtual void end() = 0;

    // True once start() has created or truncated the file.
    [[nodiscard]] virtual bool opened() const noexcept = 0;
};

/**
 * @brief Byte source bound to a local path
 *
 * Produces chunks until the file is exhausted (`on_end`) or an error
 * occurs. close() stops it without any further event.
 */
class LocalReadStream {
public:
    struct Handlers {
        std::function<void(Bytes)> on_data;
        std::function<void()> on_end;
        std::function<void(const std::string&)> on_error;
    };

    virtual ~LocalReadStream() = default;

    virtual void start(Handlers handlers) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void close() = 0;
};

/**
 * @brief Local filesystem operations used by the transfer core
 *
 * stat() reports a missing path as FileStatus{exists = false}, not as an
 * error. remove() of a missing path succeeds.
 */
class FileSystem {
public:
    using StatHandler = std::function<void(Result<FileStatus>)>;
    using RemoveHandler = std::function<void(Result<void>)>;

    virtual ~FileSystem() = default;

    virtual void stat(const std::string& path, StatHandler handler) = 0;
    virtual std::shared_ptr<LocalWriteStream> create_write_stream(const std::string& path) = 0;
    virtual std::shared_ptr<LocalReadStream> create_read_stream(const std::string& path) = 0;
    virtual void remove(const std::string& path, RemoveHandler handler) = 0;
};

} // namespace ntftp::io
