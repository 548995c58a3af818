#pragma once

#include "ntftp/cli/console.hpp"
#include "ntftp/io/file_system.hpp"
#include "ntftp/remote/endpoint.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ntftp::test_support {

namespace asio = boost::asio;

// Runs every ready handler, including the ones they post, without waiting on timers.
inline void drain(asio::io_context& io_context) {
    for (;;) {
        io_context.restart();
        if (io_context.poll() == 0) {
            break;
        }
    }
}

inline io::Bytes make_bytes(std::size_t count, std::uint8_t seed = 0) {
    io::Bytes bytes(count);
    for (std::size_t i = 0; i < count; ++i) {
        bytes[i] = static_cast<std::uint8_t>((i + seed) % 251);
    }
    return bytes;
}

// ════════════════════════════════════════════════════════
// In-memory filesystem
// ════════════════════════════════════════════════════════

/**
 * @brief FileSystem keeping files in a map; every event is posted
 */
class FakeFileSystem : public io::FileSystem {
public:
    explicit FakeFileSystem(asio::io_context& io_context) : io_context_(io_context) {}

    std::map<std::string, io::Bytes> files;
    std::set<std::string> directories;
    std::map<std::string, std::string> stat_errors;
    std::set<std::string> read_errors;
    std::set<std::string> open_errors;
    std::optional<std::size_t> fail_write_after;
    std::size_t read_chunk_size = 1024;
    std::vector<std::string> removed;

    void stat(const std::string& path, StatHandler handler) override {
        Result<io::FileStatus> result = Ok(io::FileStatus{});
        if (auto it = stat_errors.find(path); it != stat_errors.end()) {
            result = Fail<io::FileStatus>(it->second);
        } else if (directories.count(path) != 0) {
            result = Ok(io::FileStatus{true, true, 0});
        } else if (auto file = files.find(path); file != files.end()) {
            result = Ok(io::FileStatus{true, false, static_cast<std::uint64_t>(file->second.size())});
        }
        asio::post(io_context_, [handler = std::move(handler), result]() { handler(result); });
    }

    std::shared_ptr<io::LocalWriteStream> create_write_stream(const std::string& path) override;
    std::shared_ptr<io::LocalReadStream> create_read_stream(const std::string& path) override;

    void remove(const std::string& path, RemoveHandler handler) override {
        files.erase(path);
        removed.push_back(path);
        asio::post(io_context_, [handler = std::move(handler)]() { handler(Ok()); });
    }

    [[nodiscard]] bool exists(const std::string& path) const { return files.count(path) != 0; }

    asio::io_context& io_context() { return io_context_; }

private:
    asio::io_context& io_context_;
};

class FakeWriteStream : public io::LocalWriteStream,
                        public std::enable_shared_from_this<FakeWriteStream> {
public:
    FakeWriteStream(FakeFileSystem& fs, std::string path) : fs_(fs), path_(std::move(path)) {}

    void start(Handlers handlers) override {
        handlers_ = std::move(handlers);
        if (fs_.open_errors.count(path_) != 0) {
            failed_ = true;
            asio::post(fs_.io_context(), [self = shared_from_this()]() {
                self->handlers_.on_error("Failed to open local file: " + self->path_);
            });
            return;
        }
        fs_.files[path_].clear();
        opened_ = true;
    }

    [[nodiscard]] bool opened() const noexcept override { return opened_; }

    void write(io::Bytes chunk) override {
        if (failed_ || ended_) {
            return;
        }
        auto& content = fs_.files[path_];
        if (fs_.fail_write_after && content.size() + chunk.size() > *fs_.fail_write_after) {
            failed_ = true;
            asio::post(fs_.io_context(), [self = shared_from_this()]() {
                self->handlers_.on_error("Failed to write local file: " + self->path_);
            });
            return;
        }
        content.insert(content.end(), chunk.begin(), chunk.end());
    }

    void end() override {
        if (failed_ || ended_) {
            return;
        }
        ended_ = true;
        asio::post(fs_.io_context(), [self = shared_from_this()]() { self->handlers_.on_finish(); });
    }

    [[nodiscard]] bool ended() const noexcept { return ended_; }

private:
    FakeFileSystem& fs_;
    std::string path_;
    Handlers handlers_;
    bool opened_ = false;
    bool failed_ = false;
    bool ended_ = false;
};

class FakeReadStream : public io::LocalReadStream,
                       public std::enable_shared_from_this<FakeReadStream> {
public:
    FakeReadStream(FakeFileSystem& fs, std::string path) : fs_(fs), path_(std::move(path)) {}

    void start(Handlers handlers) override {
        handlers_ = std::move(handlers);
        if (fs_.read_errors.count(path_) != 0) {
            done_ = true;
            asio::post(fs_.io_context(), [self = shared_from_this()]() {
                if (!self->closed_) {
                    self->handlers_.on_error("Failed to read local file: " + self->path_);
                }
            });
            return;
        }
        schedule();
    }

    void pause() override { paused_ = true; }

    void resume() override {
        paused_ = false;
        schedule();
    }

    void close() override { closed_ = true; }

    [[nodiscard]] bool closed() const noexcept { return closed_; }
    [[nodiscard]] bool paused() const noexcept { return paused_; }

private:
    void schedule() {
        if (scheduled_ || paused_ || closed_ || done_) {
            return;
        }
        scheduled_ = true;
        asio::post(fs_.io_context(), [self = shared_from_this()]() {
            self->scheduled_ = false;
            self->read_next();
        });
    }

    void read_next() {
        if (paused_ || closed_ || done_) {
            return;
        }
        const auto& content = fs_.files[path_];
        if (offset_ < content.size()) {
            const auto count = std::min(fs_.read_chunk_size, content.size() - offset_);
            io::Bytes chunk(content.begin() + static_cast<std::ptrdiff_t>(offset_),
                            content.begin() + static_cast<std::ptrdiff_t>(offset_ + count));
            offset_ += count;
            handlers_.on_data(std::move(chunk));
            if (closed_) {
                return;
            }
        }
        if (offset_ >= content.size()) {
            done_ = true;
            handlers_.on_end();
            return;
        }
        schedule();
    }

    FakeFileSystem& fs_;
    std::string path_;
    Handlers handlers_;
    std::size_t offset_ = 0;
    bool paused_ = false;
    bool closed_ = false;
    bool done_ = false;
    bool scheduled_ = false;
};

inline std::shared_ptr<io::LocalWriteStream> FakeFileSystem::create_write_stream(const std::string& path) {
    return std::make_shared<FakeWriteStream>(*this, path);
}

inline std::shared_ptr<io::LocalReadStream> FakeFileSystem::create_read_stream(const std::string& path) {
    return std::make_shared<FakeReadStream>(*this, path);
}

// ════════════════════════════════════════════════════════
// Remote endpoint driven by the test
// ════════════════════════════════════════════════════════

/**
 * @brief Base for the scripted remote streams
 *
 * deliver/finish/fail are the server's side; abort() is the client's.
 * Once the stream has ended or failed, nothing else is emitted.
 */
class FakeRemoteStream {
public:
    explicit FakeRemoteStream(asio::io_context& io_context, std::string path)
        : io_context_(io_context), path_(std::move(path)) {}
    virtual ~FakeRemoteStream() = default;

    void finish() {
        if (terminated_) {
            return;
        }
        terminated_ = true;
        asio::post(io_context_, [handlers = handlers_]() { handlers.on_end(); });
    }

    void fail(const std::string& message) {
        if (terminated_) {
            return;
        }
        terminated_ = true;
        asio::post(io_context_, [handlers = handlers_, message]() { handlers.on_error(message); });
    }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] bool aborted() const noexcept { return aborted_; }
    [[nodiscard]] int abort_calls() const noexcept { return abort_calls_; }

protected:
    void abort_stream() {
        ++abort_calls_;
        aborted_ = true;
        finish();
    }

    asio::io_context& io_context_;
    std::string path_;
    remote::RemoteHandlers handlers_;
    bool started_ = false;
    bool terminated_ = false;
    bool aborted_ = false;
    int abort_calls_ = 0;
};

class FakeGetStream : public remote::GetStream, public FakeRemoteStream {
public:
    using FakeRemoteStream::FakeRemoteStream;

    void start(remote::RemoteHandlers handlers, std::function<void(io::Bytes)> on_data) override {
        handlers_ = std::move(handlers);
        on_data_ = std::move(on_data);
        started_ = true;
    }

    void abort() override { abort_stream(); }

    // Server sends `bytes`, delivered in one chunk.
    void deliver(io::Bytes bytes) {
        if (terminated_) {
            return;
        }
        sent_ += bytes.size();
        asio::post(io_context_, [handlers = handlers_, on_data = on_data_, bytes = std::move(bytes),
                                 sent = sent_]() {
            on_data(bytes);
            handlers.on_progress(remote::TransferProgress{sent, std::nullopt});
        });
    }

private:
    std::function<void(io::Bytes)> on_data_;
    std::uint64_t sent_ = 0;
};

class FakePutStream : public remote::PutStream, public FakeRemoteStream {
public:
    FakePutStream(asio::io_context& io_context, std::string path, std::uint64_t size)
        : FakeRemoteStream(io_context, std::move(path)), size_(size) {}

    // write() starts returning false once this many bytes arrived since the last drain().
    std::optional<std::size_t> high_water;
    // Acknowledge the final block as soon as end() is called.
    bool complete_on_end = true;

    void start(remote::RemoteHandlers handlers, std::function<void()> on_drain) override {
        handlers_ = std::move(handlers);
        on_drain_ = std::move(on_drain);
        started_ = true;
    }

    bool write(io::Bytes chunk) override {
        received_.insert(received_.end(), chunk.begin(), chunk.end());
        return !high_water || received_.size() - drained_at_ < *high_water;
    }

    void end() override {
        ended_ = true;
        if (complete_on_end) {
            finish();
        }
    }

    void abort() override { abort_stream(); }

    void drain() {
        drained_at_ = received_.size();
        asio::post(io_context_, [on_drain = on_drain_]() { on_drain(); });
    }

    [[nodiscard]] const io::Bytes& received() const noexcept { return received_; }
    [[nodiscard]] bool ended() const noexcept { return ended_; }
    [[nodiscard]] std::uint64_t declared_size() const noexcept { return size_; }

private:
    std::uint64_t size_;
    std::function<void()> on_drain_;
    io::Bytes received_;
    std::size_t drained_at_ = 0;
    bool ended_ = false;
};

class FakeEndpoint : public remote::RemoteEndpoint {
public:
    explicit FakeEndpoint(asio::io_context& io_context) : io_context_(io_context) {}

    Result<void> validate_remote(const std::string& remote_path) const override {
        return remote::check_remote_path(remote_path);
    }

    std::shared_ptr<remote::GetStream> create_get_stream(const std::string& remote_path) override {
        last_get = std::make_shared<FakeGetStream>(io_context_, remote_path);
        ++streams_created;
        return last_get;
    }

    std::shared_ptr<remote::PutStream> create_put_stream(const std::string& remote_path,
                                                         std::uint64_t size) override {
        last_put = std::make_shared<FakePutStream>(io_context_, remote_path, size);
        if (put_high_water) {
            last_put->high_water = put_high_water;
        }
        ++streams_created;
        return last_put;
    }

    std::shared_ptr<FakeGetStream> last_get;
    std::shared_ptr<FakePutStream> last_put;
    std::optional<std::size_t> put_high_water;
    int streams_created = 0;

private:
    asio::io_context& io_context_;
};

// ════════════════════════════════════════════════════════
// Console
// ════════════════════════════════════════════════════════

class FakeConsole : public cli::Console {
public:
    void start(LineHandler on_line, EofHandler on_eof) override {
        on_line_ = std::move(on_line);
        on_eof_ = std::move(on_eof);
        started = true;
    }

    void set_completions(std::vector<std::string> candidates) override { completions = std::move(candidates); }
    void prompt() override { ++prompts; }
    void error(const std::string& message) override { errors.push_back(message); }
    void notice(const std::string& message) override { notices.push_back(message); }
    void status(const std::string& message) override { statuses.push_back(message); }
    void clear_line() override { ++cleared; }
    void stop() override { ++stops; }

    void type(const std::string& line) { on_line_(line); }
    void close_input() { on_eof_(); }

    bool started = false;
    int prompts = 0;
    int cleared = 0;
    int stops = 0;
    std::vector<std::string> errors;
    std::vector<std::string> notices;
    std::vector<std::string> statuses;
    std::vector<std::string> completions;

private:
    LineHandler on_line_;
    EofHandler on_eof_;
};

} // namespace ntftp::test_support
