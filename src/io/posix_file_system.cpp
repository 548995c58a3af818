#include "ntftp/io/posix_file_system.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace ntftp::io {
namespace fs = std::filesystem;

namespace {

class FileWriteStream : public LocalWriteStream,
                        public std::enable_shared_from_this<FileWriteStream> {
public:
    FileWriteStream(asio::io_context& io_context, std::string path)
        : io_context_(io_context), path_(std::move(path)) {}

    void start(Handlers handlers) override {
        handlers_ = std::move(handlers);
        file_.open(path_, std::ios::binary | std::ios::trunc);
        if (!file_) {
            fail("Failed to open local file: " + path_);
            return;
        }
        opened_ = true;
    }

    [[nodiscard]] bool opened() const noexcept override { return opened_; }

    void write(Bytes chunk) override {
        if (failed_ || ended_) {
            return;
        }
        file_.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        if (!file_) {
            fail("Failed to write local file: " + path_);
        }
    }

    void end() override {
        if (failed_ || ended_) {
            return;
        }
        ended_ = true;
        file_.flush();
        const bool flushed = static_cast<bool>(file_);
        file_.close();
        if (!flushed || file_.fail()) {
            fail("Failed to write local file: " + path_);
            return;
        }
        asio::post(io_context_, [self = shared_from_this()]() {
            if (self->handlers_.on_finish) {
                self->handlers_.on_finish();
            }
        });
    }

private:
    void fail(std::string message) {
        failed_ = true;
        if (file_.is_open()) {
            file_.close();
        }
        spdlog::debug("Local write stream failed: {}", message);
        asio::post(io_context_, [self = shared_from_this(), message = std::move(message)]() {
            if (self->handlers_.on_error) {
                self->handlers_.on_error(message);
            }
        });
    }

    asio::io_context& io_context_;
    std::string path_;
    std::ofstream file_;
    Handlers handlers_;
    bool opened_ = false;
    bool failed_ = false;
    bool ended_ = false;
};

class FileReadStream : public LocalReadStream,
                       public std::enable_shared_from_this<FileReadStream> {
public:
    FileReadStream(asio::io_context& io_context, std::string path, std::size_t chunk_size)
        : io_context_(io_context), path_(std::move(path)), chunk_size_(chunk_size) {}

    void start(Handlers handlers) override {
        handlers_ = std::move(handlers);
        file_.open(path_, std::ios::binary);
        if (!file_) {
            done_ = true;
            post_error("Failed to open local file: " + path_);
            return;
        }
        schedule();
    }

    void pause() override { paused_ = true; }

    void resume() override {
        paused_ = false;
        schedule();
    }

    void close() override {
        closed_ = true;
        if (file_.is_open()) {
            file_.close();
        }
    }

private:
    void schedule() {
        if (scheduled_ || paused_ || closed_ || done_) {
            return;
        }
        scheduled_ = true;
        asio::post(io_context_, [self = shared_from_this()]() {
            self->scheduled_ = false;
            self->read_next();
        });
    }

    void read_next() {
        if (paused_ || closed_ || done_) {
            return;
        }

        Bytes buffer(chunk_size_);
        file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk_size_));
        const auto count = static_cast<std::size_t>(file_.gcount());

        if (file_.bad()) {
            done_ = true;
            post_error("Failed to read local file: " + path_);
            return;
        }

        if (count > 0) {
            buffer.resize(count);
            if (handlers_.on_data) {
                handlers_.on_data(std::move(buffer));
            }
            if (closed_) {
                return;
            }
        }

        if (file_.eof()) {
            done_ = true;
            file_.close();
            if (handlers_.on_end) {
                handlers_.on_end();
            }
            return;
        }

        schedule();
    }

    void post_error(std::string message) {
        asio::post(io_context_, [self = shared_from_this(), message = std::move(message)]() {
            if (!self->closed_ && self->handlers_.on_error) {
                self->handlers_.on_error(message);
            }
        });
    }

    asio::io_context& io_context_;
    std::string path_;
    std::size_t chunk_size_;
    std::ifstream file_;
    Handlers handlers_;
    bool paused_ = false;
    bool closed_ = false;
    bool done_ = false;
    bool scheduled_ = false;
};

} // namespace

PosixFileSystem::PosixFileSystem(asio::io_context& io_context, std::size_t read_chunk_size)
    : io_context_(io_context),
      read_chunk_size_(read_chunk_size == 0 ? kReadChunkSize : read_chunk_size) {}

void PosixFileSystem::stat(const std::string& path, StatHandler handler) {
    std::error_code ec;
    const auto status = fs::status(path, ec);

    Result<FileStatus> result = Ok(FileStatus{});
    if (status.type() == fs::file_type::not_found) {
        result = Ok(FileStatus{});
    } else if (ec) {
        result = Fail<FileStatus>(ec.message() + ": " + path);
    } else {
        FileStatus info;
        info.exists = true;
        info.is_directory = fs::is_directory(status);
        if (fs::is_regular_file(status)) {
            info.size = fs::file_size(path, ec);
            if (ec) {
                info.size = 0;
            }
        }
        result = Ok(info);
    }

    asio::post(io_context_, [handler = std::move(handler), result = std::move(result)]() mutable {
        handler(std::move(result));
    });
}

std::shared_ptr<LocalWriteStream> PosixFileSystem::create_write_stream(const std::string& path) {
    return std::make_shared<FileWriteStream>(io_context_, path);
}

std::shared_ptr<LocalReadStream> PosixFileSystem::create_read_stream(const std::string& path) {
    return std::make_shared<FileReadStream>(io_context_, path, read_chunk_size_);
}

void PosixFileSystem::remove(const std::string& path, RemoveHandler handler) {
    std::error_code ec;
    fs::remove(path, ec);

    Result<void> result;
    if (ec && ec != std::errc::no_such_file_or_directory) {
        result = Err<void>("Failed to remove " + path + ": " + ec.message());
    }

    asio::post(io_context_, [handler = std::move(handler), result]() {
        handler(result);
    });
}

} // namespace ntftp::io
