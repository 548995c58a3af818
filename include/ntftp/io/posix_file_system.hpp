#pragma once

#include "ntftp/io/file_system.hpp"

#include <boost/asio/io_context.hpp>

#include <cstddef>

namespace ntftp::io {

namespace asio = boost::asio;

/**
 * @brief FileSystem backed by std::filesystem and std::fstream
 *
 * The work itself is synchronous; every completion and stream event is
 * posted onto the io_context so callers observe the same ordering rules
 * as with real asynchronous I/O.
 */
class PosixFileSystem : public FileSystem {
public:
    static constexpr std::size_t kReadChunkSize = 64 * 1024;

    explicit PosixFileSystem(asio::io_context& io_context,
                             std::size_t read_chunk_size = kReadChunkSize);

    void stat(const std::string& path, StatHandler handler) override;
    std::shared_ptr<LocalWriteStream> create_write_stream(const std::string& path) override;
    std::shared_ptr<LocalReadStream> create_read_stream(const std::string& path) override;
    void remove(const std::string& path, RemoveHandler handler) override;

private:
    asio::io_context& io_context_;
    std::size_t read_chunk_size_;
};

} // namespace ntftp::io
