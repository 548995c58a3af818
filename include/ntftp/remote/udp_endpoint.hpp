#pragma once

#include "ntftp/core/config.hpp"
#include "ntftp/remote/endpoint.hpp"

#include <boost/asio/io_context.hpp>

namespace ntftp::remote {

namespace asio = boost::asio;

/**
 * @brief RemoteEndpoint speaking plain RFC 1350 over UDP
 *
 * Lock-step transfer with 512-byte blocks in octet mode. The request goes
 * to the configured address and port; the port the server answers from
 * becomes the transfer ID for the rest of the exchange. The last packet
 * sent is retransmitted every `timeout_ms` up to `retries` times.
 *
 * Option extensions are never requested, so `block_size` and
 * `window_size` only show up in the debug log.
 *
 * Streams must be created and driven from the io_context thread.
 */
class UdpEndpoint : public RemoteEndpoint {
public:
    UdpEndpoint(asio::io_context& io_context, EndpointSettings settings);

    Result<void> validate_remote(const std::string& remote_path) const override;
    std::shared_ptr<GetStream> create_get_stream(const std::string& remote_path) override;
    std::shared_ptr<PutStream> create_put_stream(const std::string& remote_path,
                                                 std::uint64_t size) override;

    [[nodiscard]] const EndpointSettings& settings() const noexcept { return settings_; }

private:
    asio::io_context& io_context_;
    EndpointSettings settings_;
};

} // namespace ntftp::remote
