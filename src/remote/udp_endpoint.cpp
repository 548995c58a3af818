#include "ntftp/remote/udp_endpoint.hpp"
#include "ntftp/remote/tftp_packet.hpp"

#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <deque>

namespace ntftp::remote {

using udp = asio::ip::udp;

namespace {

/**
 * @brief Socket, retransmission timer and transfer-ID bookkeeping shared
 * by both directions
 *
 * Lifecycle:
 * 1. open() resolves the server and sends the request packet
 * 2. Every reply goes through handle_datagram(), which filters foreign
 *    transfer IDs and hands valid packets to on_packet()
 * 3. finish_with_end() / finish_with_error() / abort_transfer() close the
 *    socket and post exactly one terminal event
 */
class UdpTransfer : public std::enable_shared_from_this<UdpTransfer> {
public:
    virtual ~UdpTransfer() = default;

protected:
    UdpTransfer(asio::io_context& io_context, const EndpointSettings& settings, std::string remote_path)
        : io_context_(io_context),
          settings_(settings),
          remote_path_(std::move(remote_path)),
          resolver_(io_context),
          socket_(io_context),
          timer_(io_context) {}

    virtual void on_packet(const tftp::Packet& packet) = 0;

    void open(tftp::Opcode request) {
        auto self = shared_from_this();
        resolver_.async_resolve(
            settings_.address, std::to_string(settings_.port),
            [this, self, request](const boost::system::error_code& ec, udp::resolver::results_type results) {
                if (finished_) {
                    return;
                }
                if (ec || results.empty()) {
                    finish_with_error("Cannot resolve " + settings_.address +
                                      (ec ? ": " + ec.message() : std::string()));
                    return;
                }

                server_ = results.begin()->endpoint();
                boost::system::error_code open_ec;
                socket_.open(server_.protocol(), open_ec);
                if (open_ec) {
                    finish_with_error("Cannot open socket: " + open_ec.message());
                    return;
                }

                spdlog::debug("Sending {} for '{}' to {}:{}",
                              request == tftp::Opcode::ReadRequest ? "RRQ" : "WRQ",
                              remote_path_, server_.address().to_string(), server_.port());
                send(tftp::encode(tftp::RequestPacket{request, remote_path_, "octet"}));
                receive();
            });
    }

    // Sends a packet that expects an answer and arms the retransmission timer.
    void send(io::Bytes packet) {
        last_packet_ = std::move(packet);
        attempts_ = 0;
        transmit();
    }

    // Sends a packet nobody answers (final ACK, ERROR).
    void send_once(const io::Bytes& packet, const udp::endpoint& target) {
        boost::system::error_code ec;
        socket_.send_to(asio::buffer(packet), target, 0, ec);
        if (ec) {
            spdlog::debug("send_to failed: {}", ec.message());
        }
    }

    void finish_with_end() {
        if (finished_) {
            return;
        }
        close();
        asio::post(io_context_, [self = shared_from_this(), this]() {
            if (handlers_.on_end) {
                handlers_.on_end();
            }
        });
    }

    void finish_with_error(std::string message) {
        if (finished_) {
            return;
        }
        close();
        spdlog::debug("Remote transfer of '{}' failed: {}", remote_path_, message);
        asio::post(io_context_, [self = shared_from_this(), this, message = std::move(message)]() {
            if (handlers_.on_error) {
                handlers_.on_error(message);
            }
        });
    }

    void abort_transfer() {
        if (finished_) {
            return;
        }
        if (socket_.is_open()) {
            const auto target = peer_known_ ? peer_ : server_;
            send_once(tftp::encode(tftp::ErrorPacket{tftp::ErrorCode::NotDefined, "Aborted"}), target);
        }
        spdlog::debug("Remote transfer of '{}' aborted", remote_path_);
        finish_with_end();
    }

    void report_progress(std::uint64_t bytes, std::optional<std::uint64_t> total) {
        if (handlers_.on_progress) {
            handlers_.on_progress(TransferProgress{bytes, total});
        }
    }

    [[nodiscard]] const udp::endpoint& peer() const noexcept { return peer_; }

    asio::io_context& io_context_;
    EndpointSettings settings_;
    std::string remote_path_;
    RemoteHandlers handlers_;
    bool finished_ = false;

private:
    void transmit() {
        send_once(last_packet_, peer_known_ ? peer_ : server_);
        timer_.expires_after(std::chrono::milliseconds(settings_.timeout_ms));
        timer_.async_wait([this, self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec || finished_) {
                return;
            }
            if (attempts_ >= settings_.retries) {
                finish_with_error("Timed out");
                return;
            }
            ++attempts_;
            spdlog::debug("Timeout on '{}', retransmitting ({}/{})", remote_path_, attempts_, settings_.retries);
            transmit();
        });
    }

    void receive() {
        socket_.async_receive_from(
            asio::buffer(buffer_), sender_,
            [this, self = shared_from_this()](const boost::system::error_code& ec, std::size_t size) {
                if (finished_) {
                    return;
                }
                if (ec) {
                    if (ec != asio::error::operation_aborted) {
                        finish_with_error(ec.message());
                    }
                    return;
                }
                handle_datagram(size);
                if (!finished_) {
                    receive();
                }
            });
    }

    void handle_datagram(std::size_t size) {
        if (!peer_known_) {
            if (sender_.address() != server_.address()) {
                return;
            }
            peer_ = sender_;
            peer_known_ = true;
        } else if (sender_ != peer_) {
            send_once(tftp::encode(tftp::ErrorPacket{tftp::ErrorCode::UnknownTransferId, "Unknown transfer ID"}),
                      sender_);
            return;
        }

        auto packet = tftp::decode(buffer_.data(), size);
        if (packet.is_error()) {
            spdlog::debug("Dropping malformed packet: {}", packet.error());
            return;
        }

        if (const auto* error = std::get_if<tftp::ErrorPacket>(&packet.value())) {
            finish_with_error("(Server) " + error->message);
            return;
        }

        on_packet(packet.value());
    }

    void close() {
        finished_ = true;
        boost::system::error_code ignored;
        timer_.cancel();
        resolver_.cancel();
        if (socket_.is_open()) {
            socket_.close(ignored);
        }
    }

    udp::resolver resolver_;
    udp::socket socket_;
    asio::steady_timer timer_;
    udp::endpoint server_;
    udp::endpoint peer_;
    udp::endpoint sender_;
    bool peer_known_ = false;
    io::Bytes last_packet_;
    std::uint32_t attempts_ = 0;
    std::array<std::uint8_t, tftp::kMaxPacketSize + 1> buffer_{};
};

class UdpGetStream : public GetStream, public UdpTransfer {
public:
    UdpGetStream(asio::io_context& io_context, const EndpointSettings& settings, std::string remote_path)
        : UdpTransfer(io_context, settings, std::move(remote_path)) {}

    void start(RemoteHandlers handlers, std::function<void(io::Bytes)> on_data) override {
        handlers_ = std::move(handlers);
        on_data_ = std::move(on_data);
        open(tftp::Opcode::ReadRequest);
    }

    void abort() override { abort_transfer(); }

private:
    void on_packet(const tftp::Packet& packet) override {
        const auto* data = std::get_if<tftp::DataPacket>(&packet);
        if (data == nullptr) {
            finish_with_error("Unexpected packet from server");
            return;
        }

        if (data->block != expected_block_) {
            // A repeated block means our ACK was lost; the timer resends it.
            return;
        }

        const bool last = data->payload.size() < tftp::kBlockSize;
        bytes_ += data->payload.size();
        if (on_data_) {
            on_data_(data->payload);
        }
        if (finished_) {
            return;
        }
        report_progress(bytes_, std::nullopt);

        const auto ack = tftp::encode(tftp::AckPacket{expected_block_});
        if (last) {
            send_once(ack, peer());
            finish_with_end();
            return;
        }
        send(ack);
        ++expected_block_;
    }

    std::function<void(io::Bytes)> on_data_;
    std::uint16_t expected_block_ = 1;
    std::uint64_t bytes_ = 0;
};

class UdpPutStream : public PutStream, public UdpTransfer {
public:
    static constexpr std::size_t kHighWaterMark = 64 * tftp::kBlockSize;

    UdpPutStream(asio::io_context& io_context, const EndpointSettings& settings,
                 std::string remote_path, std::uint64_t size)
        : UdpTransfer(io_context, settings, std::move(remote_path)), size_(size) {}

    void start(RemoteHandlers handlers, std::function<void()> on_drain) override {
        handlers_ = std::move(handlers);
        on_drain_ = std::move(on_drain);
        open(tftp::Opcode::WriteRequest);
    }

    bool write(io::Bytes chunk) override {
        if (finished_ || ended_) {
            return false;
        }
        pending_.insert(pending_.end(), chunk.begin(), chunk.end());
        send_next();
        if (pending_.size() >= kHighWaterMark) {
            drain_requested_ = true;
            return false;
        }
        return true;
    }

    void end() override {
        if (finished_ || ended_) {
            return;
        }
        ended_ = true;
        send_next();
    }

    void abort() override { abort_transfer(); }

private:
    void on_packet(const tftp::Packet& packet) override {
        const auto* ack = std::get_if<tftp::AckPacket>(&packet);
        if (ack == nullptr) {
            finish_with_error("Unexpected packet from server");
            return;
        }
        // Duplicate ACKs are ignored (Sorcerer's Apprentice)
        if (ack->block != awaited_ack_ || !awaiting_ack_) {
            return;
        }

        awaiting_ack_ = false;
        if (request_acknowledged_) {
            acked_bytes_ += in_flight_;
            report_progress(acked_bytes_, size_);
        }
        request_acknowledged_ = true;
        in_flight_ = 0;

        if (final_sent_) {
            finish_with_end();
            return;
        }
        send_next();
    }

    void send_next() {
        if (awaiting_ack_ || finished_ || final_sent_) {
            return;
        }
        if (pending_.size() < tftp::kBlockSize && !ended_) {
            return;
        }

        const std::size_t count = std::min(pending_.size(), tftp::kBlockSize);
        tftp::DataPacket data;
        data.block = static_cast<std::uint16_t>(awaited_ack_ + 1);
        data.payload.assign(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(count));
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(count));

        final_sent_ = count < tftp::kBlockSize;
        in_flight_ = count;
        awaited_ack_ = data.block;
        awaiting_ack_ = true;
        send(tftp::encode(data));

        if (drain_requested_ && pending_.size() < kHighWaterMark / 2) {
            drain_requested_ = false;
            asio::post(io_context_, [self = shared_from_this(), this]() {
                if (!finished_ && on_drain_) {
                    on_drain_();
                }
            });
        }
    }

    std::uint64_t size_;
    std::function<void()> on_drain_;
    std::deque<std::uint8_t> pending_;
    std::uint16_t awaited_ack_ = 0;
    bool awaiting_ack_ = true;  // the WRQ is answered by ACK 0
    bool request_acknowledged_ = false;
    bool ended_ = false;
    bool final_sent_ = false;
    bool drain_requested_ = false;
    std::size_t in_flight_ = 0;
    std::uint64_t acked_bytes_ = 0;
};

} // namespace

UdpEndpoint::UdpEndpoint(asio::io_context& io_context, EndpointSettings settings)
    : io_context_(io_context), settings_(std::move(settings)) {
    spdlog::debug("Endpoint {}:{} timeout={}ms retries={} (RFC 1350 mode, requested blksize={} windowsize={})",
                  settings_.address, settings_.port, settings_.timeout_ms, settings_.retries,
                  settings_.block_size, settings_.window_size);
}

Result<void> UdpEndpoint::validate_remote(const std::string& remote_path) const {
    return check_remote_path(remote_path);
}

std::shared_ptr<GetStream> UdpEndpoint::create_get_stream(const std::string& remote_path) {
    return std::make_shared<UdpGetStream>(io_context_, settings_, remote_path);
}

std::shared_ptr<PutStream> UdpEndpoint::create_put_stream(const std::string& remote_path, std::uint64_t size) {
    return std::make_shared<UdpPutStream>(io_context_, settings_, remote_path, size);
}

} // namespace ntftp::remote
