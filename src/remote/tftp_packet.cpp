#include "ntftp/remote/tftp_packet.hpp"

namespace ntftp::remote::tftp {
namespace {

void put_u16(io::Bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value & 0xff));
}

std::uint16_t get_u16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>((data[0] << 8) | data[1]);
}

void put_string(io::Bytes& out, const std::string& text) {
    out.insert(out.end(), text.begin(), text.end());
    out.push_back(0);
}

// Reads a NUL-terminated string starting at `offset`, advancing it past the NUL.
Result<std::string> get_string(const std::uint8_t* data, std::size_t size, std::size_t& offset) {
    for (std::size_t i = offset; i < size; ++i) {
        if (data[i] == 0) {
            std::string text(reinterpret_cast<const char*>(data + offset), i - offset);
            offset = i + 1;
            return Ok(text);
        }
    }
    return Fail<std::string>("Unterminated string in packet");
}

struct Encoder {
    io::Bytes& out;

    void operator()(const RequestPacket& p) const {
        put_u16(out, static_cast<std::uint16_t>(p.opcode));
        put_string(out, p.filename);
        put_string(out, p.mode);
    }

    void operator()(const DataPacket& p) const {
        put_u16(out, static_cast<std::uint16_t>(Opcode::Data));
        put_u16(out, p.block);
        out.insert(out.end(), p.payload.begin(), p.payload.end());
    }

    void operator()(const AckPacket& p) const {
        put_u16(out, static_cast<std::uint16_t>(Opcode::Ack));
        put_u16(out, p.block);
    }

    void operator()(const ErrorPacket& p) const {
        put_u16(out, static_cast<std::uint16_t>(Opcode::Error));
        put_u16(out, static_cast<std::uint16_t>(p.code));
        put_string(out, p.message);
    }
};

} // namespace

io::Bytes encode(const Packet& packet) {
    io::Bytes out;
    out.reserve(kMaxPacketSize);
    std::visit(Encoder{out}, packet);
    return out;
}

Result<Packet> decode(const std::uint8_t* data, std::size_t size) {
    if (size < 4) {
        return Fail<Packet>("Packet too short");
    }

    const auto opcode = get_u16(data);
    switch (static_cast<Opcode>(opcode)) {
        case Opcode::ReadRequest:
        case Opcode::WriteRequest: {
            std::size_t offset = 2;
            auto filename = get_string(data, size, offset);
            if (filename.is_error()) {
                return Err<Packet>(filename.error());
            }
            auto mode = get_string(data, size, offset);
            if (mode.is_error()) {
                return Err<Packet>(mode.error());
            }
            return Ok(Packet{RequestPacket{static_cast<Opcode>(opcode), filename.value(), mode.value()}});
        }
        case Opcode::Data: {
            if (size > kMaxPacketSize) {
                return Fail<Packet>("Data packet exceeds block size");
            }
            DataPacket packet;
            packet.block = get_u16(data + 2);
            packet.payload.assign(data + 4, data + size);
            return Ok(Packet{std::move(packet)});
        }
        case Opcode::Ack:
            return Ok(Packet{AckPacket{get_u16(data + 2)}});
        case Opcode::Error: {
            std::size_t offset = 4;
            ErrorPacket packet;
            packet.code = static_cast<ErrorCode>(get_u16(data + 2));
            // Some servers omit the terminating NUL
            auto message = get_string(data, size, offset);
            packet.message = message.is_ok()
                ? message.value()
                : std::string(reinterpret_cast<const char*>(data + 4), size - 4);
            return Ok(Packet{std::move(packet)});
        }
    }

    return Fail<Packet>("Unknown opcode " + std::to_string(opcode));
}

} // namespace ntftp::remote::tftp
