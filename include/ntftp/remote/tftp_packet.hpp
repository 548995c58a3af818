#pragma once

#include "ntftp/core/result.hpp"
#include "ntftp/io/file_system.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace ntftp::remote::tftp {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kMaxPacketSize = kBlockSize + 4;

enum class Opcode : std::uint16_t {
    ReadRequest = 1,
    WriteRequest = 2,
    Data = 3,
    Ack = 4,
    Error = 5
};

enum class ErrorCode : std::uint16_t {
    NotDefined = 0,
    FileNotFound = 1,
    AccessViolation = 2,
    DiskFull = 3,
    IllegalOperation = 4,
    UnknownTransferId = 5,
    FileExists = 6,
    NoSuchUser = 7
};

struct RequestPacket {
    Opcode opcode = Opcode::ReadRequest;
    std::string filename;
    std::string mode = "octet";
};

struct DataPacket {
    std::uint16_t block = 0;
    io::Bytes payload;
};

struct AckPacket {
    std::uint16_t block = 0;
};

struct ErrorPacket {
    ErrorCode code = ErrorCode::NotDefined;
    std::string message;
};

using Packet = std::variant<RequestPacket, DataPacket, AckPacket, ErrorPacket>;

io::Bytes encode(const Packet& packet);

// Rejects truncated packets, unknown opcodes and unterminated strings.
Result<Packet> decode(const std::uint8_t* data, std::size_t size);

} // namespace ntftp::remote::tftp
