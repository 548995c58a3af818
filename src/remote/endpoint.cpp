#include "ntftp/remote/endpoint.hpp"

namespace ntftp::remote {

Result<void> check_remote_path(const std::string& remote_path) {
    if (remote_path.empty()) {
        return Err<void>(std::string("The remote file cannot be empty"));
    }
    if (remote_path.find('\0') != std::string::npos) {
        return Err<void>(std::string("The remote file contains a NUL byte"));
    }
    if (remote_path.size() > RemoteEndpoint::kMaxRemotePathLength) {
        return Err<void>(std::string("The remote file is too long"));
    }
    return Ok();
}

} // namespace ntftp::remote
