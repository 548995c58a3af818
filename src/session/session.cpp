#include "ntftp/session/session.hpp"
#include "ntftp/session/transfer.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>

namespace ntftp::session {

std::shared_ptr<Transfer> Session::active_transfer() const {
    return std::visit(
        [](const auto& slot) -> std::shared_ptr<Transfer> {
            if constexpr (std::is_same_v<std::decay_t<decltype(slot)>, std::monostate>) {
                return nullptr;
            } else {
                return slot;
            }
        },
        active_);
}

Result<void> Session::set_active(ActiveTransfer transfer) {
    if (!idle()) {
        return Err<void>(std::string("A transfer is already in progress"));
    }
    active_ = std::move(transfer);
    return Ok();
}

void Session::clear_active() {
    if (idle()) {
        spdlog::warn("clear_active() called with no active transfer");
        return;
    }
    active_ = std::monostate{};
    ++completed_transfers_;
}

void Session::arm_interrupt(std::unique_ptr<boost::asio::steady_timer> disarm_timer) {
    interrupt_armed_ = true;
    disarm_timer_ = std::move(disarm_timer);
}

void Session::disarm_interrupt() {
    interrupt_armed_ = false;
    disarm_timer_.reset();
}

} // namespace ntftp::session
