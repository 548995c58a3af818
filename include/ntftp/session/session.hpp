#pragma once

#include "ntftp/core/result.hpp"

#include <boost/asio/steady_timer.hpp>

#include <cstddef>
#include <memory>
#include <variant>

namespace ntftp::session {

class Transfer;
class ReadTransfer;
class WriteTransfer;

/**
 * @brief Process-wide client state shared by the session loop and the
 * transfer controller
 *
 * The active-transfer slot holds at most one transfer. Only the
 * controller fills and clears it; the session loop reads it to request
 * an abort. The interrupt flag and grace timer belong to the session loop.
 */
class Session {
public:
    using ActiveTransfer = std::variant<std::monostate,
                                        std::shared_ptr<ReadTransfer>,
                                        std::shared_ptr<WriteTransfer>>;

    Session() = default;
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] bool idle() const noexcept {
        return std::holds_alternative<std::monostate>(active_);
    }
    [[nodiscard]] const ActiveTransfer& active() const noexcept { return active_; }

    // Common view of whichever transfer is active, or nullptr.
    [[nodiscard]] std::shared_ptr<Transfer> active_transfer() const;

    // Fails if a transfer is already active.
    Result<void> set_active(ActiveTransfer transfer);
    void clear_active();

    [[nodiscard]] std::size_t completed_transfers() const noexcept { return completed_transfers_; }

    [[nodiscard]] bool interrupt_armed() const noexcept { return interrupt_armed_; }
    [[nodiscard]] bool grace_window_open() const noexcept { return disarm_timer_ != nullptr; }

    void arm_interrupt(std::unique_ptr<boost::asio::steady_timer> disarm_timer);
    void disarm_interrupt();

private:
    ActiveTransfer active_;
    std::size_t completed_transfers_ = 0;
    bool interrupt_armed_ = false;
    std::unique_ptr<boost::asio::steady_timer> disarm_timer_;
};

} // namespace ntftp::session
