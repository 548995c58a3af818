#pragma once

#include "ntftp/events/event_bus.hpp"
#include "ntftp/io/file_system.hpp"
#include "ntftp/remote/endpoint.hpp"
#include "ntftp/session/session.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ntftp::session {

/**
 * @brief Runs get/put commands against the session's single transfer slot
 *
 * Each accepted command ends with exactly one call to its DoneHandler:
 * with a one-line error to show, or with nullopt on success and on user
 * cancellation. The only exception is a command dropped by
 * cancel_pending(), which never calls back.
 */
class TransferController {
public:
    using DoneHandler = std::function<void(const std::optional<std::string>& error)>;

    static constexpr const char* kBusyMessage = "A transfer is already in progress";
    static constexpr const char* kLocalIsDirectory = "The local file is a directory";
    static constexpr const char* kLocalMissing = "The local file does not exist";

    TransferController(Session& session,
                       io::FileSystem& file_system,
                       remote::RemoteEndpoint& endpoint,
                       events::EventBus& bus);

    /**
     * @brief Download `remote` to `local` (defaults to `remote`)
     *
     * An existing regular file is overwritten; an existing directory is
     * rejected before any stream is opened.
     */
    void get(const std::string& remote, const std::optional<std::string>& local, DoneHandler done);

    /**
     * @brief Upload `local` to `remote` (defaults to `local`)
     */
    void put(const std::string& local, const std::optional<std::string>& remote, DoneHandler done);

    // Drops a command still waiting for its stat result. Returns true if
    // there was one.
    bool cancel_pending();

    [[nodiscard]] bool busy() const noexcept { return pending_ || !session_.idle(); }

private:
    template<typename TransferType>
    void launch(std::shared_ptr<TransferType> transfer, DoneHandler done);

    void begin_pending();

    Session& session_;
    io::FileSystem& file_system_;
    remote::RemoteEndpoint& endpoint_;
    events::EventBus& bus_;

    bool pending_ = false;
    std::uint64_t pending_ticket_ = 0;
};

} // namespace ntftp::session
