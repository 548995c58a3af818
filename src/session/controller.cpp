#include "ntftp/session/controller.hpp"
#include "ntftp/session/transfer.hpp"

#include <spdlog/spdlog.h>

namespace ntftp::session {

TransferController::TransferController(Session& session,
                                       io::FileSystem& file_system,
                                       remote::RemoteEndpoint& endpoint,
                                       events::EventBus& bus)
    : session_(session),
      file_system_(file_system),
      endpoint_(endpoint),
      bus_(bus) {}

void TransferController::get(const std::string& remote,
                             const std::optional<std::string>& local,
                             DoneHandler done) {
    if (busy()) {
        done(std::string(kBusyMessage));
        return;
    }
    if (auto valid = endpoint_.validate_remote(remote); valid.is_error()) {
        done(valid.error());
        return;
    }

    const std::string destination = local.value_or(remote);
    const auto ticket = pending_ticket_ + 1;
    begin_pending();

    file_system_.stat(destination, [this, ticket, remote, destination, done](Result<io::FileStatus> status) {
        if (!pending_ || ticket != pending_ticket_) {
            spdlog::debug("Dropping cancelled get of '{}'", remote);
            return;
        }
        pending_ = false;

        if (status.is_error()) {
            done(status.error());
            return;
        }
        if (status.value().is_directory) {
            done(std::string(kLocalIsDirectory));
            return;
        }

        launch(std::make_shared<ReadTransfer>(remote, destination, file_system_, endpoint_, bus_), done);
    });
}

void TransferController::put(const std::string& local,
                             const std::optional<std::string>& remote,
                             DoneHandler done) {
    if (busy()) {
        done(std::string(kBusyMessage));
        return;
    }
    const std::string destination = remote.value_or(local);
    if (auto valid = endpoint_.validate_remote(destination); valid.is_error()) {
        done(valid.error());
        return;
    }

    const auto ticket = pending_ticket_ + 1;
    begin_pending();

    file_system_.stat(local, [this, ticket, local, destination, done](Result<io::FileStatus> status) {
        if (!pending_ || ticket != pending_ticket_) {
            spdlog::debug("Dropping cancelled put of '{}'", local);
            return;
        }
        pending_ = false;

        if (status.is_error()) {
            done(status.error());
            return;
        }
        if (!status.value().exists) {
            done(std::string(kLocalMissing));
            return;
        }
        if (status.value().is_directory) {
            done(std::string(kLocalIsDirectory));
            return;
        }

        launch(std::make_shared<WriteTransfer>(local, destination, status.value().size,
                                               file_system_, endpoint_, bus_),
               done);
    });
}

bool TransferController::cancel_pending() {
    if (!pending_) {
        return false;
    }
    pending_ = false;
    return true;
}

void TransferController::begin_pending() {
    pending_ = true;
    ++pending_ticket_;
}

template<typename TransferType>
void TransferController::launch(std::shared_ptr<TransferType> transfer, DoneHandler done) {
    if (auto slot = session_.set_active(transfer); slot.is_error()) {
        done(slot.error());
        return;
    }

    transfer->start([this, done](const TransferResult& result) {
        session_.clear_active();
        spdlog::debug("Transfer finished: {} ({} bytes)", to_string(result.outcome), result.bytes);

        if (result.outcome == TransferOutcome::LocalFailed || result.outcome == TransferOutcome::RemoteFailed) {
            done(result.message);
        } else {
            done(std::nullopt);
        }
    });
}

} // namespace ntftp::session
