#include "ntftp/session/transfer.hpp"

#include <spdlog/spdlog.h>

namespace ntftp::session {

using Kind = TransferEvent::Kind;

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Opening: return "Opening";
        case TransferState::Active: return "Active";
        case TransferState::Aborting: return "Aborting";
        case TransferState::CleaningUp: return "CleaningUp";
        case TransferState::Done: return "Done";
    }
    return "Unknown";
}

const char* to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Succeeded: return "Succeeded";
        case TransferOutcome::LocalFailed: return "LocalFailed";
        case TransferOutcome::RemoteFailed: return "RemoteFailed";
        case TransferOutcome::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

// ──────────────────────────────────────────────────────────
// Transfer
// ──────────────────────────────────────────────────────────

Transfer::Transfer(events::Direction direction,
                   std::string remote_path,
                   std::string local_path,
                   events::EventBus& bus)
    : direction_(direction),
      remote_path_(std::move(remote_path)),
      local_path_(std::move(local_path)),
      bus_(bus) {}

void Transfer::start(CompletionHandler on_complete) {
    auto self = shared_from_this();
    on_complete_ = std::move(on_complete);
    started_at_ = std::chrono::steady_clock::now();

    dispatching_ = true;
    open_streams();
    state_ = TransferState::Active;
    bus_.emit(events::TransferStartedEvent{direction_, remote_path_, local_path_});
    dispatching_ = false;

    run_queue();
}

void Transfer::abort() {
    handle(TransferEvent{Kind::AbortRequested, {}});
}

void Transfer::handle(TransferEvent event) {
    auto self = shared_from_this();
    queue_.push_back(std::move(event));
    if (!dispatching_) {
        run_queue();
    }
}

void Transfer::run_queue() {
    dispatching_ = true;
    while (!queue_.empty()) {
        TransferEvent event = std::move(queue_.front());
        queue_.pop_front();
        transition(event);
    }
    dispatching_ = false;
}

void Transfer::transition(const TransferEvent& event) {
    if (state_ == TransferState::Done) {
        spdlog::debug("Transfer '{}' ignoring event {} after completion",
                      remote_path_, static_cast<int>(event.kind));
        return;
    }

    switch (event.kind) {
        case Kind::AbortRequested:
            if (state_ == TransferState::Active) {
                fail(TransferOutcome::Cancelled, {});
            }
            return;

        case Kind::LocalError:
            local_stopped_ = true;
            if (state_ == TransferState::Active) {
                fail(TransferOutcome::LocalFailed, event.message);
            } else {
                spdlog::debug("Local error on '{}' while {}: {}", local_path_, to_string(state_), event.message);
                settle();
            }
            return;

        case Kind::LocalFinished:
            local_stopped_ = true;
            if (state_ == TransferState::Active) {
                on_local_finish();
            } else {
                settle();
            }
            return;

        case Kind::RemoteError:
            remote_stopped_ = true;
            if (state_ == TransferState::Active) {
                fail(TransferOutcome::RemoteFailed, event.message);
            } else if (state_ == TransferState::Aborting) {
                spdlog::debug("Remote error on '{}' while aborting: {}", remote_path_, event.message);
                stop_local_once();
                settle();
            }
            return;

        case Kind::RemoteEnded:
            remote_stopped_ = true;
            if (state_ == TransferState::Active) {
                on_remote_end();
            } else if (state_ == TransferState::Aborting) {
                stop_local_once();
                settle();
            }
            return;

        case Kind::CleanupFinished:
            if (state_ == TransferState::CleaningUp) {
                complete(cause_);
            }
            return;
    }
}

void Transfer::fail(TransferOutcome cause, std::string message) {
    cause_ = cause;
    message_ = std::move(message);
    state_ = TransferState::Aborting;

    if (!remote_stopped_) {
        abort_remote();
    } else {
        stop_local_once();
    }
    settle();
}

void Transfer::settle() {
    if (state_ != TransferState::Aborting || !local_stopped_ || !remote_stopped_) {
        return;
    }
    state_ = TransferState::CleaningUp;
    if (begin_cleanup()) {
        complete(cause_);
    }
}

void Transfer::succeed() {
    stop_local_once();
    if (!remote_stopped_) {
        remote_stopped_ = true;
        abort_remote();
    }
    complete(TransferOutcome::Succeeded);
}

void Transfer::stop_local_once() {
    if (local_stopped_ || local_stopping_) {
        return;
    }
    local_stopping_ = true;
    if (stop_local()) {
        local_stopped_ = true;
    }
}

void Transfer::complete(TransferOutcome outcome) {
    state_ = TransferState::Done;

    TransferResult result;
    result.outcome = outcome;
    result.bytes = bytes_;
    if (outcome == TransferOutcome::LocalFailed || outcome == TransferOutcome::RemoteFailed) {
        result.message = message_;
    }

    switch (outcome) {
        case TransferOutcome::Succeeded: {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started_at_);
            bus_.emit(events::TransferCompletedEvent{direction_, remote_path_, local_path_, bytes_, elapsed});
            break;
        }
        case TransferOutcome::Cancelled:
            bus_.emit(events::TransferCancelledEvent{direction_, remote_path_, local_path_});
            break;
        case TransferOutcome::LocalFailed:
        case TransferOutcome::RemoteFailed:
            bus_.emit(events::TransferFailedEvent{direction_, remote_path_, local_path_, message_});
            break;
    }

    auto handler = std::move(on_complete_);
    on_complete_ = nullptr;
    if (handler) {
        handler(result);
    }
}

std::function<void()> Transfer::raise(Kind kind) {
    return [weak = weak_from_this(), kind]() {
        if (auto self = weak.lock()) {
            self->handle(TransferEvent{kind, {}});
        }
    };
}

std::function<void(const std::string&)> Transfer::raise_with_message(Kind kind) {
    return [weak = weak_from_this(), kind](const std::string& message) {
        if (auto self = weak.lock()) {
            self->handle(TransferEvent{kind, message});
        }
    };
}

std::function<void(const remote::TransferProgress&)> Transfer::publish_progress() {
    return [weak = weak_from_this()](const remote::TransferProgress& progress) {
        if (auto self = weak.lock()) {
            self->bus_.emit(events::TransferProgressEvent{
                self->direction_, self->remote_path_, progress.bytes, progress.total});
        }
    };
}

// ──────────────────────────────────────────────────────────
// ReadTransfer
// ──────────────────────────────────────────────────────────

ReadTransfer::ReadTransfer(std::string remote_path,
                           std::string local_path,
                           io::FileSystem& file_system,
                           remote::RemoteEndpoint& endpoint,
                           events::EventBus& bus)
    : Transfer(events::Direction::Get, std::move(remote_path), std::move(local_path), bus),
      file_system_(file_system),
      endpoint_(endpoint) {}

void ReadTransfer::open_streams() {
    local_ = file_system_.create_write_stream(local_path());
    remote_ = endpoint_.create_get_stream(remote_path());

    local_->start(io::LocalWriteStream::Handlers{
        raise(Kind::LocalFinished),
        raise_with_message(Kind::LocalError)});

    auto weak = std::weak_ptr<Transfer>(shared_from_this());
    remote_->start(
        remote::RemoteHandlers{
            raise_with_message(Kind::RemoteError),
            publish_progress(),
            raise(Kind::RemoteEnded)},
        [weak](io::Bytes chunk) {
            if (auto self = weak.lock()) {
                static_cast<ReadTransfer&>(*self).forward(std::move(chunk));
            }
        });
}

void ReadTransfer::forward(io::Bytes chunk) {
    if (!forwarding()) {
        return;
    }
    count_bytes(chunk.size());
    local_->write(std::move(chunk));
}

void ReadTransfer::abort_remote() {
    remote_->abort();
}

bool ReadTransfer::stop_local() {
    local_->end();
    return false;
}

bool ReadTransfer::begin_cleanup() {
    // A destination that could not be opened was never touched
    if (!local_->opened()) {
        return true;
    }
    auto weak = std::weak_ptr<Transfer>(shared_from_this());
    file_system_.remove(local_path(), [weak, path = local_path()](Result<void> removed) {
        if (removed.is_error()) {
            spdlog::warn("Could not remove partial file {}: {}", path, removed.error());
        }
        if (auto self = weak.lock()) {
            self->handle(TransferEvent{Kind::CleanupFinished, {}});
        }
    });
    return false;
}

// The remote side delivered its last block: flush and close the file.
void ReadTransfer::on_remote_end() {
    stop_local_once();
}

void ReadTransfer::on_local_finish() {
    succeed();
}

// ──────────────────────────────────────────────────────────
// WriteTransfer
// ──────────────────────────────────────────────────────────

WriteTransfer::WriteTransfer(std::string local_path,
                             std::string remote_path,
                             std::uint64_t size,
                             io::FileSystem& file_system,
                             remote::RemoteEndpoint& endpoint,
                             events::EventBus& bus)
    : Transfer(events::Direction::Put, std::move(remote_path), std::move(local_path), bus),
      size_(size),
      file_system_(file_system),
      endpoint_(endpoint) {}

void WriteTransfer::open_streams() {
    local_ = file_system_.create_read_stream(local_path());
    remote_ = endpoint_.create_put_stream(remote_path(), size_);

    auto weak = std::weak_ptr<Transfer>(shared_from_this());
    remote_->start(
        remote::RemoteHandlers{
            raise_with_message(Kind::RemoteError),
            publish_progress(),
            raise(Kind::RemoteEnded)},
        [weak]() {
            auto self = weak.lock();
            if (self && self->state() == TransferState::Active) {
                static_cast<WriteTransfer&>(*self).local_->resume();
            }
        });

    local_->start(io::LocalReadStream::Handlers{
        [weak](io::Bytes chunk) {
            if (auto self = weak.lock()) {
                static_cast<WriteTransfer&>(*self).forward(std::move(chunk));
            }
        },
        raise(Kind::LocalFinished),
        raise_with_message(Kind::LocalError)});
}

void WriteTransfer::forward(io::Bytes chunk) {
    if (!forwarding()) {
        return;
    }
    count_bytes(chunk.size());
    if (!remote_->write(std::move(chunk))) {
        local_->pause();
    }
}

void WriteTransfer::abort_remote() {
    remote_->abort();
}

bool WriteTransfer::stop_local() {
    local_->close();
    return true;
}

bool WriteTransfer::begin_cleanup() {
    return true;
}

// Final block acknowledged.
void WriteTransfer::on_remote_end() {
    succeed();
}

void WriteTransfer::on_local_finish() {
    remote_->end();
}

} // namespace ntftp::session
