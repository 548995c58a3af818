#pragma once

#include "ntftp/events/event_bus.hpp"
#include "ntftp/events/events.hpp"
#include "ntftp/remote/endpoint.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace ntftp::session {

enum class TransferState {
    Opening,
    Active,
    Aborting,
    CleaningUp,
    Done
};

enum class TransferOutcome {
    Succeeded,
    LocalFailed,
    RemoteFailed,
    Cancelled
};

const char* to_string(TransferState state);
const char* to_string(TransferOutcome outcome);

/**
 * @brief One thing that happened to a transfer
 *
 * Stream callbacks and the session loop only ever talk to a transfer by
 * raising one of these.
 */
struct TransferEvent {
    enum class Kind {
        LocalError,
        LocalFinished,
        RemoteError,
        RemoteEnded,
        AbortRequested,
        CleanupFinished
    };

    Kind kind;
    std::string message;  ///< Set for LocalError / RemoteError
};

struct TransferResult {
    TransferOutcome outcome = TransferOutcome::Succeeded;
    std::string message;  ///< Empty unless outcome is LocalFailed or RemoteFailed
    std::uint64_t bytes = 0;
};

/**
 * @brief State machine linking one local stream to one remote stream
 *
 * Opening -> Active -> (Done | Aborting -> CleaningUp -> Done)
 *
 * Every stream callback is turned into a TransferEvent and fed to
 * handle(), which runs one transition at a time. Events raised while a
 * transition is running are queued behind it, so the firing order of the
 * collaborators never interleaves two transitions.
 *
 * Aborting waits until both sides have stopped: the remote stream has
 * ended or failed, and the local stream has finished, failed or been
 * closed. CleaningUp then runs the direction's cleanup. The completion
 * handler runs exactly once, when Done is entered.
 *
 * Subclasses provide the direction: which side is the source, how each
 * side is stopped, and what cleanup means.
 */
class Transfer : public std::enable_shared_from_this<Transfer> {
public:
    using CompletionHandler = std::function<void(const TransferResult&)>;

    virtual ~Transfer() = default;

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    // Opens and links both streams. Must be owned by a shared_ptr.
    void start(CompletionHandler on_complete);

    // User cancellation. Ignored once the transfer is already winding down.
    void abort();

    void handle(TransferEvent event);

    [[nodiscard]] TransferState state() const noexcept { return state_; }
    [[nodiscard]] events::Direction direction() const noexcept { return direction_; }
    [[nodiscard]] const std::string& remote_path() const noexcept { return remote_path_; }
    [[nodiscard]] const std::string& local_path() const noexcept { return local_path_; }
    [[nodiscard]] std::uint64_t bytes_transferred() const noexcept { return bytes_; }

protected:
    Transfer(events::Direction direction,
             std::string remote_path,
             std::string local_path,
             events::EventBus& bus);

    virtual void open_streams() = 0;
    virtual void abort_remote() = 0;

    // Returns true when the local side is stopped on return; otherwise a
    // LocalFinished or LocalError event follows.
    virtual bool stop_local() = 0;

    // Returns true when there is nothing asynchronous to wait for;
    // otherwise a CleanupFinished event follows.
    virtual bool begin_cleanup() = 0;

    // The two normal-completion edges while Active.
    virtual void on_remote_end() = 0;
    virtual void on_local_finish() = 0;

    void succeed();
    void stop_local_once();

    [[nodiscard]] bool forwarding() const noexcept { return state_ == TransferState::Active; }
    void count_bytes(std::uint64_t n) noexcept { bytes_ += n; }

    std::function<void()> raise(TransferEvent::Kind kind);
    std::function<void(const std::string&)> raise_with_message(TransferEvent::Kind kind);
    std::function<void(const remote::TransferProgress&)> publish_progress();

private:
    void run_queue();
    void transition(const TransferEvent& event);
    void fail(TransferOutcome cause, std::string message);
    void settle();
    void complete(TransferOutcome outcome);

    events::Direction direction_;
    std::string remote_path_;
    std::string local_path_;
    events::EventBus& bus_;

    TransferState state_ = TransferState::Opening;
    TransferOutcome cause_ = TransferOutcome::Succeeded;
    std::string message_;
    bool local_stopping_ = false;
    bool local_stopped_ = false;
    bool remote_stopped_ = false;
    std::uint64_t bytes_ = 0;

    std::deque<TransferEvent> queue_;
    bool dispatching_ = false;
    CompletionHandler on_complete_;
    std::chrono::steady_clock::time_point started_at_{};
};

/**
 * @brief Download: remote get stream piped into a local write stream
 *
 * Every non-success outcome removes the partial destination file.
 */
class ReadTransfer : public Transfer {
public:
    ReadTransfer(std::string remote_path,
                 std::string local_path,
                 io::FileSystem& file_system,
                 remote::RemoteEndpoint& endpoint,
                 events::EventBus& bus);

private:
    void open_streams() override;
    void abort_remote() override;
    bool stop_local() override;
    bool begin_cleanup() override;
    void on_remote_end() override;
    void on_local_finish() override;

    void forward(io::Bytes chunk);

    io::FileSystem& file_system_;
    remote::RemoteEndpoint& endpoint_;
    std::shared_ptr<io::LocalWriteStream> local_;
    std::shared_ptr<remote::GetStream> remote_;
};

/**
 * @brief Upload: local read stream piped into a remote put stream
 *
 * The local source is never modified. Aborting the remote stream is the
 * only cleanup.
 */
class WriteTransfer : public Transfer {
public:
    WriteTransfer(std::string local_path,
                  std::string remote_path,
                  std::uint64_t size,
                  io::FileSystem& file_system,
                  remote::RemoteEndpoint& endpoint,
                  events::EventBus& bus);

private:
    void open_streams() override;
    void abort_remote() override;
    bool stop_local() override;
    bool begin_cleanup() override;
    void on_remote_end() override;
    void on_local_finish() override;

    void forward(io::Bytes chunk);

    std::uint64_t size_;
    io::FileSystem& file_system_;
    remote::RemoteEndpoint& endpoint_;
    std::shared_ptr<io::LocalReadStream> local_;
    std::shared_ptr<remote::PutStream> remote_;
};

} // namespace ntftp::session
