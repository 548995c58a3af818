#include "ntftp/events/event_bus.hpp"
#include "ntftp/events/events.hpp"
#include "ntftp/session/transfer.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace ntftp;
using namespace ntftp::session;
using ntftp::test_support::FakeEndpoint;
using ntftp::test_support::FakeFileSystem;
using ntftp::test_support::drain;
using ntftp::test_support::make_bytes;

namespace {

class TransferTest : public ::testing::Test {
protected:
    boost::asio::io_context io;
    events::EventBus bus;
    FakeFileSystem fs{io};
    FakeEndpoint endpoint{io};
    std::vector<TransferResult> results;
    // Stream callbacks hold the transfer weakly; the fixture plays the owner
    std::shared_ptr<Transfer> owner;

    Transfer::CompletionHandler record() {
        return [this](const TransferResult& result) { results.push_back(result); };
    }

    std::shared_ptr<ReadTransfer> start_get(const std::string& remote = "remote.bin",
                                            const std::string& local = "local.bin") {
        auto transfer = std::make_shared<ReadTransfer>(remote, local, fs, endpoint, bus);
        owner = transfer;
        transfer->start(record());
        drain(io);
        return transfer;
    }

    std::shared_ptr<WriteTransfer> start_put(const io::Bytes& content,
                                             const std::string& local = "local.bin",
                                             const std::string& remote = "remote.bin") {
        fs.files[local] = content;
        auto transfer = std::make_shared<WriteTransfer>(local, remote, content.size(), fs, endpoint, bus);
        owner = transfer;
        transfer->start(record());
        return transfer;
    }
};

} // namespace

// ──────────────────────────────────────────────────────────
// Download
// ──────────────────────────────────────────────────────────

TEST_F(TransferTest, GetWritesEveryByteAndSucceeds) {
    auto transfer = start_get();
    ASSERT_TRUE(endpoint.last_get);
    EXPECT_EQ(transfer->state(), TransferState::Active);

    const auto content = make_bytes(10000);
    endpoint.last_get->deliver(io::Bytes(content.begin(), content.begin() + 4000));
    endpoint.last_get->deliver(io::Bytes(content.begin() + 4000, content.end()));
    endpoint.last_get->finish();
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Succeeded);
    EXPECT_TRUE(results[0].message.empty());
    EXPECT_EQ(results[0].bytes, 10000u);
    EXPECT_EQ(fs.files["local.bin"], content);
    EXPECT_TRUE(fs.removed.empty());
    EXPECT_EQ(transfer->state(), TransferState::Done);
}

TEST_F(TransferTest, GetOfEmptyFileCreatesEmptyFile) {
    start_get();
    endpoint.last_get->finish();
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Succeeded);
    ASSERT_TRUE(fs.exists("local.bin"));
    EXPECT_TRUE(fs.files["local.bin"].empty());
}

TEST_F(TransferTest, GetRemoteErrorRemovesPartialFile) {
    start_get();
    endpoint.last_get->deliver(make_bytes(500));
    endpoint.last_get->fail("(Server) Disk full");
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::RemoteFailed);
    EXPECT_EQ(results[0].message, "(Server) Disk full");
    EXPECT_FALSE(fs.exists("local.bin"));
    ASSERT_EQ(fs.removed.size(), 1u);
    EXPECT_EQ(fs.removed[0], "local.bin");
}

TEST_F(TransferTest, GetLocalErrorAbortsRemoteAndRemovesFile) {
    fs.fail_write_after = 100;
    start_get();
    endpoint.last_get->deliver(make_bytes(500));
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::LocalFailed);
    EXPECT_EQ(results[0].message, "Failed to write local file: local.bin");
    EXPECT_TRUE(endpoint.last_get->aborted());
    EXPECT_FALSE(fs.exists("local.bin"));
}

TEST_F(TransferTest, GetLeavesUnopenableDestinationInPlace) {
    const auto existing = make_bytes(64, 3);
    fs.files["local.bin"] = existing;
    fs.open_errors.insert("local.bin");
    start_get();
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::LocalFailed);
    EXPECT_EQ(results[0].message, "Failed to open local file: local.bin");
    EXPECT_TRUE(endpoint.last_get->aborted());
    EXPECT_TRUE(fs.removed.empty());
    EXPECT_EQ(fs.files["local.bin"], existing);
}

TEST_F(TransferTest, GetCancelledAbortsRemoteAndRemovesFile) {
    auto transfer = start_get();
    endpoint.last_get->deliver(make_bytes(500));
    drain(io);

    transfer->abort();
    EXPECT_EQ(transfer->state(), TransferState::Aborting);
    EXPECT_TRUE(results.empty());
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Cancelled);
    EXPECT_TRUE(results[0].message.empty());
    EXPECT_EQ(endpoint.last_get->abort_calls(), 1);
    EXPECT_FALSE(fs.exists("local.bin"));
}

TEST_F(TransferTest, DataArrivingAfterAbortIsNotWritten) {
    auto transfer = start_get();
    endpoint.last_get->deliver(make_bytes(300));
    transfer->abort();
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].bytes, 0u);
}

TEST_F(TransferTest, AbortRacingRemoteErrorCompletesOnce) {
    auto transfer = start_get();
    endpoint.last_get->fail("(Server) Boom");
    transfer->abort();
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Cancelled);
    EXPECT_FALSE(fs.exists("local.bin"));
}

TEST_F(TransferTest, FirstFailureWinsWhenBothSidesFail) {
    fs.fail_write_after = 10;
    start_get();
    // The remote error is queued ahead of the write failure the data triggers
    endpoint.last_get->deliver(make_bytes(100));
    endpoint.last_get->fail("(Server) Late");
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::RemoteFailed);
    EXPECT_EQ(results[0].message, "(Server) Late");
    EXPECT_FALSE(fs.exists("local.bin"));
}

TEST_F(TransferTest, AbortAfterCompletionIsIgnored) {
    auto transfer = start_get();
    endpoint.last_get->finish();
    drain(io);
    ASSERT_EQ(results.size(), 1u);

    transfer->abort();
    drain(io);

    EXPECT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Succeeded);
    EXPECT_TRUE(fs.exists("local.bin"));
}

TEST_F(TransferTest, SecondAbortIsIgnored) {
    auto transfer = start_get();
    transfer->abort();
    transfer->abort();
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(endpoint.last_get->abort_calls(), 1);
}

TEST_F(TransferTest, PublishesLifecycleEvents) {
    int started = 0;
    int completed = 0;
    std::uint64_t progress = 0;
    bus.subscribe<events::TransferStartedEvent>([&](const events::TransferStartedEvent& e) {
        EXPECT_EQ(e.direction, events::Direction::Get);
        ++started;
    });
    bus.subscribe<events::TransferProgressEvent>([&](const events::TransferProgressEvent& e) {
        progress = e.bytes_transferred;
    });
    bus.subscribe<events::TransferCompletedEvent>([&](const events::TransferCompletedEvent& e) {
        EXPECT_EQ(e.bytes, 700u);
        ++completed;
    });

    start_get();
    endpoint.last_get->deliver(make_bytes(700));
    endpoint.last_get->finish();
    drain(io);

    EXPECT_EQ(started, 1);
    EXPECT_EQ(completed, 1);
    EXPECT_EQ(progress, 700u);
}

TEST_F(TransferTest, FailedTransferPublishesFailureOnly) {
    int failed = 0;
    int completed = 0;
    bus.subscribe<events::TransferFailedEvent>([&](const events::TransferFailedEvent& e) {
        EXPECT_EQ(e.error_message, "(Server) Nope");
        ++failed;
    });
    bus.subscribe<events::TransferCompletedEvent>([&](const events::TransferCompletedEvent&) { ++completed; });

    start_get();
    endpoint.last_get->fail("(Server) Nope");
    drain(io);

    EXPECT_EQ(failed, 1);
    EXPECT_EQ(completed, 0);
}

// ──────────────────────────────────────────────────────────
// Upload
// ──────────────────────────────────────────────────────────

TEST_F(TransferTest, PutSendsWholeFileAndSucceeds) {
    const auto content = make_bytes(10000);
    auto transfer = start_put(content);
    drain(io);

    ASSERT_TRUE(endpoint.last_put);
    EXPECT_EQ(endpoint.last_put->declared_size(), 10000u);
    EXPECT_TRUE(endpoint.last_put->ended());
    EXPECT_EQ(endpoint.last_put->received(), content);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Succeeded);
    EXPECT_EQ(results[0].bytes, 10000u);
    EXPECT_EQ(fs.files["local.bin"], content);
}

TEST_F(TransferTest, PutPausesUntilRemoteDrains) {
    endpoint.put_high_water = 2048;
    const auto content = make_bytes(6000);
    start_put(content);
    drain(io);

    auto put = endpoint.last_put;
    EXPECT_EQ(put->received().size(), 2048u);
    EXPECT_TRUE(results.empty());

    for (int i = 0; i < 10 && !put->ended(); ++i) {
        put->drain();
        drain(io);
    }

    EXPECT_EQ(put->received(), content);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Succeeded);
}

TEST_F(TransferTest, PutWaitsForFinalAcknowledgement) {
    const auto content = make_bytes(3000);
    auto transfer = std::make_shared<WriteTransfer>("local.bin", "remote.bin", 3000, fs, endpoint, bus);
    fs.files["local.bin"] = content;
    owner = transfer;
    transfer->start(record());
    endpoint.last_put->complete_on_end = false;
    drain(io);

    EXPECT_TRUE(endpoint.last_put->ended());
    EXPECT_TRUE(results.empty());

    endpoint.last_put->finish();
    drain(io);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Succeeded);
}

TEST_F(TransferTest, PutRemoteErrorLeavesSourceUntouched) {
    endpoint.put_high_water = 1024;
    const auto content = make_bytes(5000);
    start_put(content);
    drain(io);

    endpoint.last_put->fail("(Server) Access violation");
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::RemoteFailed);
    EXPECT_EQ(results[0].message, "(Server) Access violation");
    EXPECT_EQ(fs.files["local.bin"], content);
    EXPECT_TRUE(fs.removed.empty());
}

TEST_F(TransferTest, PutLocalReadErrorAbortsRemote) {
    fs.read_errors.insert("local.bin");
    start_put(make_bytes(100));
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::LocalFailed);
    EXPECT_EQ(results[0].message, "Failed to read local file: local.bin");
    EXPECT_TRUE(endpoint.last_put->aborted());
    EXPECT_TRUE(fs.exists("local.bin"));
}

TEST_F(TransferTest, PutCancelledAbortsRemoteAndKeepsSource) {
    endpoint.put_high_water = 1024;
    const auto content = make_bytes(5000);
    auto transfer = start_put(content);
    drain(io);

    transfer->abort();
    drain(io);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].outcome, TransferOutcome::Cancelled);
    EXPECT_TRUE(endpoint.last_put->aborted());
    EXPECT_FALSE(endpoint.last_put->ended());
    EXPECT_EQ(fs.files["local.bin"], content);
    EXPECT_TRUE(fs.removed.empty());
}

TEST(TransferNames, OutcomeAndStateStrings) {
    EXPECT_STREQ(to_string(TransferOutcome::Cancelled), "Cancelled");
    EXPECT_STREQ(to_string(TransferState::CleaningUp), "CleaningUp");
}
