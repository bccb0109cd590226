#include "transfer_task.hpp"
#include "networking.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using test_support::RecordingObserver;

namespace {

struct FinishedRecord {
    int calls = 0;
    uint64_t id = 0;
    transfer::TransferState state = transfer::TransferState::PENDING;
};

std::shared_ptr<transfer::TransferTask> make_task(boost::asio::io_context& io_context,
                                                  uint64_t id, int port, uint64_t expected_size,
                                                  std::shared_ptr<RecordingObserver> observer,
                                                  std::shared_ptr<transfer::CancellationToken> token,
                                                  FinishedRecord& record) {
    transfer::TransferContext context{id, "127.0.0.1", port, expected_size, 0, std::move(token), std::move(observer)};
    return std::make_shared<transfer::TransferTask>(
        io_context, std::move(context), nullptr, transfer::TransferOptions(), false,
        [&record](uint64_t finished_id, transfer::TransferState state) {
            record.calls++;
            record.id = finished_id;
            record.state = state;
        });
}

} // namespace

TEST(TransferTaskTest, FailedConnectReachesFailedState) {
    boost::asio::io_context io_context;
    auto observer = std::make_shared<RecordingObserver>();
    FinishedRecord record;
    auto task = make_task(io_context, 900, test_support::unused_port(), 10, observer,
                          std::make_shared<transfer::CancellationToken>(), record);

    EXPECT_EQ(task->state(), transfer::TransferState::PENDING);
    EXPECT_EQ(task->id(), 900u);

    task->start();
    io_context.run();

    EXPECT_EQ(task->state(), transfer::TransferState::FAILED);
    EXPECT_TRUE(transfer::is_terminal(task->state()));
    EXPECT_EQ(record.calls, 1);
    EXPECT_EQ(record.id, 900u);
    EXPECT_EQ(record.state, transfer::TransferState::FAILED);
    EXPECT_EQ(observer->errors().size(), 1u);
}

TEST(TransferTaskTest, PreCancelledTokenNeverConnects) {
    networking::PayloadServer server;
    server.serve("payload");

    boost::asio::io_context io_context;
    auto observer = std::make_shared<RecordingObserver>();
    auto token = std::make_shared<transfer::CancellationToken>();
    token->cancel();
    FinishedRecord record;
    auto task = make_task(io_context, 901, server.port(), 7, observer, token, record);

    task->start();
    io_context.run();

    EXPECT_EQ(task->state(), transfer::TransferState::CANCELLED);
    EXPECT_EQ(record.state, transfer::TransferState::CANCELLED);
    ASSERT_EQ(observer->errors().size(), 1u);
    EXPECT_EQ(observer->errors()[0], errors::CANCELLED_MESSAGE);
    EXPECT_TRUE(observer->progress().empty());
    server.stop();
}

TEST(TransferTaskTest, CompletedTaskReleasesObserver) {
    networking::PayloadServer server;
    server.serve(test_support::make_payload(12000));

    boost::asio::io_context io_context;
    auto observer = std::make_shared<RecordingObserver>();
    FinishedRecord record;
    auto task = make_task(io_context, 902, server.port(), 12000, observer,
                          std::make_shared<transfer::CancellationToken>(), record);

    EXPECT_EQ(observer.use_count(), 2);
    task->start();
    io_context.run();

    EXPECT_EQ(task->state(), transfer::TransferState::COMPLETED);
    EXPECT_EQ(observer->complete_calls(), 1);
    EXPECT_EQ(observer.use_count(), 1);
    EXPECT_TRUE(server.wait());
}

TEST(TransferTaskTest, InterruptAbandonsPendingConnect) {
    boost::asio::io_context io_context;
    auto observer = std::make_shared<RecordingObserver>();
    auto token = std::make_shared<transfer::CancellationToken>();
    FinishedRecord record;

    // Non-routable address: the connect attempt stays pending until interrupted
    transfer::TransferContext context{903, "10.255.255.1", 1739, 10, 0, token, observer};
    auto task = std::make_shared<transfer::TransferTask>(
        io_context, std::move(context), nullptr, transfer::TransferOptions(), false,
        [&record](uint64_t, transfer::TransferState state) {
            record.calls++;
            record.state = state;
        });

    task->start();
    std::thread worker([&io_context]() { io_context.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    task->interrupt();

    ASSERT_TRUE(observer->wait_for_terminal(std::chrono::seconds(2)));
    worker.join();

    EXPECT_TRUE(token->is_cancelled());
    EXPECT_EQ(record.calls, 1);
    if (task->state() == transfer::TransferState::CANCELLED) {
        ASSERT_EQ(observer->errors().size(), 1u);
        EXPECT_EQ(observer->errors()[0], errors::CANCELLED_MESSAGE);
    } else {
        // No route to the address at all: the connect failed before the interrupt
        EXPECT_EQ(task->state(), transfer::TransferState::FAILED);
    }
}

TEST(TransferStateTest, OnlyFinalStatesAreTerminal) {
    EXPECT_FALSE(transfer::is_terminal(transfer::TransferState::PENDING));
    EXPECT_FALSE(transfer::is_terminal(transfer::TransferState::RUNNING));
    EXPECT_TRUE(transfer::is_terminal(transfer::TransferState::COMPLETED));
    EXPECT_TRUE(transfer::is_terminal(transfer::TransferState::FAILED));
    EXPECT_TRUE(transfer::is_terminal(transfer::TransferState::CANCELLED));
    EXPECT_STREQ(transfer::to_string(transfer::TransferState::CANCELLED), "cancelled");
}

TEST(CancellationTokenTest, FlipsOnce) {
    auto token = std::make_shared<transfer::CancellationToken>();
    transfer::TransferHandle handle(5, token);

    EXPECT_EQ(handle.get_id(), 5u);
    EXPECT_FALSE(handle.is_cancelled());
    EXPECT_TRUE(handle.cancel());
    EXPECT_TRUE(token->is_cancelled());
    EXPECT_FALSE(handle.cancel());
    EXPECT_TRUE(handle.is_cancelled());
}

TEST(ErrorsTest, FormatsObserverMessages) {
    EXPECT_EQ(errors::format_message(errors::ErrorKind::CONNECT, "Connection refused"),
              "connect failed: Connection refused");
    EXPECT_EQ(errors::format_message(errors::ErrorKind::STREAM, ""), "stream error");
    EXPECT_EQ(errors::format_message(errors::ErrorKind::CANCELLED, "ignored"), "cancelled");
    EXPECT_TRUE(errors::is_cancellation("cancelled"));
    EXPECT_FALSE(errors::is_cancellation("stream error: cancelled"));
}
