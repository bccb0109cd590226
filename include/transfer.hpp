#pragma once

#include <string>
#include <functional>
#include <boost/asio.hpp>
#include "payload_sink.hpp"
#include "protocol/payload_info.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace transfer {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 8 * 1024;

enum class TransferState {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* to_string(TransferState state);
bool is_terminal(TransferState state);

// Receives the events of a transfer. Calls may arrive on an engine worker
// thread. For one transfer they are ordered: on_progress zero or more times,
// then exactly one of on_complete or on_error. An observer shared between
// transfers must tolerate concurrent calls.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void on_progress(uint64_t bytes_transferred, uint64_t total_bytes) = 0;
    virtual void on_complete() = 0;
    virtual void on_error(const std::string& message) = 0;
};

struct TransferCallbacks {
    std::function<void(uint64_t, uint64_t)> on_progress;
    std::function<void()> on_complete;
    std::function<void(const std::string&)> on_error;
};

// Adapts a set of std::function callbacks; empty callbacks are skipped.
std::shared_ptr<TransferObserver> make_observer(TransferCallbacks callbacks);

// Write-once-intent flag shared by a handle and its task.
class CancellationToken {
public:
    // Returns true only for the call that flipped the flag.
    bool cancel() { return !cancelled_.exchange(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Caller-side view of a running transfer. Holds no reference to the
// connection or the observer; dropping it does not affect the transfer.
class TransferHandle {
public:
    TransferHandle(uint64_t id, std::shared_ptr<CancellationToken> token)
        : id_(id), token_(std::move(token)) {}

    uint64_t get_id() const { return id_; }

    // Requests cooperative cancellation. The task notices it before its next
    // chunk read, so at most one more chunk may be reported.
    bool cancel() { return token_->cancel(); }
    bool is_cancelled() const { return token_->is_cancelled(); }

private:
    uint64_t id_;
    std::shared_ptr<CancellationToken> token_;
};

struct TransferOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    // Zero means no timeout.
    std::chrono::milliseconds connect_timeout{0};
    // Zero reports every chunk; otherwise progress is batched to at most one
    // call per interval, flushed before completion.
    std::chrono::milliseconds progress_interval{0};
};

struct EngineConfig {
    std::size_t worker_threads = 2;
    bool verbose = false;
    TransferOptions defaults;
};

class TransferTask;

class TransferEngine {
public:
    explicit TransferEngine(EngineConfig config = EngineConfig());
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Spawns a transfer and returns without waiting for the connection.
    // Throws errors::ValidationError for an empty host, a port outside
    // 1..65535, a null observer or a zero chunk size; no task is spawned then.
    // Throws std::logic_error once the engine has been shut down.
    TransferHandle start_transfer(const std::string& host, int port, uint64_t expected_size,
                                  std::shared_ptr<TransferObserver> observer,
                                  std::shared_ptr<PayloadSink> sink = nullptr);
    TransferHandle start_transfer(const std::string& host, int port, uint64_t expected_size,
                                  std::shared_ptr<TransferObserver> observer,
                                  std::shared_ptr<PayloadSink> sink,
                                  const TransferOptions& options);
    TransferHandle start_transfer(const protocol::PayloadRequest& request,
                                  std::shared_ptr<TransferObserver> observer,
                                  std::shared_ptr<PayloadSink> sink = nullptr);

    std::size_t active_transfers() const;

    // Cancels every live transfer, interrupts its pending socket operation
    // and joins the worker threads. Each live transfer still receives its
    // terminal on_error. Must not be called from an observer callback.
    void shutdown();

private:
    void run_worker();
    void on_task_finished(uint64_t id);

    static uint64_t next_transfer_id();

    EngineConfig config_;
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> workers_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<uint64_t, std::weak_ptr<TransferTask>> registry_;
    bool stopped_ = false;
};

} // namespace transfer
