#include "transfer.hpp"
#include "transfer_task.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace transfer {

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::PENDING:   return "pending";
        case TransferState::RUNNING:   return "running";
        case TransferState::COMPLETED: return "completed";
        case TransferState::FAILED:    return "failed";
        case TransferState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(TransferState state) {
    return state == TransferState::COMPLETED ||
           state == TransferState::FAILED ||
           state == TransferState::CANCELLED;
}

// ─── Callback observer ──────────────────────────────────────────────────────

namespace {

class CallbackObserver : public TransferObserver {
public:
    explicit CallbackObserver(TransferCallbacks callbacks)
        : callbacks_(std::move(callbacks)) {}

    void on_progress(uint64_t bytes_transferred, uint64_t total_bytes) override {
        if (callbacks_.on_progress) callbacks_.on_progress(bytes_transferred, total_bytes);
    }

    void on_complete() override {
        if (callbacks_.on_complete) callbacks_.on_complete();
    }

    void on_error(const std::string& message) override {
        if (callbacks_.on_error) callbacks_.on_error(message);
    }

private:
    TransferCallbacks callbacks_;
};

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::shared_ptr<TransferObserver> make_observer(TransferCallbacks callbacks) {
    return std::make_shared<CallbackObserver>(std::move(callbacks));
}

// ─── TransferEngine ─────────────────────────────────────────────────────────

TransferEngine::TransferEngine(EngineConfig config)
    : config_(std::move(config)),
      work_guard_(boost::asio::make_work_guard(io_context_)) {
    std::size_t threads = std::max<std::size_t>(1, config_.worker_threads);
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() { run_worker(); });
    }
}

TransferEngine::~TransferEngine() {
    shutdown();
}

uint64_t TransferEngine::next_transfer_id() {
    static std::atomic<uint64_t> next_id{1};
    return next_id.fetch_add(1);
}

TransferHandle TransferEngine::start_transfer(const std::string& host, int port, uint64_t expected_size,
                                              std::shared_ptr<TransferObserver> observer,
                                              std::shared_ptr<PayloadSink> sink) {
    return start_transfer(host, port, expected_size, std::move(observer), std::move(sink), config_.defaults);
}

TransferHandle TransferEngine::start_transfer(const protocol::PayloadRequest& request,
                                              std::shared_ptr<TransferObserver> observer,
                                              std::shared_ptr<PayloadSink> sink) {
    return start_transfer(request.host, request.port, request.expected_size,
                          std::move(observer), std::move(sink), config_.defaults);
}

TransferHandle TransferEngine::start_transfer(const std::string& host, int port, uint64_t expected_size,
                                              std::shared_ptr<TransferObserver> observer,
                                              std::shared_ptr<PayloadSink> sink,
                                              const TransferOptions& options) {
    if (is_blank(host)) {
        throw errors::ValidationError("Host cannot be empty");
    }
    if (port < 1 || port > 65535) {
        throw errors::ValidationError("Invalid port: " + std::to_string(port));
    }
    if (!observer) {
        throw errors::ValidationError("Transfer observer is required");
    }
    if (options.chunk_size == 0) {
        throw errors::ValidationError("Chunk size must be greater than zero");
    }

    uint64_t id = next_transfer_id();
    auto token = std::make_shared<CancellationToken>();
    TransferContext context{id, host, port, expected_size, 0, token, std::move(observer)};

    auto task = std::make_shared<TransferTask>(
        io_context_, std::move(context), std::move(sink), options, config_.verbose,
        [this](uint64_t finished_id, TransferState) { on_task_finished(finished_id); });

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (stopped_) {
            throw std::logic_error("TransferEngine has been shut down");
        }
        registry_[id] = task;
    }

    if (config_.verbose) {
        std::cout << "TransferEngine: started transfer " << id << " from "
                  << host << ":" << port << " (" << expected_size << " bytes)\n";
    }
    task->start();
    return TransferHandle(id, token);
}

std::size_t TransferEngine::active_transfers() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_.size();
}

void TransferEngine::shutdown() {
    std::vector<std::shared_ptr<TransferTask>> live;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        stopped_ = true;
        for (auto& entry : registry_) {
            if (auto task = entry.second.lock()) {
                live.push_back(std::move(task));
            }
        }
    }

    for (auto& task : live) {
        task->interrupt();
    }
    live.clear();

    work_guard_.reset();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void TransferEngine::run_worker() {
    // run() may be re-entered after a handler throws
    for (;;) {
        try {
            io_context_.run();
            return;
        } catch (std::exception& e) {
            std::cerr << "TransferEngine worker exception: " << e.what() << "\n";
        }
    }
}

void TransferEngine::on_task_finished(uint64_t id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    registry_.erase(id);
}

} // namespace transfer
