#pragma once

#include "transfer.hpp"
#include "errors.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace transfer {

// Everything a task needs to know about its transfer. Owned by the task.
struct TransferContext {
    uint64_t id;
    std::string host;
    int port;
    uint64_t expected_size;
    uint64_t bytes_transferred;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<TransferObserver> observer;
};

// Drives one transfer: resolve, connect, then read chunk by chunk until the
// peer closes. All handlers run on the task's strand, so observer calls for
// one transfer never overlap. The socket is closed on every exit path.
class TransferTask : public std::enable_shared_from_this<TransferTask> {
public:
    using FinishedCallback = std::function<void(uint64_t id, TransferState state)>;

    TransferTask(boost::asio::io_context& io_context,
                 TransferContext context,
                 std::shared_ptr<PayloadSink> sink,
                 const TransferOptions& options,
                 bool verbose,
                 FinishedCallback on_finished);

    void start();

    // Cancels the token and aborts whatever socket operation is pending.
    void interrupt();

    uint64_t id() const { return id_; }
    TransferState state() const { return state_.load(); }

private:
    using tcp = boost::asio::ip::tcp;

    void run();
    void on_resolve(const boost::system::error_code& ec, tcp::resolver::results_type results);
    void on_connect(const boost::system::error_code& ec);
    void on_connect_timeout(const boost::system::error_code& ec);
    void read_next_chunk();
    void on_chunk_read(const boost::system::error_code& ec, std::size_t bytes_read);

    void report_progress(bool force);
    void finish_completed();
    void finish_failed(errors::ErrorKind kind, const std::string& reason);
    void finish_cancelled();
    void finish(TransferState state, const std::string& message);
    void close_socket();

    template <typename Fn>
    void notify(const char* event, Fn&& fn);

    const uint64_t id_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    tcp::socket socket_;
    boost::asio::steady_timer connect_timer_;

    TransferContext context_;
    std::shared_ptr<PayloadSink> sink_;
    TransferOptions options_;
    bool verbose_;
    FinishedCallback on_finished_;
    std::vector<char> buffer_;

    std::atomic<TransferState> state_{TransferState::PENDING};

    // Strand-only state
    bool connect_done_ = false;
    bool timed_out_ = false;
    bool interrupted_ = false;
    bool finished_ = false;
    uint64_t last_reported_ = 0;
    std::chrono::steady_clock::time_point last_report_time_;
};

} // namespace transfer
