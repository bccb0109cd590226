#include "transfer_task.hpp"
#include <iostream>

namespace transfer {

TransferTask::TransferTask(boost::asio::io_context& io_context,
                           TransferContext context,
                           std::shared_ptr<PayloadSink> sink,
                           const TransferOptions& options,
                           bool verbose,
                           FinishedCallback on_finished)
    : id_(context.id),
      strand_(boost::asio::make_strand(io_context)),
      resolver_(strand_),
      socket_(strand_),
      connect_timer_(strand_),
      context_(std::move(context)),
      sink_(std::move(sink)),
      options_(options),
      verbose_(verbose),
      on_finished_(std::move(on_finished)),
      buffer_(options.chunk_size) {}

template <typename Fn>
void TransferTask::notify(const char* event, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        std::cerr << "TransferTask " << id_ << ": observer " << event << " threw: " << e.what() << "\n";
    }
}

void TransferTask::start() {
    boost::asio::post(strand_, [self = shared_from_this()]() {
        self->run();
    });
}

void TransferTask::interrupt() {
    context_.token->cancel();
    boost::asio::post(strand_, [self = shared_from_this()]() {
        if (self->finished_) return;
        self->interrupted_ = true;

        boost::system::error_code ignored;
        self->connect_timer_.cancel();
        self->resolver_.cancel();
        self->socket_.cancel(ignored);
        // A closed socket stops async_connect from trying the next endpoint
        self->socket_.close(ignored);
    });
}

// ─── Connection ─────────────────────────────────────────────────────────────

void TransferTask::run() {
    state_ = TransferState::RUNNING;

    if (context_.token->is_cancelled()) {
        finish_cancelled();
        return;
    }

    if (verbose_) {
        std::cout << "TransferTask " << id_ << ": connecting to "
                  << context_.host << ":" << context_.port << "\n";
    }

    if (options_.connect_timeout.count() > 0) {
        connect_timer_.expires_after(options_.connect_timeout);
        connect_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            self->on_connect_timeout(ec);
        });
    }

    resolver_.async_resolve(
        context_.host, std::to_string(context_.port),
        [self = shared_from_this()](const boost::system::error_code& ec,
                                    tcp::resolver::results_type results) {
            self->on_resolve(ec, std::move(results));
        });
}

void TransferTask::on_resolve(const boost::system::error_code& ec, tcp::resolver::results_type results) {
    if (finished_) return;

    if (ec) {
        on_connect(ec);
        return;
    }

    boost::asio::async_connect(
        socket_, results,
        [self = shared_from_this()](const boost::system::error_code& ec, const tcp::endpoint&) {
            self->on_connect(ec);
        });
}

void TransferTask::on_connect(const boost::system::error_code& ec) {
    if (finished_) return;
    connect_done_ = true;
    connect_timer_.cancel();

    if (ec || timed_out_) {
        if (interrupted_) {
            finish_cancelled();
        } else if (timed_out_) {
            finish_failed(errors::ErrorKind::CONNECT,
                          "timed out after " + std::to_string(options_.connect_timeout.count()) + " ms");
        } else {
            finish_failed(errors::ErrorKind::CONNECT,
                          context_.host + ":" + std::to_string(context_.port) + ": " + ec.message());
        }
        return;
    }

    if (verbose_) {
        std::cout << "TransferTask " << id_ << ": connected, expecting "
                  << context_.expected_size << " bytes\n";
    }
    last_report_time_ = std::chrono::steady_clock::now();
    read_next_chunk();
}

void TransferTask::on_connect_timeout(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || connect_done_ || finished_) {
        return;
    }
    timed_out_ = true;

    // Pending resolve/connect completes with operation_aborted
    boost::system::error_code ignored;
    resolver_.cancel();
    socket_.cancel(ignored);
    socket_.close(ignored);
}

// ─── Streaming ──────────────────────────────────────────────────────────────

void TransferTask::read_next_chunk() {
    if (context_.token->is_cancelled()) {
        finish_cancelled();
        return;
    }

    socket_.async_read_some(
        boost::asio::buffer(buffer_),
        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t bytes_read) {
            self->on_chunk_read(ec, bytes_read);
        });
}

void TransferTask::on_chunk_read(const boost::system::error_code& ec, std::size_t bytes_read) {
    if (finished_) return;

    if (bytes_read > 0) {
        if (sink_) {
            std::string reason = "failed to store payload chunk";
            bool stored = false;
            try {
                stored = sink_->write(buffer_.data(), bytes_read);
            } catch (const std::exception& e) {
                reason = e.what();
            }
            if (!stored) {
                finish_failed(errors::ErrorKind::STREAM, reason);
                return;
            }
        }

        context_.bytes_transferred += bytes_read;
        if (context_.expected_size > 0 && context_.bytes_transferred > context_.expected_size) {
            finish_failed(errors::ErrorKind::STREAM,
                          "received " + std::to_string(context_.bytes_transferred) +
                          " bytes, more than the expected " + std::to_string(context_.expected_size));
            return;
        }
        report_progress(false);
    }

    if (ec == boost::asio::error::eof) {
        if (context_.expected_size == 0 || context_.bytes_transferred == context_.expected_size) {
            finish_completed();
        } else {
            finish_failed(errors::ErrorKind::STREAM,
                          "connection closed after " + std::to_string(context_.bytes_transferred) +
                          " of " + std::to_string(context_.expected_size) + " bytes");
        }
        return;
    }

    if (ec) {
        if (interrupted_) {
            finish_cancelled();
        } else {
            finish_failed(errors::ErrorKind::STREAM, ec.message());
        }
        return;
    }

    read_next_chunk();
}

void TransferTask::report_progress(bool force) {
    if (context_.bytes_transferred == last_reported_) return;

    auto now = std::chrono::steady_clock::now();
    if (!force && options_.progress_interval.count() > 0 &&
        now - last_report_time_ < options_.progress_interval) {
        return;
    }

    last_reported_ = context_.bytes_transferred;
    last_report_time_ = now;
    uint64_t transferred = context_.bytes_transferred;
    uint64_t total = context_.expected_size;
    notify("on_progress", [&]() { context_.observer->on_progress(transferred, total); });
}

// ─── Terminal paths ─────────────────────────────────────────────────────────

void TransferTask::finish_completed() {
    report_progress(true);

    if (sink_) {
        std::string reason = "failed to commit payload";
        bool committed = false;
        try {
            committed = sink_->commit();
        } catch (const std::exception& e) {
            reason = e.what();
        }
        if (!committed) {
            finish_failed(errors::ErrorKind::STREAM, reason);
            return;
        }
    }
    finish(TransferState::COMPLETED, "");
}

void TransferTask::finish_failed(errors::ErrorKind kind, const std::string& reason) {
    finish(TransferState::FAILED, errors::format_message(kind, reason));
}

void TransferTask::finish_cancelled() {
    finish(TransferState::CANCELLED, errors::CANCELLED_MESSAGE);
}

void TransferTask::finish(TransferState state, const std::string& message) {
    if (finished_) return;
    finished_ = true;

    connect_timer_.cancel();
    close_socket();
    if (sink_ && state != TransferState::COMPLETED) {
        try {
            sink_->abort();
        } catch (const std::exception& e) {
            std::cerr << "TransferTask " << id_ << ": sink abort threw: " << e.what() << "\n";
        }
    }
    state_ = state;

    if (state == TransferState::COMPLETED) {
        if (verbose_) {
            std::cout << "TransferTask " << id_ << ": completed (" << context_.bytes_transferred << " bytes)\n";
        }
        notify("on_complete", [&]() { context_.observer->on_complete(); });
    } else {
        if (state == TransferState::FAILED) {
            std::cerr << "TransferTask " << id_ << ": " << message << "\n";
        } else if (verbose_) {
            std::cout << "TransferTask " << id_ << ": cancelled after "
                      << context_.bytes_transferred << " bytes\n";
        }
        notify("on_error", [&]() { context_.observer->on_error(message); });
    }

    context_.observer.reset();
    sink_.reset();

    if (on_finished_) {
        on_finished_(id_, state);
    }
}

void TransferTask::close_socket() {
    boost::system::error_code ignored;
    if (socket_.is_open()) {
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

} // namespace transfer
