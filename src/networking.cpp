#include "networking.hpp"
#include "protocol/payload_info.hpp"
#include <iomanip>
#include <iterator>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <stdexcept>
#include <vector>

using boost::asio::ip::tcp;

namespace networking {

std::string format_size(uint64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    for (; size >= 1024 && unit + 1 < std::size(units); ++unit) {
        size /= 1024;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << size << units[unit];
    return out.str();
}

PayloadServer::PayloadServer(unsigned short port, ServerOptions options)
    : options_(options), acceptor_(io_context_) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = SERVER_CHUNK_SIZE;
    }
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
}

PayloadServer::~PayloadServer() {
    stop();
}

void PayloadServer::serve(std::string data) {
    uint64_t size = data.size();
    start_serving(std::make_unique<std::istringstream>(std::move(data)), size, "buffer");
}

void PayloadServer::serve_file(const std::string& filepath) {
    std::error_code ec;
    auto fsize = std::filesystem::file_size(filepath, ec);
    if (ec) {
        throw std::runtime_error("File not found: " + filepath);
    }

    auto file = std::make_unique<std::ifstream>(filepath, std::ios::binary);
    if (!file->is_open()) {
        throw std::runtime_error("Could not open file for reading: " + filepath);
    }
    start_serving(std::move(file), fsize, std::filesystem::path(filepath).filename().string());
}

void PayloadServer::start_serving(std::unique_ptr<std::istream> source, uint64_t size, const std::string& name) {
    if (running_ || thread_.joinable()) {
        throw std::logic_error("PayloadServer is already serving");
    }
    payload_size_ = size;
    completed_ = false;
    running_ = true;
    thread_ = std::thread([this, src = std::move(source), name]() mutable {
        run(std::move(src), name);
    });
}

bool PayloadServer::wait() {
    if (thread_.joinable()) {
        thread_.join();
    }
    return completed_;
}

void PayloadServer::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

protocol::Packet PayloadServer::describe(const std::string& kind, nlohmann::json body) const {
    protocol::Packet packet = protocol::Packet::create(kind, std::move(body));
    packet = protocol::with_payload_descriptor(packet, payload_size_);
    return protocol::with_payload_transfer_info(packet, port_);
}

// ─── Serving thread ─────────────────────────────────────────────────────────

void PayloadServer::run(std::unique_ptr<std::istream> source, std::string name) {
    try {
        tcp::socket socket(io_context_);
        if (accept_connection(socket)) {
            completed_ = stream_payload(socket, *source);
            if (completed_ && options_.verbose) {
                std::cout << "PayloadServer: sent " << name << " (" << format_size(payload_size_)
                          << ") on port " << port_ << "\n";
            } else if (!completed_) {
                std::cerr << "PayloadServer: transfer of " << name << " (" << format_size(payload_size_)
                          << ") on port " << port_ << " aborted\n";
            }

            boost::system::error_code ignored;
            socket.shutdown(tcp::socket::shutdown_both, ignored);
            socket.close(ignored);
        }
    } catch (std::exception& e) {
        std::cerr << "PayloadServer Exception: " << e.what() << "\n";
    }
    running_ = false;
}

bool PayloadServer::accept_connection(tcp::socket& socket) {
    bool done = false;
    boost::system::error_code accept_ec;

    io_context_.restart();
    acceptor_.async_accept(socket, [&done, &accept_ec](const boost::system::error_code& ec) {
        accept_ec = ec;
        done = true;
    });

    // Poll until connected or stopped
    while (!done) {
        io_context_.poll();
        io_context_.restart();
        if (done) break;
        if (!running_) {
            acceptor_.cancel();
            io_context_.run();
            io_context_.restart();
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (accept_ec) {
        std::cerr << "PayloadServer: accept failed: " << accept_ec.message() << "\n";
        return false;
    }
    return true;
}

bool PayloadServer::stream_payload(tcp::socket& socket, std::istream& source) {
    try {
        std::vector<char> buffer(options_.chunk_size);
        while (source.read(buffer.data(), buffer.size()) || source.gcount() > 0) {
            if (!running_) {
                return false;
            }
            std::streamsize bytes_read = source.gcount();
            if (!write_chunk(socket, buffer.data(), static_cast<std::size_t>(bytes_read))) {
                return false;
            }

            if (options_.chunk_delay.count() > 0) {
                std::this_thread::sleep_for(options_.chunk_delay);
            }
        }
        return true;
    } catch (std::exception& e) {
        std::cerr << "PayloadServer Exception (stream): " << e.what() << "\n";
        return false;
    }
}

bool PayloadServer::write_chunk(tcp::socket& socket, const char* data, std::size_t size) {
    bool done = false;
    boost::system::error_code write_ec;

    io_context_.restart();
    boost::asio::async_write(socket, boost::asio::buffer(data, size),
                             [&done, &write_ec](const boost::system::error_code& ec, std::size_t) {
                                 write_ec = ec;
                                 done = true;
                             });

    // A peer that stops reading must not keep stop() waiting
    while (!done) {
        io_context_.run_for(std::chrono::milliseconds(20));
        io_context_.restart();
        if (done) break;
        if (!running_) {
            boost::system::error_code ignored;
            socket.cancel(ignored);
            io_context_.run();
            io_context_.restart();
            return false;
        }
    }

    if (write_ec) {
        std::cerr << "PayloadServer: write failed: " << write_ec.message() << "\n";
        return false;
    }
    return true;
}

} // namespace networking
