#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <istream>
#include <memory>
#include <thread>
#include <atomic>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "protocol/packet.hpp"

namespace networking {

constexpr std::size_t SERVER_CHUNK_SIZE = 64 * 1024;

struct ServerOptions {
    std::size_t chunk_size = SERVER_CHUNK_SIZE;
    // Pause between chunks; zero streams as fast as the socket allows.
    std::chrono::milliseconds chunk_delay{0};
    bool verbose = false;
};

std::string format_size(uint64_t bytes);

// Sending side of a payload transfer. Listens on a rendezvous port, accepts
// one connection, streams the payload and closes the connection.
class PayloadServer {
public:
    // Port 0 picks an ephemeral port. Throws boost::system::system_error when
    // the port cannot be bound.
    explicit PayloadServer(unsigned short port = 0, ServerOptions options = ServerOptions());
    ~PayloadServer();

    PayloadServer(const PayloadServer&) = delete;
    PayloadServer& operator=(const PayloadServer&) = delete;

    unsigned short port() const { return port_; }
    uint64_t payload_size() const { return payload_size_; }

    // Start serving in the background; both return immediately. Throws
    // std::logic_error when already serving; serve_file throws
    // std::runtime_error when the file cannot be opened.
    void serve(std::string data);
    void serve_file(const std::string& filepath);

    // Blocks until the serving thread ends. True when every byte was sent.
    bool wait();

    // Abandons a pending accept or a pending chunk write, even when the peer
    // has stopped reading.
    void stop();

    bool is_running() const { return running_; }

    // Control packet advertising this payload: descriptor plus
    // payloadTransferInfo.port.
    protocol::Packet describe(const std::string& kind,
                              nlohmann::json body = nlohmann::json::object()) const;

private:
    void start_serving(std::unique_ptr<std::istream> source, uint64_t size, const std::string& name);
    void run(std::unique_ptr<std::istream> source, std::string name);
    bool accept_connection(boost::asio::ip::tcp::socket& socket);
    bool stream_payload(boost::asio::ip::tcp::socket& socket, std::istream& source);
    bool write_chunk(boost::asio::ip::tcp::socket& socket, const char* data, std::size_t size);

    ServerOptions options_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    uint64_t payload_size_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> completed_{false};
    std::thread thread_;
};

} // namespace networking
