#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "protocol/packet.hpp"

namespace protocol {

constexpr uint16_t DEFAULT_PAYLOAD_PORT = 1739;

// Body entry "payloadTransferInfo" advertising the rendezvous port
struct PayloadTransferInfo {
    int port;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PayloadTransferInfo, port)

// Resolved rendezvous triple consumed by the transfer engine
struct PayloadRequest {
    std::string host;
    int port;
    uint64_t expected_size;
};

// Returns a copy of packet whose body carries payloadTransferInfo.port.
Packet with_payload_transfer_info(const Packet& packet, int port);

// Returns std::nullopt when the packet carries no payload. The port comes
// from payloadTransferInfo, or DEFAULT_PAYLOAD_PORT when that entry is
// missing. Throws errors::ValidationError for an out-of-range port.
std::optional<PayloadRequest> payload_request_from_packet(const Packet& packet,
                                                          const std::string& host);

} // namespace protocol
