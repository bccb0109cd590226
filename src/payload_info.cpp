#include "protocol/payload_info.hpp"
#include "errors.hpp"

namespace protocol {

namespace {

constexpr const char* TRANSFER_INFO_KEY = "payloadTransferInfo";

void validate_port(int port) {
    if (port < 1 || port > 65535) {
        throw errors::ValidationError("Invalid payload port: " + std::to_string(port));
    }
}

} // namespace

Packet with_payload_transfer_info(const Packet& packet, int port) {
    validate_port(port);
    nlohmann::json body = packet.body();
    body[TRANSFER_INFO_KEY] = PayloadTransferInfo{port};
    return with_body(packet, std::move(body));
}

std::optional<PayloadRequest> payload_request_from_packet(const Packet& packet,
                                                          const std::string& host) {
    if (!packet.has_payload()) {
        return std::nullopt;
    }

    int port = DEFAULT_PAYLOAD_PORT;
    auto it = packet.body().find(TRANSFER_INFO_KEY);
    if (it != packet.body().end() && it->is_object() && it->contains("port")) {
        try {
            port = it->get<PayloadTransferInfo>().port;
        } catch (const nlohmann::json::exception& e) {
            throw errors::ValidationError(std::string("Malformed payloadTransferInfo: ") + e.what());
        }
        validate_port(port);
    }

    return PayloadRequest{host, port, *packet.payload_size()};
}

} // namespace protocol
