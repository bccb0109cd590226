#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace protocol {

namespace packet_type {
constexpr const char* IDENTITY = "cconnect.identity";
constexpr const char* PAIR = "cconnect.pair";
constexpr const char* PING = "cconnect.ping";
constexpr const char* BATTERY = "cconnect.battery";
constexpr const char* CLIPBOARD = "cconnect.clipboard";
constexpr const char* CLIPBOARD_CONNECT = "cconnect.clipboard.connect";
constexpr const char* SHARE_REQUEST = "cconnect.share.request";
constexpr const char* SHARE_REQUEST_UPDATE = "cconnect.share.request.update";
} // namespace packet_type

struct PayloadDescriptor {
    uint64_t expected_size;
};

// Immutable control message envelope. Copies are cheap enough for the
// message sizes involved; every "modification" returns a new Packet.
class Packet {
public:
    // Throws errors::ValidationError when kind is empty or whitespace-only,
    // or when body is neither an object nor null.
    static Packet create(const std::string& kind,
                         nlohmann::json body = nlohmann::json::object());
    static Packet create_with_id(int64_t id, const std::string& kind,
                                 nlohmann::json body = nlohmann::json::object());

    int64_t id() const { return id_; }
    const std::string& kind() const { return kind_; }
    const nlohmann::json& body() const { return body_; }
    const std::optional<PayloadDescriptor>& payload_descriptor() const { return payload_; }

    std::optional<uint64_t> payload_size() const;
    bool has_payload() const;

    // Debug rendering only, not a wire format
    std::string to_string() const;

private:
    Packet(int64_t id, std::string kind, nlohmann::json body,
           std::optional<PayloadDescriptor> payload);

    friend Packet with_payload_descriptor(const Packet& packet, uint64_t expected_size);
    friend Packet with_body(const Packet& packet, nlohmann::json body);

    int64_t id_;
    std::string kind_;
    nlohmann::json body_;
    std::optional<PayloadDescriptor> payload_;
};

// Returns a copy annotated with the size of the accompanying payload.
// expected_size 0 is legal and means "no payload" or "empty payload".
Packet with_payload_descriptor(const Packet& packet, uint64_t expected_size);

// Returns a copy with the body replaced; id, kind and descriptor are kept.
Packet with_body(const Packet& packet, nlohmann::json body);

} // namespace protocol
