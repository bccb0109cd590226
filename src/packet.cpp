#include "protocol/packet.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace protocol {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

int64_t now_millis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

nlohmann::json validated_body(nlohmann::json body) {
    if (body.is_null()) {
        return nlohmann::json::object();
    }
    if (!body.is_object()) {
        throw errors::ValidationError(std::string("Packet body must be a JSON object, got ") + body.type_name());
    }
    return body;
}

void validate_kind(const std::string& kind) {
    if (is_blank(kind)) {
        throw errors::ValidationError("Packet type cannot be empty");
    }
}

} // namespace

Packet::Packet(int64_t id, std::string kind, nlohmann::json body,
               std::optional<PayloadDescriptor> payload)
    : id_(id), kind_(std::move(kind)), body_(std::move(body)), payload_(payload) {}

Packet Packet::create(const std::string& kind, nlohmann::json body) {
    return create_with_id(now_millis(), kind, std::move(body));
}

Packet Packet::create_with_id(int64_t id, const std::string& kind, nlohmann::json body) {
    validate_kind(kind);
    return Packet(id, kind, validated_body(std::move(body)), std::nullopt);
}

std::optional<uint64_t> Packet::payload_size() const {
    if (!payload_) {
        return std::nullopt;
    }
    return payload_->expected_size;
}

bool Packet::has_payload() const {
    return payload_ && payload_->expected_size > 0;
}

std::string Packet::to_string() const {
    std::ostringstream oss;
    oss << "Packet(id=" << id_ << ", kind='" << kind_ << "'";
    if (!body_.empty()) {
        oss << ", body=" << body_.dump();
    }
    if (payload_) {
        oss << ", payloadSize=" << payload_->expected_size;
    }
    oss << ")";
    return oss.str();
}

Packet with_payload_descriptor(const Packet& packet, uint64_t expected_size) {
    return Packet(packet.id_, packet.kind_, packet.body_, PayloadDescriptor{expected_size});
}

Packet with_body(const Packet& packet, nlohmann::json body) {
    return Packet(packet.id_, packet.kind_, validated_body(std::move(body)), packet.payload_);
}

} // namespace protocol
