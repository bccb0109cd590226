#include "protocol/packet.hpp"
#include "protocol/payload_info.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

using protocol::Packet;

TEST(PacketTest, CreateKeepsKindAndBody) {
    nlohmann::json body = {{"message", "hello"}, {"count", 3}, {"nested", {{"flag", true}}}};
    Packet packet = Packet::create(protocol::packet_type::PING, body);

    EXPECT_EQ(packet.kind(), "cconnect.ping");
    EXPECT_EQ(packet.body(), body);
    EXPECT_FALSE(packet.payload_descriptor().has_value());
    EXPECT_FALSE(packet.has_payload());
    EXPECT_GT(packet.id(), 0);
}

TEST(PacketTest, EmptyBodyDefaultsToObject) {
    Packet packet = Packet::create("cconnect.battery.request");
    EXPECT_TRUE(packet.body().is_object());
    EXPECT_TRUE(packet.body().empty());

    Packet from_null = Packet::create("cconnect.battery.request", nullptr);
    EXPECT_TRUE(from_null.body().is_object());
}

TEST(PacketTest, RejectsEmptyOrBlankKind) {
    EXPECT_THROW(Packet::create("", nlohmann::json::object()), errors::ValidationError);
    EXPECT_THROW(Packet::create("   ", nlohmann::json::object()), errors::ValidationError);
    EXPECT_THROW(Packet::create("\t\n", nlohmann::json::object()), errors::ValidationError);
}

TEST(PacketTest, RejectsNonObjectBody) {
    EXPECT_THROW(Packet::create("cconnect.ping", nlohmann::json::array({1, 2})), errors::ValidationError);
    EXPECT_THROW(Packet::create("cconnect.ping", "text"), errors::ValidationError);
}

TEST(PacketTest, ValidationErrorCarriesKind) {
    try {
        Packet::create("");
        FAIL() << "expected ValidationError";
    } catch (const errors::TransferError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::VALIDATION);
    }
}

TEST(PacketTest, CreateWithIdUsesGivenId) {
    Packet packet = Packet::create_with_id(42, "cconnect.clipboard", {{"content", "abc"}});
    EXPECT_EQ(packet.id(), 42);
    EXPECT_THROW(Packet::create_with_id(42, " ", {}), errors::ValidationError);
}

TEST(PacketTest, PayloadDescriptorReturnsNewPacket) {
    Packet original = Packet::create(protocol::packet_type::SHARE_REQUEST, {{"filename", "photo.jpg"}});
    Packet annotated = protocol::with_payload_descriptor(original, 1048576);

    EXPECT_FALSE(original.payload_descriptor().has_value());
    ASSERT_TRUE(annotated.payload_size().has_value());
    EXPECT_EQ(*annotated.payload_size(), 1048576u);
    EXPECT_TRUE(annotated.has_payload());
    EXPECT_EQ(annotated.id(), original.id());
    EXPECT_EQ(annotated.kind(), original.kind());
    EXPECT_EQ(annotated.body(), original.body());
}

TEST(PacketTest, ZeroSizedDescriptorIsLegal) {
    Packet packet = protocol::with_payload_descriptor(Packet::create("cconnect.share.request"), 0);
    ASSERT_TRUE(packet.payload_size().has_value());
    EXPECT_EQ(*packet.payload_size(), 0u);
    EXPECT_FALSE(packet.has_payload());
}

TEST(PacketTest, ToStringShowsPayloadSize) {
    Packet packet = protocol::with_payload_descriptor(
        Packet::create_with_id(7, "cconnect.share.request", {{"filename", "a.txt"}}), 12);
    EXPECT_EQ(packet.to_string(),
              "Packet(id=7, kind='cconnect.share.request', body={\"filename\":\"a.txt\"}, payloadSize=12)");

    EXPECT_EQ(Packet::create_with_id(8, "cconnect.ping").to_string(), "Packet(id=8, kind='cconnect.ping')");
}

// ─── payloadTransferInfo ────────────────────────────────────────────────────

TEST(PayloadInfoTest, NoPayloadGivesNoRequest) {
    Packet packet = Packet::create(protocol::packet_type::SHARE_REQUEST, {{"filename", "a"}});
    EXPECT_FALSE(protocol::payload_request_from_packet(packet, "192.168.1.100").has_value());

    Packet empty = protocol::with_payload_descriptor(packet, 0);
    EXPECT_FALSE(protocol::payload_request_from_packet(empty, "192.168.1.100").has_value());
}

TEST(PayloadInfoTest, ReadsPortFromTransferInfo) {
    Packet packet = protocol::with_payload_descriptor(
        Packet::create(protocol::packet_type::SHARE_REQUEST, {{"filename", "photo.jpg"}}), 2048);
    packet = protocol::with_payload_transfer_info(packet, 1740);

    EXPECT_EQ(packet.body()["payloadTransferInfo"]["port"], 1740);
    EXPECT_EQ(packet.body()["filename"], "photo.jpg");

    auto request = protocol::payload_request_from_packet(packet, "192.168.1.100");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->host, "192.168.1.100");
    EXPECT_EQ(request->port, 1740);
    EXPECT_EQ(request->expected_size, 2048u);
}

TEST(PayloadInfoTest, FallsBackToDefaultPort) {
    Packet packet = protocol::with_payload_descriptor(Packet::create(protocol::packet_type::CLIPBOARD), 10);
    auto request = protocol::payload_request_from_packet(packet, "10.0.0.2");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->port, protocol::DEFAULT_PAYLOAD_PORT);

    Packet odd = protocol::with_payload_descriptor(
        Packet::create(protocol::packet_type::CLIPBOARD, {{"payloadTransferInfo", "n/a"}}), 10);
    EXPECT_EQ(protocol::payload_request_from_packet(odd, "10.0.0.2")->port, 1739);
}

TEST(PayloadInfoTest, RejectsInvalidPorts) {
    Packet packet = protocol::with_payload_descriptor(
        Packet::create(protocol::packet_type::SHARE_REQUEST,
                       {{"payloadTransferInfo", {{"port", 70000}}}}), 10);
    EXPECT_THROW(protocol::payload_request_from_packet(packet, "h"), errors::ValidationError);

    Packet malformed = protocol::with_payload_descriptor(
        Packet::create(protocol::packet_type::SHARE_REQUEST,
                       {{"payloadTransferInfo", {{"port", "abc"}}}}), 10);
    EXPECT_THROW(protocol::payload_request_from_packet(malformed, "h"), errors::ValidationError);

    EXPECT_THROW(protocol::with_payload_transfer_info(packet, 0), errors::ValidationError);
}
