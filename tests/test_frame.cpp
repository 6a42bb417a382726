#include <doctest/doctest.h>
#include "zmesh/frame.hpp"

#include <vector>

using namespace zmesh;

TEST_CASE("encode: node, length, class, command, payload in wire order") {
    Frame f;
    const uint8_t level = 0x32;
    REQUIRE(encode_frame(Address(5), 0x26, 0x01, &level, 1, f) == FrameStatus::Ok);

    CHECK(f.to_vector() == std::vector<uint8_t>{0x05, 0x03, 0x26, 0x01, 0x32});
    CHECK(f.node_id() == 5);
    CHECK(f.length() == 3);
    CHECK(f.command_class() == 0x26);
    CHECK(f.command() == 0x01);
    CHECK(f.payload_size() == 1);
    CHECK(f.payload()[0] == 0x32);
}

TEST_CASE("encode: empty payload gives length 2") {
    Frame f;
    REQUIRE(encode_frame(Address(7), 0x26, 0x02, nullptr, 0, f) == FrameStatus::Ok);
    CHECK(f.to_vector() == std::vector<uint8_t>{0x07, 0x02, 0x26, 0x02});
    CHECK(f.payload_size() == 0);
    CHECK(f.payload() == nullptr);
}

TEST_CASE("encode: payload limit is 251 bytes") {
    std::vector<uint8_t> p(FRAME_PAYLOAD_MAX, 0xAA);
    Frame f;
    REQUIRE(encode_frame(Address(1), 0x26, 0x01, p.data(), p.size(), f) == FrameStatus::Ok);
    CHECK(f.bytes().size() == FRAME_MAX);
    CHECK(f.length() == 253);

    p.push_back(0xBB);
    CHECK(encode_frame(Address(1), 0x26, 0x01, p.data(), p.size(), f) == FrameStatus::Overflow);
    CHECK(f.empty());
}

TEST_CASE("encode: endpoint travels as metadata only") {
    Frame f;
    REQUIRE(encode_frame(Address(5, uint8_t(2)), 0x26, 0x02, nullptr, 0, f) == FrameStatus::Ok);
    CHECK(f.endpoint() == Endpoint(uint8_t(2)));
    CHECK(f.to_vector() == std::vector<uint8_t>{0x05, 0x02, 0x26, 0x02});
}

TEST_CASE("decode: report frame") {
    const uint8_t rx[] = {0x05, 0x03, 0x26, 0x03, 0x63};
    Frame f;
    REQUIRE(decode_frame(rx, sizeof(rx), kRootEndpoint, f) == FrameStatus::Ok);
    CHECK(f.node_id() == 5);
    CHECK(f.command_class() == 0x26);
    CHECK(f.command() == 0x03);
    uint8_t v = 0;
    REQUIRE(f.byte_at(FRAME_PAYLOAD_OFFSET, v));
    CHECK(v == 0x63);
    CHECK(f.transport().message_class == MessageClass::ApplicationCommandHandler);
    CHECK(f.endpoint() == kRootEndpoint);
}

TEST_CASE("decode: fewer than four bytes is too short") {
    const uint8_t rx[] = {0x05, 0x02, 0x26};
    Frame f;
    CHECK(decode_frame(rx, sizeof(rx), kRootEndpoint, f) == FrameStatus::TooShort);
    CHECK(decode_frame(nullptr, 0, kRootEndpoint, f) == FrameStatus::TooShort);
    CHECK(f.empty());
}

TEST_CASE("decode: declared length below 2 is a mismatch") {
    const uint8_t rx[] = {0x05, 0x01, 0x26, 0x03};
    Frame f;
    CHECK(decode_frame(rx, sizeof(rx), kRootEndpoint, f) == FrameStatus::LengthMismatch);
    CHECK(f.empty());
}

TEST_CASE("decode: buffer shorter than declared length is truncated") {
    const uint8_t rx[] = {0x05, 0x05, 0x26, 0x03, 0x32};
    Frame f;
    CHECK(decode_frame(rx, sizeof(rx), kRootEndpoint, f) == FrameStatus::Truncated);
    CHECK(f.empty());
}

TEST_CASE("decode: trailing bytes after the declared length are ignored") {
    const uint8_t rx[] = {0x05, 0x03, 0x26, 0x03, 0x32, 0x25, 0x01};
    Frame f;
    REQUIRE(decode_frame(rx, sizeof(rx), kRootEndpoint, f) == FrameStatus::Ok);
    CHECK(f.to_vector() == std::vector<uint8_t>{0x05, 0x03, 0x26, 0x03, 0x32});
    uint8_t v = 0;
    CHECK_FALSE(f.byte_at(5, v));
}

TEST_CASE("decode: declared length that cannot fit 255 bytes overflows") {
    std::vector<uint8_t> rx(256, 0x00);
    rx[0] = 0x05;
    rx[1] = 254;
    Frame f;
    CHECK(decode_frame(rx.data(), rx.size(), kRootEndpoint, f) == FrameStatus::Overflow);
}

TEST_CASE("decode: endpoint comes from the caller") {
    const uint8_t rx[] = {0x05, 0x03, 0x26, 0x03, 0x10};
    Frame f;
    REQUIRE(decode_frame(rx, sizeof(rx), uint8_t(3), f) == FrameStatus::Ok);
    CHECK(f.address() == Address(5, uint8_t(3)));
}

TEST_CASE("round trip keeps node, class, command and payload") {
    const uint8_t payload[] = {0x01, 0x02, 0xFF};
    Frame a;
    REQUIRE(encode_frame(Address(200), 0x31, 0x05, payload, sizeof(payload), a) == FrameStatus::Ok);

    const auto wire = a.to_vector();
    Frame b;
    REQUIRE(decode_frame(wire.data(), wire.size(), kRootEndpoint, b) == FrameStatus::Ok);
    CHECK(b.node_id() == 200);
    CHECK(b.command_class() == 0x31);
    CHECK(b.command() == 0x05);
    REQUIRE(b.payload_size() == 3);
    CHECK(b.payload()[2] == 0xFF);
}

TEST_CASE("hex helpers") {
    Frame f;
    const uint8_t level = 0x32;
    REQUIRE(encode_frame(Address(5), 0x26, 0x01, &level, 1, f) == FrameStatus::Ok);
    CHECK(to_hex(f) == "05 03 26 01 32");

    std::vector<uint8_t> out;
    CHECK(parse_hex("05 03 26 03 32", out));
    CHECK(out == std::vector<uint8_t>{0x05, 0x03, 0x26, 0x03, 0x32});
    CHECK(parse_hex("0503260332", out));
    CHECK(out.size() == 5);
    CHECK(parse_hex("0x05:0x03-26,03 ff", out));
    CHECK(out == std::vector<uint8_t>{0x05, 0x03, 0x26, 0x03, 0xFF});
    CHECK_FALSE(parse_hex("050", out));
    CHECK_FALSE(parse_hex("0 5", out));
    CHECK_FALSE(parse_hex("zz", out));
}

TEST_CASE("status and metadata names are stable") {
    CHECK(std::string(frame_status_name(FrameStatus::Ok)) == "ok");
    CHECK(std::string(frame_status_name(FrameStatus::TooShort)) == "too_short");
    CHECK(std::string(frame_status_name(FrameStatus::LengthMismatch)) == "length_mismatch");
    CHECK(std::string(frame_status_name(FrameStatus::Truncated)) == "truncated");
    CHECK(std::string(frame_status_name(FrameStatus::Overflow)) == "overflow");
    CHECK(std::string(message_priority_name(MessagePriority::Set)) == "set");
    CHECK(std::string(message_class_name(MessageClass::SendData)) == "send_data");
}
