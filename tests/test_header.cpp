// MIT License
//
// Copyright (c) 2023 Egor Tsvetkov
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include <doctest/doctest.h>
#include "fleetlink/detail/header.hpp"

#include <vector>

using namespace fleetlink;

static FleetMsgHeader fixedHeader()
{
    FleetMsgHeader h;
    h.msg_type = static_cast<uint8_t>(MessageType::Data);
    h.sequence = 0x0102;
    h.timestamp = 1700000000000ULL;
    h.sender_id = 12345;
    h.payload_len = 13;
    h.checksum = h.calculateChecksum();
    return h;
}

TEST_CASE("create() fills constant fields, timestamp and a valid checksum") {
    const uint64_t before = nowMs();
    const auto h = FleetMsgHeader::create(MessageType::Data, 12345, 100, 256);
    const uint64_t after = nowMs();

    CHECK(h.magic == 0xFEED);
    CHECK(h.version == 1);
    CHECK(h.msg_type == static_cast<uint8_t>(MessageType::Data));
    CHECK(h.sender_id == 12345);
    CHECK(h.sequence == 100);
    CHECK(h.payload_len == 256);
    CHECK(h.timestamp >= before);
    CHECK(h.timestamp <= after);
    CHECK(h.isValid());
    CHECK(h.messageType() == MessageType::Data);
}

TEST_CASE("wire image is little-endian at fixed offsets") {
    const auto bytes = fixedHeader().toBytes();
    REQUIRE(bytes.size() == 24);

    const std::vector<byte> expected_prefix{
        0xED, 0xFE, 0x00, 0x00,                         // magic
        0x01,                                           // version
        0x02,                                           // msg_type
        0x02, 0x01,                                     // sequence
        0x00, 0x68, 0xE5, 0xCF, 0x8B, 0x01, 0x00, 0x00, // timestamp
        0x39, 0x30, 0x00, 0x00,                         // sender_id
        0x0D, 0x00                                      // payload_len
    };
    for(size_t i = 0; i < expected_prefix.size(); i++) {
        CAPTURE(i);
        CHECK(bytes[i] == expected_prefix[i]);
    }
    // 1295 = sum of the 22 bytes above
    CHECK(bytes[22] == 0x0F);
    CHECK(bytes[23] == 0x05);
    CHECK(fixedHeader().checksum == 1295);
}

TEST_CASE("decode(encode(h)) reproduces every field") {
    for(auto type : {MessageType::Heartbeat, MessageType::Data, MessageType::Control})
    {
        const auto original = FleetMsgHeader::create(type, 54321, 200, type == MessageType::Heartbeat ? 0 : 42);
        const auto bytes = original.toBytes();
        const auto decoded = FleetMsgHeader::decode(bytes.data(), bytes.size());
        REQUIRE(decoded.has_value());
        CHECK(*decoded == original);
        CHECK(decoded->isValid());
        CHECK(decoded->messageType() == type);
    }
}

TEST_CASE("decode reads only the first 24 bytes of a longer buffer") {
    const auto h = FleetMsgHeader::create(MessageType::Control, 7, 8, 3);
    std::vector<byte> buf(FleetMsgHeader::wire_size + 3, 0xAB);
    h.encode(buf.data());

    const auto decoded = FleetMsgHeader::decode(buf.data(), buf.size());
    REQUIRE(decoded.has_value());
    CHECK(*decoded == h);
}

TEST_CASE("decode fails for buffers shorter than the header") {
    const auto bytes = FleetMsgHeader::create(MessageType::Data, 1, 1, 0).toBytes();
    for(size_t len = 0; len < FleetMsgHeader::wire_size; len++) {
        CAPTURE(len);
        CHECK_FALSE(FleetMsgHeader::decode(bytes.data(), len).has_value());
    }
    CHECK_FALSE(FleetMsgHeader::decode(nullptr, 24).has_value());
}

TEST_CASE("changing any single byte of the header invalidates it") {
    const auto original = FleetMsgHeader::create(MessageType::Data, 999, 17, 4).toBytes();
    for(size_t i = 0; i < FleetMsgHeader::wire_size; i++) {
        for(byte delta : {byte{0x01}, byte{0x80}, byte{0xFF}}) {
            auto corrupted = original;
            corrupted[i] ^= delta;
            const auto decoded = FleetMsgHeader::decode(corrupted.data(), corrupted.size());
            REQUIRE(decoded.has_value());
            CAPTURE(i);
            CHECK_FALSE(decoded->isValid());
        }
    }
}

TEST_CASE("wrong magic or version is rejected even with a matching checksum") {
    auto h = FleetMsgHeader::create(MessageType::Data, 999, 1, 4);
    h.magic = 0xDEAD;
    h.checksum = h.calculateChecksum();
    CHECK_FALSE(h.isValid());

    h = FleetMsgHeader::create(MessageType::Data, 999, 1, 4);
    h.version = 2;
    h.checksum = h.calculateChecksum();
    CHECK_FALSE(h.isValid());
}

TEST_CASE("checksum ignores the stored checksum field") {
    auto h = fixedHeader();
    const uint16_t good = h.calculateChecksum();
    h.checksum = 0xBEEF;
    CHECK(h.calculateChecksum() == good);
    CHECK(h.checksum == 0xBEEF);
    CHECK_FALSE(h.isValid());
}

TEST_CASE("checksum16 keeps the low 16 bits of the sum") {
    const std::vector<byte> ones(300, 0xFF);
    CHECK(checksum16(ones.data(), ones.size()) == static_cast<uint16_t>(300 * 255));
    CHECK(checksum16(ones.data(), 0) == 0);
}

TEST_CASE("unknown message types fall back to Heartbeat") {
    CHECK(toMessageType(1) == MessageType::Heartbeat);
    CHECK(toMessageType(2) == MessageType::Data);
    CHECK(toMessageType(3) == MessageType::Control);
    CHECK(toMessageType(0) == MessageType::Heartbeat);
    CHECK(toMessageType(200) == MessageType::Heartbeat);

    CHECK_FALSE(isKnownMessageType(0));
    CHECK(isKnownMessageType(3));
    CHECK_FALSE(isKnownMessageType(4));

    auto h = FleetMsgHeader::create(MessageType::Data, 1, 1, 0);
    h.msg_type = 42;
    h.checksum = h.calculateChecksum();
    CHECK(h.isValid());
    CHECK(h.messageType() == MessageType::Heartbeat);
    CHECK(h.msg_type == 42);
}
