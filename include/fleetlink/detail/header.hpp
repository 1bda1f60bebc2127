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

#ifndef _FLEETLINK_DETAIL_HEADER_H
#define _FLEETLINK_DETAIL_HEADER_H

#include <boost/endian/conversion.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace fleetlink {

using byte = uint8_t;
using Payload = std::vector<byte>;

inline Payload toPayload(std::string_view text)
{
    return Payload(text.begin(), text.end());
}

/// Kind of a fleet message, stored in the `msg_type` byte of the header
enum class MessageType : uint8_t
{
    Heartbeat = 1,
    Data = 2,
    Control = 3
};

/// return true if `raw` is one of the values of MessageType
inline bool isKnownMessageType(uint8_t raw)
{
    return raw >= static_cast<uint8_t>(MessageType::Heartbeat) && raw <= static_cast<uint8_t>(MessageType::Control);
}

//! Convert on-wire type byte to MessageType
/** Unknown values are mapped to MessageType::Heartbeat instead of being rejected.
 *  The raw byte is still available in FleetMsgHeader::msg_type. */
inline MessageType toMessageType(uint8_t raw)
{
    if(isKnownMessageType(raw)) {
        return static_cast<MessageType>(raw);
    }
    return MessageType::Heartbeat;
}

inline const char* toString(MessageType type)
{
    switch(type)
    {
    case MessageType::Heartbeat: return "Heartbeat";
    case MessageType::Data: return "Data";
    case MessageType::Control: return "Control";
    }
    return "Unknown";
}

/// milliseconds since the Unix epoch
inline uint64_t nowMs()
{
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return ms > 0 ? static_cast<uint64_t>(ms) : 0;
}

/// Low 16 bits of the 32-bit wrapping sum of `len` bytes
inline uint16_t checksum16(const byte* data, size_t len)
{
    uint32_t sum = 0;
    for(size_t i = 0; i < len; i++) {
        sum += data[i];
    }
    return static_cast<uint16_t>(sum & 0xFFFF);
}

/*!
* \brief Header part of every datagram sent or received by this library
* \details The header has a fixed size of 24 bytes and is followed by `payload_len` bytes
* of payload in the same datagram. All multi-byte fields are little-endian on the wire:
*
*     offset  size  field
*     0       4     magic
*     4       1     version
*     5       1     msg_type
*     6       2     sequence
*     8       8     timestamp (ms)
*     16      4     sender_id
*     20      2     payload_len
*     22      2     checksum
*
* Fields are read and written at explicit offsets, so the in-memory layout of this struct
* does not matter.
*/
struct FleetMsgHeader final
{
    /// Every header should start with the following signature:
    static constexpr uint32_t header_magic = 0xFEED;
    static constexpr uint8_t protocol_version = 1;

    static constexpr size_t wire_size = 24;
    static constexpr size_t checksum_offset = 22;

    using WireBytes = std::array<byte, wire_size>;

    uint32_t magic{header_magic};
    uint8_t version{protocol_version};
    uint8_t msg_type{static_cast<uint8_t>(MessageType::Heartbeat)};
    uint16_t sequence{0};
    uint64_t timestamp{0};
    uint32_t sender_id{0};
    uint16_t payload_len{0};
    uint16_t checksum{0};

    //! Build a header for an outbound message
    /** Timestamp is taken from the system clock, checksum is computed over the result. */
    static FleetMsgHeader create(MessageType type, uint32_t sender_id, uint16_t sequence, uint16_t payload_len)
    {
        FleetMsgHeader header;
        header.msg_type = static_cast<uint8_t>(type);
        header.sequence = sequence;
        header.timestamp = nowMs();
        header.sender_id = sender_id;
        header.payload_len = payload_len;
        header.checksum = header.calculateChecksum();
        return header;
    }

    //! Read the header from the first `wire_size` bytes of `data`
    /** Returns empty optional if `len` is less than `wire_size`. The header is not validated,
     *  call isValid() on the result. */
    static std::optional<FleetMsgHeader> decode(const byte* data, size_t len)
    {
        if(data == nullptr || len < wire_size) {
            return std::nullopt;
        }
        FleetMsgHeader header;
        header.magic = boost::endian::load_little_u32(data);
        header.version = data[4];
        header.msg_type = data[5];
        header.sequence = boost::endian::load_little_u16(data + 6);
        header.timestamp = boost::endian::load_little_u64(data + 8);
        header.sender_id = boost::endian::load_little_u32(data + 16);
        header.payload_len = boost::endian::load_little_u16(data + 20);
        header.checksum = boost::endian::load_little_u16(data + checksum_offset);
        return header;
    }

    /// write the wire image of the header into `out`, which should hold at least `wire_size` bytes
    void encode(byte* out) const
    {
        boost::endian::store_little_u32(out, magic);
        out[4] = version;
        out[5] = msg_type;
        boost::endian::store_little_u16(out + 6, sequence);
        boost::endian::store_little_u64(out + 8, timestamp);
        boost::endian::store_little_u32(out + 16, sender_id);
        boost::endian::store_little_u16(out + 20, payload_len);
        boost::endian::store_little_u16(out + checksum_offset, checksum);
    }

    [[nodiscard]] WireBytes toBytes() const
    {
        WireBytes bytes{};
        encode(bytes.data());
        return bytes;
    }

    //! Checksum of the header as if its checksum field were zero
    /** Works on a scratch encoding, `this` is not modified. */
    [[nodiscard]] uint16_t calculateChecksum() const
    {
        WireBytes scratch = toBytes();
        scratch[checksum_offset] = 0;
        scratch[checksum_offset + 1] = 0;
        return checksum16(scratch.data(), checksum_offset);
    }

    [[nodiscard]] bool isValid() const
    {
        return magic == header_magic && version == protocol_version && checksum == calculateChecksum();
    }

    [[nodiscard]] MessageType messageType() const { return toMessageType(msg_type); }
};

inline bool operator==(const FleetMsgHeader& lhs, const FleetMsgHeader& rhs)
{
    return lhs.magic == rhs.magic && lhs.version == rhs.version && lhs.msg_type == rhs.msg_type &&
           lhs.sequence == rhs.sequence && lhs.timestamp == rhs.timestamp && lhs.sender_id == rhs.sender_id &&
           lhs.payload_len == rhs.payload_len && lhs.checksum == rhs.checksum;
}

} /* namespace fleetlink */

#endif // _FLEETLINK_DETAIL_HEADER_H
