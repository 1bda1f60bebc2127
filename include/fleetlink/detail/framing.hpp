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

#ifndef _FLEETLINK_DETAIL_FRAMING_H
#define _FLEETLINK_DETAIL_FRAMING_H

#include "header.hpp"
#include <utility> // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <cstring>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fleetlink {

/// Largest payload which can be described by FleetMsgHeader::payload_len
constexpr size_t max_payload_len = std::numeric_limits<uint16_t>::max();

/// Result of checking one received datagram
enum class DatagramStatus
{
    accepted, tooSmall, invalidHeader, lengthMismatch
};

inline const char* toString(DatagramStatus status)
{
    switch(status)
    {
    case DatagramStatus::accepted: return "accepted";
    case DatagramStatus::tooSmall: return "packet too small";
    case DatagramStatus::invalidHeader: return "invalid header";
    case DatagramStatus::lengthMismatch: return "payload length mismatch";
    }
    return "unknown";
}

/// Details about a datagram dropped by the receiver
struct RejectInfo
{
    DatagramStatus reason{DatagramStatus::accepted};
    boost::asio::ip::udp::endpoint source;
    size_t datagram_size{0};
    /// declared payload length, meaningful for lengthMismatch only
    size_t expected_payload{0};
    /// bytes after the header, meaningful for lengthMismatch only
    size_t actual_payload{0};

    [[nodiscard]] std::string describe() const
    {
        std::stringstream str;
        str<<toString(reason)<<" from "<<source;
        if(reason == DatagramStatus::lengthMismatch) {
            str<<": expected "<<expected_payload<<", got "<<actual_payload;
        } else if(reason == DatagramStatus::tooSmall) {
            str<<": "<<datagram_size<<" bytes";
        }
        return str.str();
    }
};

namespace detail {

struct DatagramCheck
{
    DatagramStatus status{DatagramStatus::tooSmall};
    /// valid only when status is accepted or lengthMismatch
    FleetMsgHeader header;
    /// number of bytes following the header
    size_t payload_size{0};
};

//! Classify a received datagram of `len` bytes
/** The checks are done in the following order: size of the datagram, magic/version/checksum
 *  of the header, declared payload length against the bytes actually present. The first failed
 *  check determines the status. */
inline DatagramCheck checkDatagram(const byte* data, size_t len)
{
    DatagramCheck result;
    auto header = FleetMsgHeader::decode(data, len);
    if(!header) {
        result.status = DatagramStatus::tooSmall;
        return result;
    }
    if(!header->isValid()) {
        result.status = DatagramStatus::invalidHeader;
        return result;
    }
    result.header = *header;
    result.payload_size = len - FleetMsgHeader::wire_size;
    result.status = result.payload_size == header->payload_len ? DatagramStatus::accepted : DatagramStatus::lengthMismatch;
    return result;
}

//! Concatenate header and payload into one datagram
inline Payload frameMessage(const FleetMsgHeader& header, const byte* payload, size_t len)
{
    Payload datagram(FleetMsgHeader::wire_size + len);
    header.encode(datagram.data());
    if(len > 0) {
        std::memcpy(datagram.data() + FleetMsgHeader::wire_size, payload, len);
    }
    return datagram;
}

/// throws std::length_error if `len` does not fit into payload_len
inline uint16_t checkedPayloadLen(size_t len)
{
    if(len > max_payload_len) {
        std::stringstream str;
        str<<"fleetlink: payload of "<<len<<" bytes exceeds the limit of "<<max_payload_len<<" bytes";
        throw std::length_error(str.str());
    }
    return static_cast<uint16_t>(len);
}

} /* namespace detail */

} /* namespace fleetlink */

#endif // _FLEETLINK_DETAIL_FRAMING_H
