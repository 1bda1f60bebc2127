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

#ifndef _FLEETLINK_OPTIONS_H
#define _FLEETLINK_OPTIONS_H

#include "detail/framing.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace fleetlink {

using port_t = uint16_t;

/// Reference receive buffer size, one Ethernet MTU
constexpr size_t default_receive_buffer_size = 1500;

struct SenderOptions
{
    /// multicast TTL, 1 keeps datagrams on the local network
    int ttl = 1;
    /// deliver own datagrams to receivers on the same host
    bool loopback = true;
    /// local IPv4 address of the interface used for outgoing datagrams
    std::optional<std::string> outbound_interface;
    /// print a line to std::cout for every sent message
    bool verbose = false;
};

struct ReceiverOptions
{
    /// datagrams longer than this are truncated by the transport
    size_t buffer_size = default_receive_buffer_size;
    /// local IPv4 address of the interface used to join the group
    std::optional<std::string> listen_interface;
    /// allow several receivers on the same host and port
    bool reuse_address = true;
    /// maximal number of messages kept when the receiver is started without a handler
    size_t queue_capacity = 1024;
    bool verbose = false;
    /// called for every dropped datagram instead of printing it to std::cerr
    std::function<void(const RejectInfo&)> on_rejected;
};

struct SenderStatistics
{
    uint64_t messages_sent{0};
    /// payload and header bytes
    uint64_t bytes_sent{0};
    uint64_t send_failures{0};
};

struct ReceiverStatistics
{
    uint64_t datagrams_received{0};
    uint64_t messages_dispatched{0};
    /// payload bytes of dispatched messages
    uint64_t bytes_dispatched{0};
    uint64_t too_small{0};
    uint64_t invalid_header{0};
    uint64_t length_mismatch{0};
    uint64_t receive_errors{0};
    uint64_t queue_overflows{0};

    [[nodiscard]] uint64_t rejected() const { return too_small + invalid_header + length_mismatch; }
};

} /* namespace fleetlink */

#endif // _FLEETLINK_OPTIONS_H
