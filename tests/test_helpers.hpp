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

#ifndef _FLEETLINK_TESTS_HELPERS_H
#define _FLEETLINK_TESTS_HELPERS_H

#include "fleetlink/fleetlink.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace fleetlink::testing {

// Multicast traffic in tests stays on the loopback interface.
const std::string loopback = "127.0.0.1";

inline SenderOptions loopbackSender()
{
    SenderOptions options;
    options.outbound_interface = loopback;
    options.loopback = true;
    return options;
}

inline ReceiverOptions loopbackReceiver()
{
    ReceiverOptions options;
    options.listen_interface = loopback;
    return options;
}

/// poll `receiver` until `done()` returns true or `timeout` expires
template<class Predicate>
bool pollUntil(Receiver& receiver, Predicate done, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!done())
    {
        if(std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        receiver.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

/// keep polling for `duration`, used to make sure nothing else arrives
inline void pollFor(Receiver& receiver, std::chrono::milliseconds duration)
{
    pollUntil(receiver, [] { return false; }, duration);
}

/// send arbitrary bytes to the group, bypassing the framing of Sender
inline void sendRaw(const std::string& group, port_t port, const Payload& bytes)
{
    boost::asio::io_context context;
    boost::asio::ip::udp::socket socket(context, boost::asio::ip::udp::v4());
    socket.set_option(boost::asio::ip::multicast::outbound_interface(boost::asio::ip::make_address_v4(loopback)));
    socket.set_option(boost::asio::ip::multicast::enable_loopback(true));
    socket.send_to(boost::asio::buffer(bytes),
                   boost::asio::ip::udp::endpoint(boost::asio::ip::make_address_v4(group), port));
}

} /* namespace fleetlink::testing */

#endif // _FLEETLINK_TESTS_HELPERS_H
