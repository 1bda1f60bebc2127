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

#ifndef _FLEETLINK_DETAIL_SOCKETS_H
#define _FLEETLINK_DETAIL_SOCKETS_H

#include "../options.hpp"
#include <utility> // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fleetlink::detail {

using udp = boost::asio::ip::udp;

[[noreturn]] inline void throwSetupError(const char* where, const std::string& what, const boost::system::error_code& err_code)
{
    std::stringstream str;
    str<<where<<": "<<what<<": "<<err_code.message();
    throw std::runtime_error(str.str());
}

/// parse dotted IPv4 address, throws std::invalid_argument on failure
inline boost::asio::ip::address_v4 parseAddress(const std::string& address)
{
    boost::system::error_code err_code;
    auto result = boost::asio::ip::make_address_v4(address, err_code);
    if(err_code.failed()) {
        throw std::invalid_argument("fleetlink: '" + address + "' is not a valid IPv4 address");
    }
    return result;
}

/// parse IPv4 multicast group address, throws std::invalid_argument on failure
inline boost::asio::ip::address_v4 parseGroupAddress(const std::string& group)
{
    auto result = parseAddress(group);
    if(!result.is_multicast()) {
        throw std::invalid_argument("fleetlink: '" + group + "' is not an IPv4 multicast address");
    }
    return result;
}

//! Open a socket bound to the wildcard address on `port` and joined to `group`
/** Throws std::runtime_error if any step fails. The socket is closed in that case and the
 *  group is not joined. */
inline std::shared_ptr<udp::socket> openReceiveSocket(boost::asio::io_context& context,
                                                      const boost::asio::ip::address_v4& group, port_t port,
                                                      const ReceiverOptions& options)
{
    constexpr const char* where = "fleetlink::Receiver::start";
    auto socket = std::make_shared<udp::socket>(context);
    const udp::endpoint listen_endpoint(boost::asio::ip::address_v4::any(), port);
    boost::system::error_code err_code;

    socket->open(listen_endpoint.protocol(), err_code);
    if(err_code.failed()) {
        throwSetupError(where, "can't open socket", err_code);
    }
    if(options.reuse_address) {
        socket->set_option(udp::socket::reuse_address(true), err_code);
        if(err_code.failed()) {
            throwSetupError(where, "can't set SO_REUSEADDR", err_code);
        }
    }
    socket->bind(listen_endpoint, err_code);
    if(err_code.failed()) {
        throwSetupError(where, "can't bind to port " + std::to_string(port), err_code);
    }
    if(options.listen_interface) {
        socket->set_option(boost::asio::ip::multicast::join_group(group, parseAddress(*options.listen_interface)), err_code);
    } else {
        socket->set_option(boost::asio::ip::multicast::join_group(group), err_code);
    }
    if(err_code.failed()) {
        throwSetupError(where, "can't join multicast group " + group.to_string(), err_code);
    }
    return socket;
}

/// Open `socket`, bind it to an ephemeral port and apply multicast options
inline void openSendSocket(udp::socket& socket, const SenderOptions& options)
{
    constexpr const char* where = "fleetlink::Sender";
    boost::system::error_code err_code;

    socket.open(udp::v4(), err_code);
    if(err_code.failed()) {
        throwSetupError(where, "can't open socket", err_code);
    }
    socket.bind(udp::endpoint(boost::asio::ip::address_v4::any(), 0), err_code);
    if(err_code.failed()) {
        throwSetupError(where, "can't bind socket", err_code);
    }
    socket.set_option(boost::asio::ip::multicast::hops(options.ttl), err_code);
    if(err_code.failed()) {
        throwSetupError(where, "can't set multicast TTL to " + std::to_string(options.ttl), err_code);
    }
    socket.set_option(boost::asio::ip::multicast::enable_loopback(options.loopback), err_code);
    if(err_code.failed()) {
        throwSetupError(where, "can't set multicast loopback", err_code);
    }
    if(options.outbound_interface) {
        socket.set_option(boost::asio::ip::multicast::outbound_interface(parseAddress(*options.outbound_interface)), err_code);
        if(err_code.failed()) {
            throwSetupError(where, "can't use interface " + *options.outbound_interface, err_code);
        }
    }
}

} /* namespace fleetlink::detail */

#endif // _FLEETLINK_DETAIL_SOCKETS_H
