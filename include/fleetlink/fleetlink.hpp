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

#ifndef _FLEETLINK_H
#define _FLEETLINK_H

#include "detail/detail.hpp"
#include <concepts>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace fleetlink {

template<class T>
concept IsPayload = std::same_as<Payload, std::remove_cvref_t<T>>;

/// Plain value which can be sent as its raw bytes
template<class T>
concept RawMessage = (not IsPayload<T>) && std::is_trivially_copyable_v<T> &&
                     (not std::is_array_v<T>) && (not std::is_pointer_v<T>) &&
                     (not std::convertible_to<T, std::string_view>);

/// copy `payload` into `msg`, throws if the sizes differ
template<typename MsgType> requires RawMessage<MsgType>
void payloadAs(const Payload& payload, MsgType& msg)
{
    if(payload.size() != sizeof(msg)) {
        throw std::runtime_error("incorrect message size");
    }
    std::memcpy(&msg, payload.data(), payload.size());
}

class Sender : public detail::MulticastSender
{
public:
    Sender(const std::string& group, port_t port, uint32_t sender_id,
           SenderOptions options = {}, boost::asio::io_context& context = detail::GetContext::get()) :
        detail::MulticastSender(group, port, sender_id, std::move(options), context) {}

    Sender(Sender&& other) = delete;
    Sender(const Sender& other) = delete;
    Sender& operator=(Sender&& other) = delete;
    Sender& operator=(const Sender& other) = delete;

    ~Sender() override = default;

    using detail::MulticastSender::sendData;

    template<typename MsgType> requires RawMessage<MsgType>
    void sendData(const MsgType& msg)
    {
        Payload buf(sizeof(msg));
        std::memcpy(buf.data(), &msg, sizeof(msg));
        detail::MulticastSender::sendData(buf);
    }
};

class Receiver : public detail::MulticastReceiver
{
public:
    template<typename ... Args>
    explicit Receiver(Args&& ... args) : detail::MulticastReceiver(std::forward<Args>(args)...) {}

    Receiver(Receiver&& other) = delete;
    Receiver(const Receiver& other) = delete;
    Receiver& operator=(Receiver&& other) = delete;
    Receiver& operator=(const Receiver& other) = delete;

    ~Receiver() override = default;

    template<typename MsgType> requires RawMessage<MsgType>
    bool receive(MsgType& msg)
    {
        ReceivedMessage received;
        if(detail::MulticastReceiver::receive(received))
        {
            payloadAs(received.payload, msg);
            return true;
        }
        return false;
    }

    bool receive(ReceivedMessage& msg)
    {
        return detail::MulticastReceiver::receive(msg);
    }
};

//! Join `group` and dispatch validated messages to `handler` until cancelled
/**
 * Blocks in `context.run()`. Setup failures are thrown before the loop starts. The function
 * returns when `context` is stopped (context.stop() may be called from another thread);
 * the socket is closed and the group left on return. A stopped context is restarted before
 * the loop begins, so a stop() issued before the call has no effect.
 */
inline void runMulticastReceiver(boost::asio::io_context& context, const std::string& group, port_t port,
                                 MessageHandler handler, ReceiverOptions options = {})
{
    Receiver receiver(context, std::move(options));
    receiver.start(group, port, std::move(handler));
    if(context.stopped()) {
        // a context that already ran out of work would return from run() immediately
        context.restart();
    }
    receiver.run();
}

} /* namespace fleetlink */

#endif // _FLEETLINK_H
