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

#ifndef _FLEETLINK_DETAIL_H
#define _FLEETLINK_DETAIL_H

#include "safecallback.hpp"
#include "header.hpp"
#include "framing.hpp"
#include "asyncoperations.hpp"
#include "sockets.hpp"
#include "../options.hpp"
#include <utility> // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <functional>
#include <iostream>
#include <memory>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fleetlink {

/// Validated message together with the address it came from
struct ReceivedMessage
{
    FleetMsgHeader header;
    Payload payload;
    boost::asio::ip::udp::endpoint source;
};

using onMessageT = void(const FleetMsgHeader& header, Payload&& payload, const boost::asio::ip::udp::endpoint& source);
using MessageHandler = std::function<onMessageT>;

namespace detail {

//! Sends framed datagrams to one multicast group
/**
 * The sequence counter is owned by the sender and is not synchronized: one object should
 * be driven by one thread at a time.
 */
class MulticastSender
{
public:
    MulticastSender(const std::string& group, port_t port, uint32_t sender_id,
                    SenderOptions options = {}, boost::asio::io_context& context = GetContext::get()) :
        options_(std::move(options)),
        sender_id_(sender_id),
        endpoint_(parseGroupAddress(group), port),
        socket_(context)
    {
        openSendSocket(socket_, options_);
        if(options_.verbose) {
            std::cout<<"fleetlink::Sender: sending to "<<endpoint_<<" with id "<<sender_id_<<std::endl;
        }
    }
    virtual ~MulticastSender() = default;

    MulticastSender(const MulticastSender&) = delete;
    MulticastSender(MulticastSender&&) = delete;
    MulticastSender& operator=(const MulticastSender&) = delete;
    MulticastSender& operator=(MulticastSender&&) = delete;

    //! frame and send one message, throws on failure
    /** std::length_error is thrown if the payload can't be described by the header, std::runtime_error
     *  if the socket reports an error. */
    void send(MessageType type, const byte* data, size_t len)
    {
        checkedPayloadLen(len);
        boost::system::error_code err_code;
        send(type, data, len, err_code);
        if(err_code.failed()) {
            std::stringstream str;
            str<<"fleetlink::Sender::send: can't send "<<toString(type)<<" message to "<<endpoint_<<": "<<err_code.message();
            throw std::runtime_error(str.str());
        }
    }

    /// frame and send one message, errors are reported through `err_code`
    void send(MessageType type, const byte* data, size_t len, boost::system::error_code& err_code)
    {
        err_code.clear();
        if(len > max_payload_len) {
            err_code = boost::asio::error::message_size;
            statistics_.send_failures++;
            return;
        }
        const auto header = FleetMsgHeader::create(type, sender_id_, sequence_, static_cast<uint16_t>(len));
        sequence_++;

        const Payload datagram = frameMessage(header, data, len);
        socket_.send_to(boost::asio::buffer(datagram), endpoint_, 0, err_code);
        if(err_code.failed()) {
            statistics_.send_failures++;
            return;
        }
        statistics_.messages_sent++;
        statistics_.bytes_sent += datagram.size();
        if(options_.verbose) {
            std::cout<<"fleetlink::Sender: sent "<<toString(type)<<" message (seq: "<<header.sequence
                     <<", "<<len<<" bytes payload)"<<std::endl;
        }
    }

    void send(MessageType type, const Payload& payload)
    {
        send(type, payload.data(), payload.size());
    }

    void sendHeartbeat()
    {
        send(MessageType::Heartbeat, nullptr, 0);
    }

    void sendData(const Payload& payload)
    {
        send(MessageType::Data, payload.data(), payload.size());
    }

    void sendData(const byte* data, size_t len)
    {
        send(MessageType::Data, data, len);
    }

    void sendControl(std::string_view command)
    {
        send(MessageType::Control, toPayload(command));
    }

    /// sequence number the next message will carry
    [[nodiscard]] uint16_t nextSequence() const { return sequence_; }
    [[nodiscard]] uint32_t senderId() const { return sender_id_; }
    [[nodiscard]] const udp::endpoint& groupEndpoint() const { return endpoint_; }
    [[nodiscard]] const SenderStatistics& statistics() const { return statistics_; }

    void close()
    {
        boost::system::error_code err_code;
        socket_.close(err_code);
    }
private:
    SenderOptions options_;
    uint32_t sender_id_;
    uint16_t sequence_{0};
    udp::endpoint endpoint_;
    udp::socket socket_;
    SenderStatistics statistics_;
};

//! Receives datagrams from a multicast group and dispatches validated messages
/**
 * Datagrams are checked by checkDatagram(). Rejected ones are counted, reported (to
 * ReceiverOptions::on_rejected or std::cerr) and dropped. Accepted ones go to the handler
 * passed to start(), or to a bounded queue read by receive() if no handler was given.
 *
 * The handler runs synchronously inside poll()/run(). The next receive is submitted before
 * the handler is called, so an exception thrown by the handler leaves the loop armed.
 */
class MulticastReceiver : public LifetimeTracker
{
public:
    enum class Status {notStarted, listening, closed, failed};

    explicit MulticastReceiver(boost::asio::io_context& context = GetContext::get(), ReceiverOptions options = {}) :
        context_(context),
        options_(std::move(options)),
        on_datagram_received_safe_(&MulticastReceiver::onDatagramReceived, this),
        on_network_failed_safe_(&MulticastReceiver::onNetworkFailed, this)
    { }

    explicit MulticastReceiver(ReceiverOptions options) :
        MulticastReceiver(GetContext::get(), std::move(options)) {}

    virtual ~MulticastReceiver()
    {
        close();
    }

    MulticastReceiver(const MulticastReceiver&) = delete;
    MulticastReceiver(MulticastReceiver&&) = delete;
    MulticastReceiver& operator=(const MulticastReceiver&) = delete;
    MulticastReceiver& operator=(MulticastReceiver&&) = delete;

    //! Bind to `port`, join `group` and submit the first receive
    /** Setup failures are thrown (std::invalid_argument for bad addresses or options,
     *  std::runtime_error for socket errors) and leave the receiver in Status::failed. */
    void start(const std::string& group, port_t port, MessageHandler handler = {})
    {
        if(status_ == Status::listening) {
            throw std::runtime_error("fleetlink::Receiver::start: receiver is already listening");
        }
        try {
            if(options_.buffer_size < FleetMsgHeader::wire_size) {
                throw std::invalid_argument("fleetlink::Receiver::start: buffer_size is smaller than the message header");
            }
            const auto group_address = parseGroupAddress(group);
            socket_ = openReceiveSocket(context_.get(), group_address, port, options_);
            group_ = udp::endpoint(group_address, port);
        } catch(...) {
            status_ = Status::failed;
            throw;
        }
        handler_ = std::move(handler);
        reader_ = DatagramReader::create_shared_ptr(socket_, options_.buffer_size,
                                                    on_datagram_received_safe_, on_network_failed_safe_);
        status_ = Status::listening;
        if(options_.verbose) {
            std::cout<<"fleetlink::Receiver: listening on "<<group_<<std::endl;
        }
        reader_->startReadAsync();
    }

    /// take the oldest queued message, returns false if the queue is empty
    bool receive(ReceivedMessage& msg)
    {
        if(read_queue_.empty()) {
            return false;
        }
        msg = std::move(read_queue_.front());
        read_queue_.pop();
        return true;
    }

    //! Cancel the pending receive and close the socket
    /** Group membership is dropped with the socket. Queued messages stay available. */
    void close()
    {
        if(socket_) {
            boost::system::error_code err_code;
            socket_->cancel(err_code);
            socket_->close(err_code);
        }
        if(status_ == Status::listening) {
            status_ = Status::closed;
        }
    }

    void poll() { context_.get().poll(); }

    /// run the io_context until it runs out of work (after close()) or is stopped
    void run() { context_.get().run(); }

    [[nodiscard]] Status getStatus() const { return status_; }
    [[nodiscard]] bool isListening() const { return status_ == Status::listening; }
    [[nodiscard]] const ReceiverStatistics& statistics() const { return statistics_; }
    [[nodiscard]] size_t queuedCount() const { return read_queue_.size(); }

    /// group endpoint passed to start()
    [[nodiscard]] const udp::endpoint& groupEndpoint() const { return group_; }

    /// local port the socket is bound to, useful when started on port 0
    [[nodiscard]] port_t localPort() const
    {
        if(!socket_ || !socket_->is_open()) {
            return 0;
        }
        boost::system::error_code err_code;
        const auto endpoint = socket_->local_endpoint(err_code);
        return err_code.failed() ? 0 : endpoint.port();
    }
private:
    void onDatagramReceived(const byte* data, size_t len, const udp::endpoint& source)
    {
        statistics_.datagrams_received++;
        const DatagramCheck check = checkDatagram(data, len);
        if(check.status != DatagramStatus::accepted) {
            const udp::endpoint from(source);
            rearm();
            reject(check, len, from);
            return;
        }
        // copy out of the reader's buffer before the next receive is submitted
        ReceivedMessage msg{check.header, Payload(data + FleetMsgHeader::wire_size, data + len), source};
        rearm();
        dispatch(std::move(msg));
    }

protected:
    /// receive error policy: cancellation is ignored, a closed descriptor fails the receiver,
    /// anything else is counted and the receive is submitted again
    void onNetworkFailed(const boost::system::error_code& err_code)
    {
        if(status_ != Status::listening || err_code == boost::asio::error::operation_aborted) {
            return;
        }
        statistics_.receive_errors++;
        std::cerr<<"fleetlink::Receiver: receive error: "<<err_code.message()<<std::endl;
        if(err_code == boost::asio::error::bad_descriptor) {
            // socket was closed behind our back, nothing to listen on
            status_ = Status::failed;
            return;
        }
        rearm();
    }
private:
    void rearm()
    {
        if(status_ == Status::listening) {
            reader_->startReadAsync();
        }
    }

    void dispatch(ReceivedMessage&& msg)
    {
        if(handler_) {
            statistics_.messages_dispatched++;
            statistics_.bytes_dispatched += msg.payload.size();
            handler_(msg.header, std::move(msg.payload), msg.source);
            return;
        }
        if(read_queue_.size() >= options_.queue_capacity) {
            statistics_.queue_overflows++;
            std::cerr<<"fleetlink::Receiver: queue is full, dropping message from "<<msg.source<<std::endl;
            return;
        }
        statistics_.messages_dispatched++;
        statistics_.bytes_dispatched += msg.payload.size();
        read_queue_.emplace(std::move(msg));
    }

    void reject(const DatagramCheck& check, size_t len, const udp::endpoint& source)
    {
        RejectInfo info;
        info.reason = check.status;
        info.source = source;
        info.datagram_size = len;
        switch(check.status)
        {
        case DatagramStatus::tooSmall:
            statistics_.too_small++;
            break;
        case DatagramStatus::invalidHeader:
            statistics_.invalid_header++;
            break;
        case DatagramStatus::lengthMismatch:
            statistics_.length_mismatch++;
            info.expected_payload = check.header.payload_len;
            info.actual_payload = check.payload_size;
            break;
        case DatagramStatus::accepted:
            return;
        }
        if(options_.on_rejected) {
            options_.on_rejected(info);
        } else {
            std::cerr<<"fleetlink::Receiver: "<<info.describe()<<std::endl;
        }
    }

    std::reference_wrapper<boost::asio::io_context> context_;
    ReceiverOptions options_;
    GuardedMemberCallback<decltype(&MulticastReceiver::onDatagramReceived)> on_datagram_received_safe_;
    GuardedMemberCallback<decltype(&MulticastReceiver::onNetworkFailed)> on_network_failed_safe_;

    Status status_ = Status::notStarted;
    udp::endpoint group_;
    std::shared_ptr<udp::socket> socket_;
    std::shared_ptr<DatagramReader> reader_;
    MessageHandler handler_;
    std::queue<ReceivedMessage> read_queue_;
    ReceiverStatistics statistics_;
};

} /* namespace detail */

} /* namespace fleetlink */

#endif // _FLEETLINK_DETAIL_H
