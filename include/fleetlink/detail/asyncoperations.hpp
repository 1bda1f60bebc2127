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

#ifndef _FLEETLINK_DETAIL_ASYNCOPERATIONS_H
#define _FLEETLINK_DETAIL_ASYNCOPERATIONS_H

#include "header.hpp"
#include <utility> // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace fleetlink::detail {

using udp = boost::asio::ip::udp;

//Signatures of callback functions
using onDatagramReceivedT = void(const byte* data, size_t len, const udp::endpoint& source);
using onNetworkFailedT = void(const boost::system::error_code&);

struct GetContext
{
    /*!
    * \brief returns reference to the static context that is used by default by all objects in this library
    */
    static boost::asio::io_context& get()
    {
        static boost::asio::io_context context;
        return context;
    }
};

//! The base class for classes wrapping boost::asio async operations.
/**
 * Objects of derived classes own the buffers that pending async operations write to, so
 * they must outlive those operations. They are managed by shared pointers: every submitted
 * operation holds a shared_ptr to the object until its completion handler runs. Copying and
 * moving is prohibited for the same reason.
 * @tparam T is the type of the derived class
 */
template<class T>
class AsyncOperationBase : public std::enable_shared_from_this<T>
{
public:
    AsyncOperationBase() = default;

    AsyncOperationBase(const AsyncOperationBase&) = delete;
    AsyncOperationBase(AsyncOperationBase&&) = delete;
    void operator=(const AsyncOperationBase&) = delete;
    void operator=(AsyncOperationBase&&) = delete;

    ~AsyncOperationBase() = default;

    /// Create new object and return shared pointer to it.
    /** Derived classes hide their constructors and declare AsyncOperationBase a friend,
     *  so this is the only way to create them. */
    template<typename ... Args>
    static std::shared_ptr<T> create_shared_ptr(Args&&...args)
    {
        return std::shared_ptr<T>(new T(std::forward<Args>(args)...));
    }
};

//! Receives datagrams from a UDP socket one at a time
/**
 * Every completed receive is reported through `on_datagram_received`, with a pointer to
 * the internal buffer. The data stays valid until startReadAsync() is called again, so the
 * callback should copy whatever it needs before re-arming the reader.
 *
 * Errors (including cancellation, reported as boost::asio::error::operation_aborted) are
 * passed to `on_network_failed`. If that callback is empty an exception is thrown from the
 * completion handler instead.
 */
class DatagramReader : public AsyncOperationBase<DatagramReader>
{
    friend class AsyncOperationBase<DatagramReader>;

    DatagramReader(std::shared_ptr<udp::socket> socket, size_t buffer_size,
                   std::function<onDatagramReceivedT> on_datagram_received,
                   std::function<onNetworkFailedT> on_network_failed) :
        on_datagram_received_(std::move(on_datagram_received)), on_network_failed_(std::move(on_network_failed)),
        socket_(std::move(socket)), buffer_(buffer_size) {}
public:
    /// submit the next receive, does nothing if a receive is already pending
    void startReadAsync()
    {
        if(read_in_progress_) {
            return;
        }
        doReceive();
    }

    [[nodiscard]] bool readInProgress() const { return read_in_progress_; }
    [[nodiscard]] size_t bufferSize() const { return buffer_.size(); }

    /// error code of the last finished receive
    [[nodiscard]] boost::system::error_code errorCode() const { return error_code_; }
private:
    bool read_in_progress_ = false;

    std::function<onDatagramReceivedT> on_datagram_received_;
    std::function<onNetworkFailedT> on_network_failed_;

    std::shared_ptr<udp::socket> socket_;
    std::vector<byte> buffer_;
    /// address of the sender of the last datagram
    udp::endpoint source_;
    boost::system::error_code error_code_;

    void doReceive()
    {
        read_in_progress_ = true;
        // the shared_ptr keeps `this` and `buffer_` alive until the completion handler runs
        auto self(shared_from_this());
        socket_->async_receive_from(boost::asio::buffer(buffer_), source_,
                                    std::bind(&DatagramReader::onReceiveFinished, self, std::placeholders::_1, std::placeholders::_2));
    }

    void onReceiveFinished(boost::system::error_code err_code, size_t len)
    {
        read_in_progress_ = false;
        error_code_ = err_code;
        if(err_code.failed())
        {
            if(on_network_failed_) {
                on_network_failed_(err_code);
            } else {
                std::stringstream str;
                str<<"fleetlink::DatagramReader::onReceiveFinished: async_receive_from returned non-zero code: "<<err_code;
                throw std::runtime_error(str.str());
            }
        } else if(on_datagram_received_) {
            on_datagram_received_(buffer_.data(), len, source_);
        }
    }
};

} /* namespace fleetlink::detail */

#endif // _FLEETLINK_DETAIL_ASYNCOPERATIONS_H
