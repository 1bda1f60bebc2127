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

#include "fleetlink/fleetlink.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>


using fleetlink::Sender, fleetlink::Receiver;

const std::string group = "239.1.1.1";
constexpr fleetlink::port_t port = 12345;
constexpr int message_count = 10;

void printMessage(const fleetlink::FleetMsgHeader& header, fleetlink::Payload&& payload,
                  const boost::asio::ip::udp::endpoint& source)
{
    std::cout<<"["<<header.timestamp<<"] "<<fleetlink::toString(header.messageType())<<" from "<<source
             <<" (id: "<<header.sender_id<<", seq: "<<header.sequence<<", "<<payload.size()<<" bytes): "
             <<std::string(payload.begin(), payload.end())<<std::endl;
}

int sender()
{
    std::cout<<"I'm a sender."<<std::endl;
    fleetlink::SenderOptions options;
    options.verbose = true;
    Sender sender(group, port, 12345, options);

    for(int i = 0; i < message_count; i++)
    {
        if(i % 3 == 0) {
            sender.sendHeartbeat();
        }
        sender.sendData(fleetlink::toPayload("Data message #" + std::to_string(i)));
        if(i % 5 == 0) {
            sender.sendControl("CONTROL_CMD_" + std::to_string(i));
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    std::cout<<"Sender finished"<<std::endl;
    return 0;
}

int receiver()
{
    std::cout<<"I'm a receiver."<<std::endl;
    std::cout<<"Use Ctrl^C to stop me."<<std::endl;
    boost::asio::io_context context;
    boost::asio::signal_set signals(context, SIGINT, SIGTERM);
    signals.async_wait([&context](const boost::system::error_code&, int) { context.stop(); });

    fleetlink::ReceiverOptions options;
    options.verbose = true;
    fleetlink::runMulticastReceiver(context, group, port, printMessage, options);
    std::cout<<"Receiver finished"<<std::endl;
    return 0;
}

int both()
{
    std::cout<<"Running sender and receiver on one io_context."<<std::endl;
    boost::asio::io_context context;
    Receiver rx(context);
    rx.start(group, port, printMessage);
    Sender tx(group, port, 99999, {}, context);

    for(int i = 0; i < message_count / 2; i++)
    {
        tx.sendHeartbeat();
        tx.sendData(fleetlink::toPayload("Test data #" + std::to_string(i)));
        if(i % 2 == 0) {
            tx.sendControl("TEST_COMMAND");
        }
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        while(std::chrono::steady_clock::now() < deadline)
        {
            rx.poll();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    const auto& stats = rx.statistics();
    std::cout<<"Received "<<stats.messages_dispatched<<" messages, rejected "<<stats.rejected()<<std::endl;
    return 0;
}

int main(int argc, char* argv[])
{
    const std::string mode = argc > 1 ? argv[1] : "both";
    try {
        if(mode == "sender") {
            return sender();
        }
        if(mode == "receiver") {
            return receiver();
        }
        if(mode == "both") {
            return both();
        }
        std::cout<<"Usage: "<<argv[0]<<" [sender|receiver|both]"<<std::endl;
        return 2;
    } catch (const std::exception& ex) {
        std::cout<<ex.what()<<std::endl;
    }
    return 1;
}
