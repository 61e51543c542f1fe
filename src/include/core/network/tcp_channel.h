#pragma once

#include "message_channel.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace peerdrop::core {

// Message channel over one TCP connection.
// Frame layout: | u32 big-endian frame size | encoded message |
class TcpChannel : public MessageChannel, public std::enable_shared_from_this<TcpChannel> {
public:
    explicit TcpChannel(boost::asio::ip::tcp::socket socket);
    ~TcpChannel() override;

    // Throws boost::system::system_error if the port cannot be bound
    static boost::asio::ip::tcp::acceptor Listen(boost::asio::io_context& ioc, std::uint16_t port);

    // Waits for one peer on a listening acceptor
    static boost::asio::awaitable<std::shared_ptr<TcpChannel>> Accept(
        boost::asio::ip::tcp::acceptor& acceptor);

    static boost::asio::awaitable<std::shared_ptr<TcpChannel>> Connect(std::string_view host,
                                                                       std::uint16_t port);

    // Emits the open event and starts reading, call after the handlers are set
    void Start();

    bool IsOpen() const override { return open_; }

    boost::asio::awaitable<void> Send(const Message& message) override;

    void Close() override;

    const std::string& remote_address() const { return remote_address_; }

private:
    boost::asio::awaitable<void> readLoop();
    void fail(const std::string& detail);
    void closeSocket();

    boost::asio::ip::tcp::socket socket_;
    std::string remote_address_;
    bool open_{false};
    bool closing_{false}; // Set by a local Close, the read loop then ends quietly
};

} // namespace peerdrop::core
