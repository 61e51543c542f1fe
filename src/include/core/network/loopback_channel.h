#pragma once

#include "message_channel.h"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <utility>

namespace peerdrop::core {

// In-process channel pair. Messages are posted to the io_context and arrive in send order.
class LoopbackChannel : public MessageChannel, public std::enable_shared_from_this<LoopbackChannel> {
    struct PrivateTag {};

public:
    using Pair = std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>;

    LoopbackChannel(PrivateTag, boost::asio::io_context& ioc);

    // Both ends start closed, Open() on either end connects the pair
    static Pair CreatePair(boost::asio::io_context& ioc);

    // Posts the open event to both ends
    void Open();

    bool IsOpen() const override { return open_; }

    boost::asio::awaitable<void> Send(const Message& message) override;

    // The peer sees a close event, this end does not
    void Close() override;

private:
    void deliver(Message message);

    boost::asio::io_context& ioc_;
    std::weak_ptr<LoopbackChannel> peer_;
    bool open_{false};
};

} // namespace peerdrop::core
