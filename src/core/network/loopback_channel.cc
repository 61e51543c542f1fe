#include <utility>  // before Boost.Asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <core/network/loopback_channel.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace peerdrop::core {

LoopbackChannel::LoopbackChannel(PrivateTag, net::io_context& ioc)
    : ioc_(ioc) {}

LoopbackChannel::Pair LoopbackChannel::CreatePair(net::io_context& ioc) {
    auto first = std::make_shared<LoopbackChannel>(PrivateTag{}, ioc);
    auto second = std::make_shared<LoopbackChannel>(PrivateTag{}, ioc);
    first->peer_ = second;
    second->peer_ = first;
    return {first, second};
}

void LoopbackChannel::Open() {
    auto peer = peer_.lock();
    if (open_ || !peer) {
        return;
    }
    open_ = true;
    peer->open_ = true;
    for (auto& end : {shared_from_this(), peer}) {
        net::post(ioc_, [weak = std::weak_ptr(end)] {
            if (auto channel = weak.lock(); channel && channel->open_) {
                channel->emitOpen();
            }
        });
    }
}

net::awaitable<void> LoopbackChannel::Send(const Message& message) {
    auto peer = peer_.lock();
    if (!open_ || !peer) {
        throw boost::system::system_error(net::error::not_connected);
    }
    net::post(ioc_, [weak = std::weak_ptr(peer), message]() mutable {
        if (auto channel = weak.lock()) {
            channel->deliver(std::move(message));
        }
    });
    // Let the peer run before the next send
    co_await net::post(ioc_, net::use_awaitable);
}

void LoopbackChannel::Close() {
    if (!open_) {
        return;
    }
    open_ = false;
    auto peer = peer_.lock();
    if (!peer || !peer->open_) {
        return;
    }
    peer->open_ = false;
    // Queued behind the messages already sent
    net::post(ioc_, [weak = std::weak_ptr(peer)] {
        if (auto channel = weak.lock()) {
            channel->emitClose();
        }
    });
}

void LoopbackChannel::deliver(Message message) {
    spdlog::trace("Loopback delivering {} message", MessageKindToString(KindOf(message)));
    emitMessage(std::move(message));
}

} // namespace peerdrop::core
