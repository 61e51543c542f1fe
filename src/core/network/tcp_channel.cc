#include <array>
#include <utility>  // before Boost.Asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <core/constant/transfer.h>
#include <core/network/message_codec.h>
#include <core/network/tcp_channel.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace peerdrop::core {

namespace {

std::string endpointToString(const tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

} // namespace

TcpChannel::TcpChannel(tcp::socket socket)
    : socket_(std::move(socket))
    , remote_address_(endpointToString(socket_)) {}

TcpChannel::~TcpChannel() {
    closeSocket();
}

tcp::acceptor TcpChannel::Listen(net::io_context& ioc, std::uint16_t port) {
    tcp::acceptor acceptor(ioc);
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(net::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(net::socket_base::max_listen_connections);
    spdlog::info("Listening on port {}", acceptor.local_endpoint().port());
    return acceptor;
}

net::awaitable<std::shared_ptr<TcpChannel>> TcpChannel::Accept(tcp::acceptor& acceptor) {
    auto socket = co_await acceptor.async_accept(net::use_awaitable);
    socket.set_option(tcp::no_delay(true));
    auto channel = std::make_shared<TcpChannel>(std::move(socket));
    spdlog::info("Accepted peer {}", channel->remote_address());
    co_return channel;
}

net::awaitable<std::shared_ptr<TcpChannel>> TcpChannel::Connect(std::string_view host,
                                                                std::uint16_t port) {
    auto executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto results = co_await resolver.async_resolve(std::string(host),
                                                   std::to_string(port),
                                                   net::use_awaitable);

    tcp::socket socket(executor);
    co_await net::async_connect(socket, results, net::use_awaitable);
    socket.set_option(tcp::no_delay(true));

    auto channel = std::make_shared<TcpChannel>(std::move(socket));
    spdlog::info("Connected to {}", channel->remote_address());
    co_return channel;
}

void TcpChannel::Start() {
    if (open_ || closing_) {
        return;
    }
    open_ = true;
    emitOpen();
    net::co_spawn(socket_.get_executor(), readLoop(), net::detached);
}

net::awaitable<void> TcpChannel::Send(const Message& message) {
    if (!open_) {
        throw boost::system::system_error(net::error::not_connected);
    }

    auto frame = EncodeMessage(message);
    if (frame.size() > transfer::kMaxFrameSize) {
        throw boost::system::system_error(net::error::message_size);
    }

    std::uint32_t frame_size = htonl(static_cast<std::uint32_t>(frame.size()));
    std::array<net::const_buffer, 2> buffers{net::buffer(&frame_size, sizeof(frame_size)),
                                             net::buffer(frame)};
    co_await net::async_write(socket_, buffers, net::use_awaitable);
}

void TcpChannel::Close() {
    if (closing_) {
        return;
    }
    closing_ = true;
    open_ = false;
    closeSocket();
    spdlog::debug("Channel to {} closed", remote_address_);
}

net::awaitable<void> TcpChannel::readLoop() {
    auto self = shared_from_this();
    std::string failure;
    try {
        for (;;) {
            std::uint32_t frame_size = 0;
            co_await net::async_read(socket_,
                                     net::buffer(&frame_size, sizeof(frame_size)),
                                     net::use_awaitable);
            frame_size = ntohl(frame_size);
            if (frame_size > transfer::kMaxFrameSize) {
                throw std::runtime_error(fmt::format("frame of {} bytes exceeds the {} byte limit",
                                                     frame_size,
                                                     transfer::kMaxFrameSize));
            }

            BinaryMessage frame(frame_size);
            co_await net::async_read(socket_, net::buffer(frame), net::use_awaitable);
            emitMessage(DecodeMessage(frame));
            if (closing_) {
                co_return;
            }
        }
    } catch (const boost::system::system_error& e) {
        if (closing_) {
            co_return;
        }
        if (e.code() == net::error::eof || e.code() == net::error::connection_reset) {
            spdlog::info("Peer {} closed the channel", remote_address_);
            open_ = false;
            closing_ = true;
            closeSocket();
            emitClose();
            co_return;
        }
        failure = e.what();
    } catch (const std::runtime_error& e) {
        failure = e.what();
    }
    fail(failure);
}

void TcpChannel::fail(const std::string& detail) {
    if (closing_) {
        return;
    }
    spdlog::error("Channel to {} failed: {}", remote_address_, detail);
    open_ = false;
    closing_ = true;
    closeSocket();
    emitError(detail);
    emitClose();
}

void TcpChannel::closeSocket() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected) {
        spdlog::debug("Socket shutdown notice: {}", ec.message());
    }
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Socket close notice: {}", ec.message());
    }
}

} // namespace peerdrop::core
