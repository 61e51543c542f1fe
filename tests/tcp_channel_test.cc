#include <arpa/inet.h>
#include <utility>  // before Boost.Asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <core/constant/transfer.h>
#include <core/network/tcp_channel.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace peerdrop;
using namespace peerdrop::core;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

class TcpChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        acceptor_ = std::make_unique<tcp::acceptor>(TcpChannel::Listen(ioc_, 0));
        port_ = acceptor_->local_endpoint().port();
    }

    // Accepts on one side and connects on the other, both channels started
    void ConnectPair() {
        // The closures must outlive the coroutines that run their bodies
        auto accept = [this]() -> net::awaitable<void> {
            server_ = co_await TcpChannel::Accept(*acceptor_);
            prepare(*server_, server_events_);
            server_->Start();
        };
        auto connect = [this]() -> net::awaitable<void> {
            client_ = co_await TcpChannel::Connect("127.0.0.1", port_);
            prepare(*client_, client_events_);
            client_->Start();
        };
        net::co_spawn(ioc_, accept(), net::detached);
        net::co_spawn(ioc_, connect(), net::detached);
        while ((!server_ || !client_) && ioc_.run_one() > 0) {
        }
        ASSERT_TRUE(server_);
        ASSERT_TRUE(client_);
    }

    void prepare(TcpChannel& channel, std::vector<std::string>& events) {
        channel.set_open_handler([&events] { events.push_back("open"); });
        channel.set_close_handler([&events] { events.push_back("close"); });
        channel.set_error_handler(
            [&events](const std::string&) { events.push_back("error"); });
        channel.set_message_handler([this, &events](Message message) {
            events.push_back(std::string(MessageKindToString(KindOf(message))));
            messages_.push_back(std::move(message));
        });
    }

    net::io_context ioc_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::uint16_t port_{0};
    std::shared_ptr<TcpChannel> server_;
    std::shared_ptr<TcpChannel> client_;
    std::vector<std::string> server_events_;
    std::vector<std::string> client_events_;
    std::vector<Message> messages_;
};

} // namespace

TEST_F(TcpChannelTest, StartEmitsOpen) {
    ConnectPair();
    EXPECT_TRUE(server_->IsOpen());
    EXPECT_TRUE(client_->IsOpen());
    ASSERT_FALSE(server_events_.empty());
    EXPECT_EQ(server_events_.front(), "open");
    EXPECT_EQ(client_events_.front(), "open");
}

TEST_F(TcpChannelTest, DeliversMessagesInOrder) {
    ConnectPair();
    BinaryData payload(transfer::kChunkSize, 0x5A);

    auto send_all = [&]() -> net::awaitable<void> {
        co_await server_->Send(
            MetadataMessage{FileMetadata{"a.bin", payload.size() * 2, "text/plain"}});
        co_await server_->Send(ChunkMessage{.index = 0, .data = payload, .is_last = false});
        co_await server_->Send(ChunkMessage{.index = 1, .data = payload, .is_last = true});
        co_await server_->Send(CompleteMessage{});
        server_->Close();
    };
    net::co_spawn(ioc_, send_all(), net::detached);
    ioc_.run();

    ASSERT_EQ(messages_.size(), 4);
    EXPECT_EQ(KindOf(messages_[0]), MessageKind::kMetadata);
    EXPECT_EQ(std::get<ChunkMessage>(messages_[1]).index, 0);
    EXPECT_EQ(std::get<ChunkMessage>(messages_[2]).data, payload);
    EXPECT_TRUE(std::get<ChunkMessage>(messages_[2]).is_last);
    EXPECT_EQ(KindOf(messages_[3]), MessageKind::kComplete);

    // Peer hang-up after the last frame is a plain close
    EXPECT_EQ(client_events_.back(), "close");
    EXPECT_FALSE(client_->IsOpen());
}

TEST_F(TcpChannelTest, LocalCloseEmitsNothingLocally) {
    ConnectPair();
    client_->Close();
    ioc_.run();

    EXPECT_FALSE(client_->IsOpen());
    EXPECT_EQ(client_events_, (std::vector<std::string>{"open"}));
    EXPECT_EQ(server_events_.back(), "close");
}

TEST_F(TcpChannelTest, SendOnClosedChannelThrows) {
    ConnectPair();
    client_->Close();

    bool threw = false;
    auto send = [&]() -> net::awaitable<void> {
        try {
            co_await client_->Send(CompleteMessage{});
        } catch (const boost::system::system_error&) {
            threw = true;
        }
    };
    net::co_spawn(ioc_, send(), net::detached);
    ioc_.run();
    EXPECT_TRUE(threw);
}

TEST_F(TcpChannelTest, OversizedFrameIsChannelError) {
    std::shared_ptr<TcpChannel> server;
    std::vector<std::string> events;
    auto accept = [&]() -> net::awaitable<void> {
        server = co_await TcpChannel::Accept(*acceptor_);
        prepare(*server, events);
        server->Start();
    };
    net::co_spawn(ioc_, accept(), net::detached);

    tcp::socket raw(ioc_);
    auto write_header = [&]() -> net::awaitable<void> {
        co_await raw.async_connect(tcp::endpoint(net::ip::address_v4::loopback(), port_),
                                   net::use_awaitable);
        std::uint32_t size = htonl(static_cast<std::uint32_t>(transfer::kMaxFrameSize + 1));
        co_await net::async_write(raw, net::buffer(&size, sizeof(size)), net::use_awaitable);
    };
    net::co_spawn(ioc_, write_header(), net::detached);
    ioc_.run();

    ASSERT_TRUE(server);
    EXPECT_FALSE(server->IsOpen());
    EXPECT_EQ(events, (std::vector<std::string>{"open", "error", "close"}));
}

TEST_F(TcpChannelTest, UndecodableFrameIsChannelError) {
    std::shared_ptr<TcpChannel> server;
    std::vector<std::string> events;
    auto accept = [&]() -> net::awaitable<void> {
        server = co_await TcpChannel::Accept(*acceptor_);
        prepare(*server, events);
        server->Start();
    };
    net::co_spawn(ioc_, accept(), net::detached);

    tcp::socket raw(ioc_);
    std::vector<std::uint8_t> frame{0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, 0x02, '{', '}', 0, 0};
    auto write_frame = [&]() -> net::awaitable<void> {
        co_await raw.async_connect(tcp::endpoint(net::ip::address_v4::loopback(), port_),
                                   net::use_awaitable);
        co_await net::async_write(raw, net::buffer(frame), net::use_awaitable);
    };
    net::co_spawn(ioc_, write_frame(), net::detached);
    ioc_.run();

    ASSERT_TRUE(server);
    EXPECT_EQ(events, (std::vector<std::string>{"open", "error", "close"}));
}
