#include <utility>  // before Boost.Asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/network/loopback_channel.h>
#include <core/transfer/file_sender.h>
#include <gtest/gtest.h>
#include <tuple>
#include <vector>

using namespace peerdrop;
using namespace peerdrop::core;
using namespace std::chrono_literals;
namespace net = boost::asio;

namespace {

OutgoingFile MakeFile(std::size_t size) {
    OutgoingFile file;
    file.metadata = FileMetadata{"photo.png", size, "image/png"};
    file.bytes.resize(size);
    for (std::size_t i = 0; i < size; ++i) {
        file.bytes[i] = static_cast<std::uint8_t>(i % 253);
    }
    return file;
}

class FileSenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::tie(local_, remote_) = LoopbackChannel::CreatePair(ioc_);
        remote_->set_message_handler([this](Message message) {
            received_.push_back(std::move(message));
        });
        subscription_ = progress_.Subscribe([this](const ProgressChannel::Value& value) {
            if (value) {
                statuses_.push_back(*value);
            }
        });
    }

    std::error_code RunSend(OutgoingFile file) {
        std::error_code result = make_error_code(TransferError::kChannelError);
        bool done = false;
        net::co_spawn(ioc_,
                      sender_.Send(*local_, std::move(file)),
                      [&](std::exception_ptr e, std::error_code ec) {
                          ASSERT_FALSE(e);
                          result = ec;
                          done = true;
                      });
        ioc_.run();
        EXPECT_TRUE(done);
        return result;
    }

    std::size_t CountKind(MessageKind kind) const {
        std::size_t count = 0;
        for (const auto& message : received_) {
            if (KindOf(message) == kind) {
                ++count;
            }
        }
        return count;
    }

    net::io_context ioc_;
    std::shared_ptr<LoopbackChannel> local_;
    std::shared_ptr<LoopbackChannel> remote_;
    ProgressChannel progress_;
    FileSender sender_{progress_, 0ms};
    ProgressChannel::Subscription subscription_;
    std::vector<Message> received_;
    std::vector<TransferStatus> statuses_;
};

} // namespace

TEST_F(FileSenderTest, SendsMetadataThenOrderedChunksThenCompletion) {
    local_->Open();
    auto file = MakeFile(2 * 16384 + 5);
    auto expected = file.bytes;

    EXPECT_FALSE(RunSend(std::move(file)));

    ASSERT_EQ(received_.size(), 5);
    ASSERT_EQ(KindOf(received_.front()), MessageKind::kMetadata);
    const auto& metadata = std::get<MetadataMessage>(received_.front()).metadata;
    EXPECT_EQ(metadata.file_name, "photo.png");
    EXPECT_EQ(metadata.file_size, expected.size());
    EXPECT_EQ(metadata.mime_type, "image/png");

    BinaryData joined;
    for (std::uint32_t i = 0; i < 3; ++i) {
        const auto& chunk = std::get<ChunkMessage>(received_[i + 1]);
        EXPECT_EQ(chunk.index, i);
        EXPECT_EQ(chunk.is_last, i == 2);
        EXPECT_LE(chunk.data.size(), transfer::kChunkSize);
        joined.insert(joined.end(), chunk.data.begin(), chunk.data.end());
    }
    EXPECT_EQ(joined, expected);
    EXPECT_EQ(KindOf(received_.back()), MessageKind::kComplete);
}

TEST_F(FileSenderTest, PublishesMonotonicProgress) {
    local_->Open();
    EXPECT_FALSE(RunSend(MakeFile(10 * 16384 + 7)));

    ASSERT_GE(statuses_.size(), 2);
    EXPECT_EQ(statuses_.front().phase, TransferPhase::kTransferring);
    EXPECT_EQ(statuses_.front().bytes_transferred, 0);

    std::uint64_t previous = 0;
    for (const auto& status : statuses_) {
        EXPECT_GE(status.bytes_transferred, previous);
        EXPECT_EQ(status.total_bytes, 10 * 16384 + 7);
        previous = status.bytes_transferred;
    }
    EXPECT_EQ(statuses_.back().phase, TransferPhase::kCompleted);
    EXPECT_EQ(statuses_.back().percentage, 100);
    EXPECT_EQ(statuses_.back().payload, nullptr);
    // Metadata, eleven chunks, completion
    EXPECT_EQ(statuses_.size(), 13);
}

TEST_F(FileSenderTest, ClosedChannelIsNotReady) {
    auto result = RunSend(MakeFile(100));

    EXPECT_EQ(result, make_error_code(TransferError::kChannelNotReady));
    EXPECT_TRUE(received_.empty());
    EXPECT_TRUE(statuses_.empty());
    EXPECT_FALSE(sender_.is_sending());
}

TEST_F(FileSenderTest, EmptyFileSendsNoChunks) {
    local_->Open();
    EXPECT_FALSE(RunSend(MakeFile(0)));

    ASSERT_EQ(received_.size(), 2);
    EXPECT_EQ(KindOf(received_[0]), MessageKind::kMetadata);
    EXPECT_EQ(KindOf(received_[1]), MessageKind::kComplete);
    EXPECT_EQ(CountKind(MessageKind::kChunk), 0);
    EXPECT_EQ(statuses_.back().phase, TransferPhase::kCompleted);
    EXPECT_EQ(statuses_.back().percentage, 100);
}

TEST_F(FileSenderTest, WaitsPacingDelayBetweenChunks) {
    local_->Open();
    sender_.set_pacing_delay(20ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(RunSend(MakeFile(4 * 16384)));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 60ms);
    EXPECT_EQ(CountKind(MessageKind::kChunk), 4);
}

TEST_F(FileSenderTest, CancelStopsBeforeNextChunk) {
    local_->Open();
    auto cancel_on_progress = progress_.Subscribe([this](const ProgressChannel::Value& value) {
        if (value && value->bytes_transferred >= 16384) {
            sender_.Cancel();
        }
    });

    auto result = RunSend(MakeFile(5 * 16384));

    EXPECT_EQ(result, make_error_code(TransferError::kCancelled));
    EXPECT_EQ(CountKind(MessageKind::kChunk), 1);
    EXPECT_EQ(CountKind(MessageKind::kComplete), 0);
    for (const auto& status : statuses_) {
        EXPECT_NE(status.phase, TransferPhase::kErrored);
        EXPECT_NE(status.phase, TransferPhase::kCompleted);
    }
    EXPECT_FALSE(sender_.is_sending());
}

TEST_F(FileSenderTest, CancelWakesPacingTimer) {
    local_->Open();
    sender_.set_pacing_delay(10s);
    net::steady_timer cancel_timer(ioc_, 50ms);
    cancel_timer.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            sender_.Cancel(TransferError::kTimedOut, "no progress");
        }
    });

    auto start = std::chrono::steady_clock::now();
    auto result = RunSend(MakeFile(3 * 16384));

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(result, make_error_code(TransferError::kTimedOut));
    EXPECT_EQ(CountKind(MessageKind::kChunk), 1);
    ASSERT_FALSE(statuses_.empty());
    EXPECT_EQ(statuses_.back().phase, TransferPhase::kErrored);
    EXPECT_EQ(statuses_.back().error, TransferError::kTimedOut);
    EXPECT_EQ(statuses_.back().error_detail, "no progress");
}

TEST_F(FileSenderTest, PeerCloseIsChannelError) {
    local_->Open();
    remote_->set_message_handler([this](Message message) {
        received_.push_back(std::move(message));
        if (KindOf(received_.back()) == MessageKind::kChunk) {
            remote_->Close();
        }
    });

    auto result = RunSend(MakeFile(5 * 16384));

    EXPECT_EQ(result, make_error_code(TransferError::kChannelError));
    EXPECT_EQ(CountKind(MessageKind::kComplete), 0);
    ASSERT_FALSE(statuses_.empty());
    EXPECT_EQ(statuses_.back().phase, TransferPhase::kErrored);
    EXPECT_EQ(statuses_.back().error, TransferError::kChannelError);
}
