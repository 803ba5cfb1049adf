#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <stdexcept>
#include <string>

#include "src/http/request/upload_channel.hpp"

using http::request::UploadChannel;

namespace {
    std::string read_all(UploadChannel& channel, UploadChannel::ReadStatus* last = nullptr) {
        std::string out;
        std::array<char, 4> buffer{};
        while (true) {
            const auto result = channel.read(buffer.data(), buffer.size());
            if (result.status_ != UploadChannel::ReadStatus::DATA) {
                if (last != nullptr) {
                    *last = result.status_;
                }
                return out;
            }
            out.append(buffer.data(), result.bytes_);
        }
    }
}  // namespace

TEST(UploadChannelTest, FirstFeedIsAcceptedImmediately) {
    UploadChannel channel;
    std::atomic<int> wakeups = 0;
    channel.set_consumer_waker([&wakeups]() { ++wakeups; });

    EXPECT_EQ(channel.feed("hello", [] {}), UploadChannel::FeedResult::ACCEPTED);
    EXPECT_EQ(wakeups.load(), 1);

    UploadChannel::ReadStatus last{};
    EXPECT_EQ(read_all(channel, &last), "hello");
    EXPECT_EQ(last, UploadChannel::ReadStatus::WOULD_BLOCK);
}

TEST(UploadChannelTest, SecondFeedWaitsForTheSlotToDrain) {
    UploadChannel channel;
    std::atomic<bool> accepted = false;

    ASSERT_EQ(channel.feed("one", [] {}), UploadChannel::FeedResult::ACCEPTED);
    ASSERT_EQ(channel.feed("two", [&accepted]() { accepted = true; }), UploadChannel::FeedResult::PENDING);
    EXPECT_FALSE(accepted.load());

    std::array<char, 3> buffer{};
    ASSERT_EQ(channel.read(buffer.data(), buffer.size()).bytes_, 3u);
    EXPECT_TRUE(accepted.load());

    EXPECT_EQ(read_all(channel), "two");
}

TEST(UploadChannelTest, OnlyOneFeedMayBePending) {
    UploadChannel channel;
    ASSERT_EQ(channel.feed("one", [] {}), UploadChannel::FeedResult::ACCEPTED);
    ASSERT_EQ(channel.feed("two", [] {}), UploadChannel::FeedResult::PENDING);
    EXPECT_THROW((void)channel.feed("three", [] {}), std::logic_error);
}

TEST(UploadChannelTest, CloseKeepsAcceptedDataThenEnds) {
    UploadChannel channel;
    ASSERT_EQ(channel.feed("tail", [] {}), UploadChannel::FeedResult::ACCEPTED);
    channel.close();

    UploadChannel::ReadStatus last{};
    EXPECT_EQ(read_all(channel, &last), "tail");
    EXPECT_EQ(last, UploadChannel::ReadStatus::END);
    EXPECT_EQ(channel.feed("late", [] {}), UploadChannel::FeedResult::CLOSED);
}

TEST(UploadChannelTest, CloseAbandonsThePendingFeed) {
    UploadChannel channel;
    std::atomic<bool> accepted = false;
    ASSERT_EQ(channel.feed("one", [] {}), UploadChannel::FeedResult::ACCEPTED);
    ASSERT_EQ(channel.feed("two", [&accepted]() { accepted = true; }), UploadChannel::FeedResult::PENDING);

    channel.close();

    EXPECT_EQ(read_all(channel), "one");
    EXPECT_FALSE(accepted.load());
    EXPECT_TRUE(channel.is_closed());
}

TEST(UploadChannelTest, EmptyFeedIsAcceptedWithoutData) {
    UploadChannel channel;
    EXPECT_EQ(channel.feed("", [] {}), UploadChannel::FeedResult::ACCEPTED);

    std::array<char, 4> buffer{};
    EXPECT_EQ(channel.read(buffer.data(), buffer.size()).status_, UploadChannel::ReadStatus::WOULD_BLOCK);
}
