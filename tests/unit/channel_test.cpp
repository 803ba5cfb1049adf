#include <gtest/gtest.h>

#include <atomic>
#include <string>

#include "src/concurrency/channel.hpp"

using concurrency::Channel;
using concurrency::RecvStatus;

TEST(ChannelTest, DeliversInOrder) {
    auto [sender, receiver] = Channel<int>::create();
    ASSERT_TRUE(sender.send(1));
    ASSERT_TRUE(sender.send(2));

    int value = 0;
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::ITEM);
    EXPECT_EQ(value, 1);
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::ITEM);
    EXPECT_EQ(value, 2);
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::EMPTY);
}

TEST(ChannelTest, ClosedSenderDrainsThenReportsClosed) {
    auto [sender, receiver] = Channel<std::string>::create();
    ASSERT_TRUE(sender.send("last"));
    sender.close();

    EXPECT_FALSE(sender.send("after"));
    EXPECT_TRUE(sender.is_closed());

    std::string value;
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::ITEM);
    EXPECT_EQ(value, "last");
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::CLOSED);
}

TEST(ChannelTest, DestroyingTheSenderClosesIt) {
    auto [sender, receiver] = Channel<int>::create();
    {
        auto moved = std::move(sender);
        ASSERT_TRUE(moved.send(7));
    }

    int value = 0;
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::ITEM);
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::CLOSED);
}

TEST(ChannelTest, ClosedReceiverMakesSendFail) {
    auto [sender, receiver] = Channel<int>::create();
    ASSERT_TRUE(sender.send(1));
    receiver.close();

    EXPECT_FALSE(sender.send(2));
    EXPECT_TRUE(sender.is_closed());

    int value = 0;
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::CLOSED);
}

TEST(ChannelTest, NotifyFiresOnSendAndClose) {
    auto [sender, receiver] = Channel<int>::create();
    std::atomic<int> notified = 0;
    receiver.set_notify([&notified]() { ++notified; });

    ASSERT_TRUE(sender.send(1));
    ASSERT_TRUE(sender.send(2));
    sender.close();
    sender.close();

    EXPECT_EQ(notified.load(), 3);
}

TEST(ChannelTest, DefaultConstructedEndsAreClosed) {
    Channel<int>::Sender sender;
    Channel<int>::Receiver receiver;
    int value = 0;

    EXPECT_FALSE(sender.send(1));
    EXPECT_TRUE(sender.is_closed());
    EXPECT_EQ(receiver.try_recv(value), RecvStatus::CLOSED);
}
