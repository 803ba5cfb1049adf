#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "src/http/error/http_error.hpp"
#include "src/http/request/handle.hpp"

using concurrency::AbortHandle;
using concurrency::RecvStatus;
using http::http_error::HandleError;
using http::model::ReadRequest;
using http::model::UploadCommand;
using http::model::UploadCommandKind;
using http::request::CommandChannel;
using http::request::ReadChannel;
using http::request::RequestHandle;

TEST(RequestHandleTest, WithoutQueuesEveryStreamOperationFails) {
    RequestHandle handle(AbortHandle{}, std::nullopt, std::nullopt);

    EXPECT_THROW(handle.send("x"), HandleError);
    EXPECT_THROW(handle.finish_send(), HandleError);
    EXPECT_THROW(handle.read(), HandleError);

    // Harmless without a task or queues.
    handle.cancel();
    handle.cancel_stream();
}

TEST(RequestHandleTest, SendAndFinishReachTheCommandQueue) {
    auto [sender, receiver] = CommandChannel::create();
    RequestHandle handle(AbortHandle{}, std::move(sender), std::nullopt);

    handle.send("part");
    handle.finish_send();

    UploadCommand command;
    ASSERT_EQ(receiver.try_recv(command), RecvStatus::ITEM);
    EXPECT_EQ(command.kind_, UploadCommandKind::SEND);
    EXPECT_EQ(command.data_, "part");
    ASSERT_EQ(receiver.try_recv(command), RecvStatus::ITEM);
    EXPECT_EQ(command.kind_, UploadCommandKind::FINISH_SEND);
    EXPECT_EQ(receiver.try_recv(command), RecvStatus::CLOSED);

    EXPECT_THROW(handle.send("more"), HandleError);
}

TEST(RequestHandleTest, EngineSideCloseMakesSendFail) {
    auto [sender, receiver] = CommandChannel::create();
    RequestHandle handle(AbortHandle{}, std::move(sender), std::nullopt);

    receiver.close();
    EXPECT_THROW(handle.send("x"), HandleError);
}

TEST(RequestHandleTest, ReadCarriesLengthAndPeriod) {
    auto [sender, receiver] = ReadChannel::create();
    RequestHandle handle(AbortHandle{}, std::nullopt, std::move(sender));

    handle.read(ReadRequest{.length_ = 40, .period_ = std::chrono::milliseconds(250)});
    handle.read();

    ReadRequest read;
    ASSERT_EQ(receiver.try_recv(read), RecvStatus::ITEM);
    EXPECT_EQ(read.length_, 40u);
    EXPECT_EQ(read.period_, std::chrono::milliseconds(250));
    ASSERT_EQ(receiver.try_recv(read), RecvStatus::ITEM);
    EXPECT_EQ(read.length_, http::model::ReadRequest{}.length_);
    EXPECT_FALSE(read.period_.has_value());
}

TEST(RequestHandleTest, CancelStreamClosesBothQueues) {
    auto [commands, command_receiver] = CommandChannel::create();
    auto [reads, read_receiver] = ReadChannel::create();
    RequestHandle handle(AbortHandle{}, std::move(commands), std::move(reads));

    handle.cancel_stream();

    UploadCommand command;
    ReadRequest read;
    EXPECT_EQ(command_receiver.try_recv(command), RecvStatus::CLOSED);
    EXPECT_EQ(read_receiver.try_recv(read), RecvStatus::CLOSED);
    EXPECT_THROW(handle.send("x"), HandleError);
    EXPECT_THROW(handle.read(), HandleError);
}
