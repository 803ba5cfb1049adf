#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "src/http/request/reply.hpp"

using http::http_error::ErrorCode;
using http::http_error::RequestError;
using http::model::Response;
using http::request::CallbackSink;
using http::request::Reply;
using http::request::ReplyKind;
using http::request::ReplyQueue;
using http::request::ReplySlot;

TEST(ReplySlotTest, InterimMessagesKeepTheSlotOpen) {
    auto queue = std::make_shared<ReplyQueue>();
    ReplySlot slot("tok", queue);

    slot.send_next();
    slot.send_chunk("abc");
    EXPECT_TRUE(slot.is_open());
    ASSERT_EQ(queue->size(), 2u);

    auto next = queue->try_pop();
    EXPECT_EQ(next->kind_, ReplyKind::NEXT);
    EXPECT_EQ(next->token_, "tok");
    EXPECT_FALSE(next->terminal_);
    EXPECT_EQ(queue->try_pop()->data_, "abc");
}

TEST(ReplySlotTest, PartialReplyDropsTheBody) {
    auto queue = std::make_shared<ReplyQueue>();
    ReplySlot slot("tok", queue);

    slot.send_partial(Response{.status_ = 200, .headers_ = {{"a", "b"}}, .body_ = "ignored"});
    auto reply = queue->try_pop();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::REPLY);
    EXPECT_FALSE(reply->terminal_);
    EXPECT_FALSE(reply->response_->body_.has_value());
}

TEST(ReplySlotTest, OnlyTheFirstTerminalReplyIsDelivered) {
    auto queue = std::make_shared<ReplyQueue>();
    ReplySlot slot("tok", queue);

    slot.fin("tail");
    slot.error(RequestError::from_reason(ErrorCode::CANCELLED, "cancelled"));
    slot.reply(Response{.status_ = 200});
    slot.send_chunk("late");

    EXPECT_FALSE(slot.is_open());
    ASSERT_EQ(queue->size(), 1u);
    auto fin = queue->try_pop();
    EXPECT_EQ(fin->kind_, ReplyKind::FIN);
    EXPECT_TRUE(fin->terminal_);
    EXPECT_EQ(fin->data_, "tail");
}

TEST(ReplySlotTest, ReleaseIsSilent) {
    auto queue = std::make_shared<ReplyQueue>();
    ReplySlot slot("tok", queue);

    slot.release();
    slot.error(RequestError::from_reason(ErrorCode::UNKNOWN, "x"));
    EXPECT_FALSE(slot.is_open());
    EXPECT_EQ(queue->size(), 0u);
}

TEST(ReplySlotTest, ReachabilityFollowsTheCaller) {
    auto queue = std::make_shared<ReplyQueue>();
    ReplySlot slot("tok", queue);
    EXPECT_TRUE(slot.is_caller_reachable());

    queue->close();
    EXPECT_FALSE(slot.is_caller_reachable());

    // Delivery to a gone caller is dropped without error.
    slot.error(RequestError::from_reason(ErrorCode::CANCELLED, "cancelled"));
    EXPECT_FALSE(slot.is_open());
    EXPECT_FALSE(queue->try_pop().has_value());
}

TEST(ReplySlotTest, CallbackSinkReceivesEveryReply) {
    std::vector<ReplyKind> kinds;
    auto sink = std::make_shared<CallbackSink>([&kinds](Reply reply) { kinds.push_back(reply.kind_); });
    ReplySlot slot("cb", sink);

    slot.send_next();
    slot.reply(Response{.status_ = 204});

    EXPECT_EQ(kinds, (std::vector<ReplyKind>{ReplyKind::NEXT, ReplyKind::REPLY}));
}

TEST(ReplyQueueTest, WaitForTimesOutWhenEmpty) {
    ReplyQueue queue;
    EXPECT_FALSE(queue.wait_for(std::chrono::milliseconds(10)).has_value());
}

TEST(ReplyQueueTest, ClosedQueueRefusesDelivery) {
    ReplyQueue queue;
    queue.close();
    EXPECT_FALSE(queue.deliver(Reply{}));
    EXPECT_FALSE(queue.is_reachable());
}

TEST(ReplyKindTest, Names) {
    EXPECT_STREQ(http::request::to_string(ReplyKind::NEXT), "next");
    EXPECT_STREQ(http::request::to_string(ReplyKind::FIN), "fin");
    EXPECT_STREQ(http::request::to_string(ReplyKind::ERROR), "error");
}
