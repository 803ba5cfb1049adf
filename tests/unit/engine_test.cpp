#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "fake_transport.hpp"
#include "src/http/client/client.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/request/reply.hpp"

using conduit_test::eventually;
using conduit_test::FakeTransport;
using conduit_test::next_reply;
using http::http_error::ErrorCode;
using http::model::BodyMode;
using http::model::Method;
using http::model::Request;
using http::model::RequestBody;
using http::request::ReplyKind;
using http::request::ReplyQueue;
using namespace std::chrono_literals;

namespace {
    Request make_request(Method method = Method::GET, RequestBody body = RequestBody::none()) {
        Request request;
        request.method_ = method;
        request.url_ = "http://example.test/echo";
        request.body_ = std::move(body);
        return request;
    }

    http::config::ClientConfig small_config() {
        http::config::ClientConfig config;
        config.worker_threads_ = 2;
        return config;
    }
}  // namespace

class EngineTest : public ::testing::Test {
   protected:
    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    std::unique_ptr<http::client::Client> client_ = std::make_unique<http::client::Client>(small_config(), transport_);
    std::shared_ptr<ReplyQueue> replies_ = std::make_shared<ReplyQueue>();
};

// ------------------------------------------------------------------
// Build phase
// ------------------------------------------------------------------

TEST_F(EngineTest, MalformedUrlRepliesUrlErrorWithoutTransport) {
    Request request = make_request();
    request.url_ = "not a url";

    auto handle = client_->start(std::move(request), "t1", replies_);

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::ERROR);
    EXPECT_TRUE(reply->terminal_);
    EXPECT_EQ(reply->token_, "t1");
    EXPECT_EQ(reply->error_->code_, ErrorCode::URL);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(EngineTest, InvalidHeaderNameRepliesRequestError) {
    Request request = make_request();
    request.headers_ = {{"bad header", "x"}};

    auto handle = client_->start(std::move(request), "t", replies_);

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::ERROR);
    EXPECT_EQ(reply->error_->code_, ErrorCode::REQUEST);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(EngineTest, MalformedBodyRepliesRequestError) {
    RequestBody body = RequestBody::complete("abc");
    body.well_formed_ = false;

    auto handle = client_->start(make_request(Method::POST, std::move(body)), "t", replies_);

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->error_->code_, ErrorCode::REQUEST);
    EXPECT_EQ(reply->error_->reason_, "bad request body");
}

TEST_F(EngineTest, PreparedRequestCarriesCanonicalHeadersAndBody) {
    Request request = make_request(Method::PUT, RequestBody::complete("hello"));
    request.headers_ = {{"Content-Type", "text/plain"}, {"X-Trace", "a\tb"}};
    request.timeout_ = 1500ms;

    auto handle = client_->start(std::move(request), "t", replies_);

    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);
    const auto& prepared = call->request();
    EXPECT_EQ(prepared.method_, Method::PUT);
    EXPECT_EQ(prepared.body_mode_, BodyMode::COMPLETE);
    EXPECT_EQ(prepared.body_, "hello");
    ASSERT_EQ(prepared.headers_.size(), 2u);
    EXPECT_EQ(prepared.headers_[0].first, "content-type");
    EXPECT_EQ(prepared.headers_[1].second, "a\tb");
    EXPECT_EQ(prepared.timeout_, 1500ms);
    EXPECT_EQ(call->upload(), nullptr);
}

// ------------------------------------------------------------------
// Complete response
// ------------------------------------------------------------------

TEST_F(EngineTest, CompleteResponseIsOneTerminalReply) {
    auto handle = client_->start(make_request(), "t", replies_);

    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);
    call->respond(200, {{"content-type", "text/plain"}});
    call->push_body("hello ");
    call->push_body("world");
    call->end_body();

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::REPLY);
    EXPECT_TRUE(reply->terminal_);
    EXPECT_EQ(reply->response_->status_, 200);
    ASSERT_EQ(reply->response_->headers_.size(), 1u);
    EXPECT_EQ(reply->response_->headers_[0].second, "text/plain");
    EXPECT_EQ(reply->response_->body_, "hello world");

    EXPECT_FALSE(next_reply(*replies_, 50ms).has_value());
    EXPECT_TRUE(eventually([this]() { return client_->running_requests() == 0; }));
}

TEST_F(EngineTest, TransportErrorIsTerminal) {
    auto handle = client_->start(make_request(), "t", replies_);

    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);
    call->fail(ErrorCode::CONNECT, "could not connect");

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::ERROR);
    EXPECT_EQ(reply->error_->code_, ErrorCode::CONNECT);
    EXPECT_EQ(reply->error_->reason_, "could not connect");
}

TEST_F(EngineTest, BodyErrorAfterHeadIsTerminal) {
    auto handle = client_->start(make_request(), "t", replies_);

    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);
    call->respond(200);
    call->push_body("partial");
    call->fail_body(ErrorCode::BODY, "connection reset");

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::ERROR);
    EXPECT_EQ(reply->error_->code_, ErrorCode::BODY);
    EXPECT_FALSE(next_reply(*replies_, 50ms).has_value());
}

// ------------------------------------------------------------------
// Cancellation
// ------------------------------------------------------------------

TEST_F(EngineTest, ImmediateCancelRepliesCancelledNeverReply) {
    auto handle = client_->start(make_request(), "t", replies_);
    handle->cancel();

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::ERROR);
    EXPECT_EQ(reply->error_->code_, ErrorCode::CANCELLED);
    EXPECT_FALSE(next_reply(*replies_, 50ms).has_value());
}

TEST_F(EngineTest, CancelTearsDownTheExchange) {
    auto handle = client_->start(make_request(), "t", replies_);
    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);

    handle->cancel();

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->error_->code_, ErrorCode::CANCELLED);
    EXPECT_TRUE(eventually([&call]() { return !call->exchange_alive(); }));
    EXPECT_TRUE(eventually([this]() { return client_->running_requests() == 0; }));
}

TEST_F(EngineTest, CancelIsIdempotentAndHarmlessAfterTerminalReply) {
    auto handle = client_->start(make_request(), "t", replies_);
    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);
    call->respond(204);
    call->end_body();

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::REPLY);

    handle->cancel();
    handle->cancel();
    EXPECT_FALSE(next_reply(*replies_, 100ms).has_value());
}

TEST_F(EngineTest, RepeatedCancelSendsOneCancelled) {
    auto handle = client_->start(make_request(), "t", replies_);
    handle->cancel();
    handle->cancel();

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->error_->code_, ErrorCode::CANCELLED);
    EXPECT_FALSE(next_reply(*replies_, 100ms).has_value());
}

TEST_F(EngineTest, CancelWithUnreachableCallerIsSilent) {
    auto handle = client_->start(make_request(), "t", replies_);
    ASSERT_NE(transport_->wait_for_call(), nullptr);

    replies_->close();
    handle->cancel();

    EXPECT_TRUE(eventually([this]() { return client_->running_requests() == 0; }));
    EXPECT_EQ(replies_->size(), 0u);
}

TEST_F(EngineTest, ShutdownCancelsRunningRequests) {
    auto handle = client_->start(make_request(), "t", replies_);
    ASSERT_NE(transport_->wait_for_call(), nullptr);

    client_->shutdown();

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->error_->code_, ErrorCode::CANCELLED);
    EXPECT_EQ(client_->running_requests(), 0u);
}

// ------------------------------------------------------------------
// Streamed request body
// ------------------------------------------------------------------

TEST_F(EngineTest, EchoTwoChunksThenFinish) {
    auto handle = client_->start(make_request(Method::POST, RequestBody::stream()), "echo", replies_);
    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);
    ASSERT_NE(call->upload(), nullptr);

    handle->send(std::string(10, 'a'));
    auto first = next_reply(*replies_);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind_, ReplyKind::NEXT);
    EXPECT_FALSE(first->terminal_);

    std::string received = call->drain_upload();
    handle->send(std::string(10, 'b'));
    auto second = next_reply(*replies_);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->kind_, ReplyKind::NEXT);

    handle->finish_send();
    received += call->drain_upload_to_end();
    ASSERT_EQ(received.size(), 20u);
    EXPECT_EQ(received, std::string(10, 'a') + std::string(10, 'b'));

    call->respond(200);
    call->push_body(received);
    call->end_body();

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::REPLY);
    EXPECT_TRUE(reply->terminal_);
    EXPECT_EQ(reply->response_->body_->size(), 20u);
    EXPECT_EQ(reply->token_, "echo");
}

TEST_F(EngineTest, NextWaitsForTheChunkToBeAccepted) {
    auto handle = client_->start(make_request(Method::POST, RequestBody::stream()), "t", replies_);
    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);

    handle->send("first");
    handle->send("second");

    auto first = next_reply(*replies_);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind_, ReplyKind::NEXT);

    // "second" cannot enter the channel while "first" occupies it.
    EXPECT_FALSE(next_reply(*replies_, 100ms).has_value());

    std::string received = call->drain_upload();
    auto second = next_reply(*replies_);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->kind_, ReplyKind::NEXT);

    received += call->drain_upload();
    EXPECT_EQ(received, "firstsecond");
}

TEST_F(EngineTest, ResponseWinsOverPendingUpload) {
    auto handle = client_->start(make_request(Method::POST, RequestBody::stream()), "t", replies_);
    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);

    handle->send("accepted");
    handle->send("never-read");
    auto next = next_reply(*replies_);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->kind_, ReplyKind::NEXT);

    call->respond(413);
    call->end_body();

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::REPLY);
    EXPECT_EQ(reply->response_->status_, 413);
    EXPECT_TRUE(call->upload()->is_closed());
    EXPECT_THROW(handle->send("late"), http::http_error::HandleError);
}

TEST_F(EngineTest, ResponseWhileIdleIsHeldUntilNextCommand) {
    auto handle = client_->start(make_request(Method::POST, RequestBody::stream()), "t", replies_);
    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);

    handle->send("chunk");
    ASSERT_EQ(next_reply(*replies_)->kind_, ReplyKind::NEXT);
    call->drain_upload();

    call->respond(200);
    call->end_body();
    EXPECT_FALSE(next_reply(*replies_, 100ms).has_value());

    handle->send("more");
    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->kind_, ReplyKind::REPLY);
    EXPECT_TRUE(reply->terminal_);
}

TEST_F(EngineTest, ClosingUploadBeforeFinishIsSilent) {
    auto handle = client_->start(make_request(Method::POST, RequestBody::stream()), "t", replies_);
    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);

    handle->send("chunk");
    ASSERT_EQ(next_reply(*replies_)->kind_, ReplyKind::NEXT);

    handle->cancel_stream();

    EXPECT_TRUE(eventually([this]() { return client_->running_requests() == 0; }));
    EXPECT_FALSE(next_reply(*replies_, 50ms).has_value());
    EXPECT_FALSE(call->exchange_alive());
}

TEST_F(EngineTest, DroppingTheHandleMidUploadIsSilent) {
    {
        auto handle = client_->start(make_request(Method::POST, RequestBody::stream()), "t", replies_);
        ASSERT_NE(transport_->wait_for_call(), nullptr);
    }

    EXPECT_TRUE(eventually([this]() { return client_->running_requests() == 0; }));
    EXPECT_FALSE(next_reply(*replies_, 50ms).has_value());
}

TEST_F(EngineTest, TransportErrorDropsExchangeBeforeClosingUpload) {
    auto handle = client_->start(make_request(Method::POST, RequestBody::stream()), "t", replies_);
    auto call = transport_->wait_for_call();
    ASSERT_NE(call, nullptr);

    handle->send("one");
    handle->send("two");
    ASSERT_EQ(next_reply(*replies_)->kind_, ReplyKind::NEXT);

    call->fail(ErrorCode::REQUEST, "send failed");

    auto reply = next_reply(*replies_);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->error_->code_, ErrorCode::REQUEST);
    EXPECT_FALSE(call->upload_closed_at_teardown());
    EXPECT_TRUE(call->upload()->is_closed());
}

TEST_F(EngineTest, SendFailsWithoutStreamedBody) {
    auto handle = client_->start(make_request(), "t", replies_);
    EXPECT_THROW(handle->send("x"), http::http_error::HandleError);
    EXPECT_THROW(handle->finish_send(), http::http_error::HandleError);
    EXPECT_THROW(handle->read(), http::http_error::HandleError);
    handle->cancel();
}
