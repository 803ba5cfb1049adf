#include <gtest/gtest.h>

#include <initializer_list>
#include <string_view>

#include "src/http/client/head_parser.hpp"

using http::client::HeadParser;

namespace {
    // Feeds one header block; returns true when it completed the final head.
    bool feed_block(HeadParser& parser, long status, std::initializer_list<std::string_view> lines) {
        bool complete = false;
        for (auto line : lines) {
            complete = parser.on_line(line, status);
        }
        return complete;
    }
}  // namespace

TEST(HeadParserTest, FinalBlockCompletesWithLowercasedNames) {
    HeadParser parser(true);
    EXPECT_TRUE(feed_block(parser, 200, {"HTTP/1.1 200 OK\r\n", "Content-Type: text/plain\r\n", "X-Trace: 7\r\n", "\r\n"}));

    const auto head = parser.take_head(200);
    EXPECT_TRUE(parser.is_complete());
    EXPECT_EQ(head.status_, 200);
    ASSERT_EQ(head.headers_.size(), 2u);
    EXPECT_EQ(head.headers_[0].first, "content-type");
    EXPECT_EQ(head.headers_[0].second, "text/plain");
    EXPECT_EQ(head.headers_[1].first, "x-trace");
}

TEST(HeadParserTest, InterimAndConnectBlocksAreSkipped) {
    HeadParser parser(true);
    EXPECT_FALSE(feed_block(parser, 0, {"HTTP/1.1 200 Connection established\r\n", "Proxy-Agent: squid\r\n", "\r\n"}));
    EXPECT_FALSE(feed_block(parser, 100, {"HTTP/1.1 100 Continue\r\n", "\r\n"}));
    EXPECT_FALSE(feed_block(parser, 103, {"HTTP/1.1 103 Early Hints\r\n", "Link: </a.css>\r\n", "\r\n"}));
    EXPECT_TRUE(feed_block(parser, 201, {"HTTP/1.1 201 Created\r\n", "Location: /items/1\r\n", "\r\n"}));

    const auto head = parser.take_head(201);
    ASSERT_EQ(head.headers_.size(), 1u);
    EXPECT_EQ(head.headers_[0].first, "location");
}

TEST(HeadParserTest, FollowedRedirectIsSkipped) {
    HeadParser parser(true);
    EXPECT_FALSE(feed_block(parser, 302, {"HTTP/1.1 302 Found\r\n", "Location: https://b.example/\r\n", "\r\n"}));
    EXPECT_TRUE(feed_block(parser, 200, {"HTTP/2 200\r\n", "Server: b\r\n", "\r\n"}));

    const auto head = parser.take_head(200);
    ASSERT_EQ(head.headers_.size(), 1u);
    EXPECT_EQ(head.headers_[0].first, "server");
}

TEST(HeadParserTest, RedirectIsFinalWhenNotFollowing) {
    HeadParser parser(false);
    EXPECT_TRUE(feed_block(parser, 302, {"HTTP/1.1 302 Found\r\n", "Location: https://b.example/\r\n", "\r\n"}));
    EXPECT_EQ(parser.take_head(302).status_, 302);
}

TEST(HeadParserTest, RedirectWithoutLocationIsFinal) {
    HeadParser parser(true);
    EXPECT_TRUE(feed_block(parser, 304, {"HTTP/1.1 304 Not Modified\r\n", "ETag: \"x\"\r\n", "\n"}));
}

TEST(HeadParserTest, FoldedLineExtendsPreviousValue) {
    HeadParser parser(true);
    ASSERT_TRUE(feed_block(parser, 200, {"HTTP/1.1 200 OK\r\n", "X-Long: first\r\n", "\t second \r\n", "\r\n"}));

    const auto head = parser.take_head(200);
    ASSERT_EQ(head.headers_.size(), 1u);
    EXPECT_EQ(head.headers_[0].second, "first second");
}

TEST(HeadParserTest, LinesAfterTheHeadAreIgnored) {
    HeadParser parser(true);
    ASSERT_TRUE(feed_block(parser, 200, {"HTTP/1.1 200 OK\r\n", "\r\n"}));
    parser.take_head(200);

    // Trailers arrive through the same callback.
    EXPECT_FALSE(feed_block(parser, 200, {"Checksum: abc\r\n", "\r\n"}));
}

TEST(HeadParserTest, TakeHeadWithoutBlankLineKeepsCollectedHeaders) {
    HeadParser parser(true);
    EXPECT_FALSE(feed_block(parser, 200, {"HTTP/1.0 200 OK\r\n", "Content-Length: 3\r\n"}));
    EXPECT_FALSE(parser.is_complete());

    const auto head = parser.take_head(200);
    ASSERT_EQ(head.headers_.size(), 1u);
    EXPECT_EQ(head.headers_[0].first, "content-length");
}
