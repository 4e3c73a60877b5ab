//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for the Content-Length, newline and auto-detecting framers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcptest/ContentFramer.h"

using mcptest::IContentFramer;

TEST(ContentLengthFramerTest, EncodeProducesExpectedHeader) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    const std::string payload = "{}";
    const std::string frame = framer->encode(payload);
    EXPECT_EQ(frame, std::string("Content-Length: 2\r\n\r\n{}"));
}

TEST(ContentLengthFramerTest, TryDecodeExOkAtBoundary) {
    auto framer = mcptest::MakeContentLengthFramer(4);
    const std::string payload = "abcd";
    std::string buffer = std::string("Content-Length: 4\r\n\r\n") + payload;
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(ex.payload.value(), payload);
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(ContentLengthFramerTest, BodyTooLargeSkipsBodyAndRecovers) {
    auto framer = mcptest::MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 5\r\n\r\nabcdeContent-Length: 2\r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_GT(ex.bytesConsumed, 0u);
    buffer.erase(0, ex.bytesConsumed);

    // The oversized body is dropped before the next frame is decoded
    auto next = framer->tryDecode(buffer);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), "{}");
    EXPECT_TRUE(buffer.empty());
}

TEST(ContentLengthFramerTest, BodyTooLargeAcrossReads) {
    auto framer = mcptest::MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 8\r\n\r\nabc";
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "abc");
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_TRUE(buffer.empty());
    buffer = "defghContent-Length: 1\r\n\r\n1";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "1");
}

TEST(ContentLengthFramerTest, TryDecodeExInvalidHeader) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: abc\r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_EQ(ex.bytesConsumed, std::string("Content-Length: abc\r\n\r\n").size());
}

TEST(ContentLengthFramerTest, MissingLengthIsInvalidHeader) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Type: application/json\r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::InvalidHeader);
}

TEST(ContentLengthFramerTest, TryDecodeExIncompleteHeader) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Leng";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_EQ(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, DecodeSingleFrame) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 2\r\n\r\n{}";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "{}");
    EXPECT_TRUE(buffer.empty());
}

TEST(ContentLengthFramerTest, DecodeIncompleteHeaderReturnsNullopt) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Leng"; // no CRLF CRLF yet
    auto decoded = framer->tryDecode(buffer);
    EXPECT_FALSE(decoded.has_value());
    EXPECT_EQ(buffer, std::string("Content-Leng")); // unchanged
}

TEST(ContentLengthFramerTest, DecodeIncompleteBodyKeepsBuffer) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 10\r\n\r\n{\"a\":";
    auto decoded = framer->tryDecode(buffer);
    EXPECT_FALSE(decoded.has_value());
    EXPECT_EQ(buffer, std::string("Content-Length: 10\r\n\r\n{\"a\":"));
}

TEST(ContentLengthFramerTest, HeaderNameIsCaseInsensitive) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    std::string buffer = "content-length:2\r\nContent-Type: application/json\r\n\r\n[]";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "[]");
}

TEST(ContentLengthFramerTest, DecodeTwoFramesBackToBack) {
    auto framer = mcptest::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 1\r\n\r\n1Content-Length: 1\r\n\r\n2";
    auto first = framer->tryDecode(buffer);
    auto second = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), "1");
    EXPECT_EQ(second.value(), "2");
    EXPECT_TRUE(buffer.empty());
}

TEST(NewlineFramerTest, EncodeAppendsNewline) {
    auto framer = mcptest::MakeNewlineFramer();
    EXPECT_EQ(framer->encode("{\"a\":1}"), "{\"a\":1}\n");
}

TEST(NewlineFramerTest, DecodeStripsCarriageReturn) {
    auto framer = mcptest::MakeNewlineFramer();
    std::string buffer = "{\"a\":1}\r\n{\"b\":2}\n{\"c\"";
    auto first = framer->tryDecode(buffer);
    auto second = framer->tryDecode(buffer);
    auto third = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), "{\"a\":1}");
    EXPECT_EQ(second.value(), "{\"b\":2}");
    EXPECT_FALSE(third.has_value());
    EXPECT_EQ(buffer, "{\"c\"");
}

TEST(NewlineFramerTest, OversizedLineIsDiscardedUntilNewline) {
    auto framer = mcptest::MakeNewlineFramer(8);
    std::string buffer = "0123456789abcdef";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, buffer.size());

    std::string rest = "tail\n{}\n";
    EXPECT_FALSE(framer->tryDecode(rest).has_value());
    auto decoded = framer->tryDecode(rest);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "{}");
}

TEST(NewlineFramerTest, OversizedCompleteLineIsRejected) {
    auto framer = mcptest::MakeNewlineFramer(4);
    std::string buffer = "123456\n{}\n";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, 7u);
}

TEST(AutoDetectFramerTest, DetectsNewlineFraming) {
    auto framer = mcptest::MakeAutoDetectFramer();
    std::string buffer = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(framer->encode("{}"), "{}\n");
}

TEST(AutoDetectFramerTest, DetectsContentLengthFraming) {
    auto framer = mcptest::MakeAutoDetectFramer();
    std::string buffer = "Content-Length: 2\r\n\r\n{}";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "{}");
    EXPECT_EQ(framer->encode("[]"), "Content-Length: 2\r\n\r\n[]");
}

TEST(AutoDetectFramerTest, WaitsForEnoughBytesToDecide) {
    auto framer = mcptest::MakeAutoDetectFramer();
    std::string buffer = "Content";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
    // Undecided framers answer with newline framing
    EXPECT_EQ(framer->encode("{}"), "{}\n");
}

TEST(AutoDetectFramerTest, LeadingBlankLineBeforeHeader) {
    auto framer = mcptest::MakeAutoDetectFramer();
    std::string buffer = "\r\nContent-Length: 2\r\n\r\n{}";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "{}");
}

TEST(FramingModeTest, ParsesNames) {
    EXPECT_EQ(mcptest::framingModeFromString("AUTO"), mcptest::FramingMode::Auto);
    EXPECT_EQ(mcptest::framingModeFromString("ndjson"), mcptest::FramingMode::Newline);
    EXPECT_EQ(mcptest::framingModeFromString("Content-Length"), mcptest::FramingMode::ContentLength);
    EXPECT_FALSE(mcptest::framingModeFromString("lsp").has_value());
    EXPECT_STREQ(mcptest::framingModeName(mcptest::FramingMode::Newline), "newline");
}
