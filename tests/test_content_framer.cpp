//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for the newline-delimited frame codec
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "mcpstdio/ContentFramer.h"

using mcpstdio::IContentFramer;

TEST(LineFramerTest, EncodeAppendsSingleNewline) {
    auto framer = mcpstdio::MakeLineFramer(1024);
    EXPECT_EQ(framer->encode("{}"), std::string("{}\n"));
}

TEST(LineFramerTest, EncodeRefusesEmbeddedLineBreaks) {
    auto framer = mcpstdio::MakeLineFramer(1024);
    EXPECT_THROW(framer->encode("{\"a\":\n1}"), std::invalid_argument);
    EXPECT_THROW(framer->encode("{}\r"), std::invalid_argument);
}

TEST(LineFramerTest, DecodesOneLineAtATime) {
    auto framer = mcpstdio::MakeLineFramer(1024);
    std::string buffer = "{\"a\":1}\n{\"b\":2}\n";
    auto first = framer->tryDecodeEx(buffer);
    ASSERT_EQ(first.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(first.payload.value(), "{\"a\":1}");
    EXPECT_EQ(first.bytesConsumed, 8u);
    buffer.erase(0, first.bytesConsumed);
    auto second = framer->tryDecodeEx(buffer);
    ASSERT_EQ(second.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(second.payload.value(), "{\"b\":2}");
}

TEST(LineFramerTest, StripsCarriageReturn) {
    auto framer = mcpstdio::MakeLineFramer(1024);
    auto ex = framer->tryDecodeEx("{}\r\n");
    ASSERT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(ex.payload.value(), "{}");
    EXPECT_EQ(ex.bytesConsumed, 4u);
}

TEST(LineFramerTest, IncompleteWithoutNewline) {
    auto framer = mcpstdio::MakeLineFramer(1024);
    auto ex = framer->tryDecodeEx("{\"partial\":");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_EQ(ex.bytesConsumed, 0u);
}

TEST(LineFramerTest, BlankLinesAreSkipped) {
    auto framer = mcpstdio::MakeLineFramer(1024);
    auto ex = framer->tryDecodeEx(" \t\r\n{}\n");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Skip);
    EXPECT_EQ(ex.bytesConsumed, 4u);
}

TEST(LineFramerTest, OkAtBoundaryTooLargeAbove) {
    auto framer = mcpstdio::MakeLineFramer(4);
    auto ok = framer->tryDecodeEx("abcd\n");
    EXPECT_EQ(ok.status, IContentFramer::DecodeStatus::Ok);

    auto big = framer->tryDecodeEx("abcde\nnext\n");
    EXPECT_EQ(big.status, IContentFramer::DecodeStatus::TooLarge);
    EXPECT_FALSE(big.payload.has_value());
    EXPECT_EQ(big.bytesConsumed, 6u);
    EXPECT_FALSE(framer->discarding());
}

TEST(LineFramerTest, OversizedLineWithoutNewlineIsDiscardedToEndOfLine) {
    auto framer = mcpstdio::MakeLineFramer(4);
    auto big = framer->tryDecodeEx("abcdefgh");
    EXPECT_EQ(big.status, IContentFramer::DecodeStatus::TooLarge);
    EXPECT_EQ(big.bytesConsumed, 8u);
    EXPECT_TRUE(framer->discarding());

    auto more = framer->tryDecodeEx("ijkl");
    EXPECT_EQ(more.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(more.bytesConsumed, 4u);

    auto tail = framer->tryDecodeEx("mn\n{}\n");
    EXPECT_EQ(tail.status, IContentFramer::DecodeStatus::Skip);
    EXPECT_EQ(tail.bytesConsumed, 3u);
    EXPECT_FALSE(framer->discarding());

    auto next = framer->tryDecodeEx("{}\n");
    ASSERT_EQ(next.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(next.payload.value(), "{}");
}
