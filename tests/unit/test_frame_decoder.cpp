#include <gtest/gtest.h>
#include "lspc/codec.hpp"
#include "lspc/error.hpp"

using namespace lspc;

TEST(FrameDecoder, SingleFrame) {
    FrameDecoder d;
    d.feed("Content-Length: 2\r\n\r\n{}");
    auto body = d.next();
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "{}");
    EXPECT_FALSE(d.next().has_value());
}

TEST(FrameDecoder, NeedsMoreInput) {
    FrameDecoder d;
    d.feed("Content-Len");
    EXPECT_FALSE(d.next().has_value());
    d.feed("gth: 4\r\n\r\n[1,");
    EXPECT_FALSE(d.next().has_value());
    d.feed("2]");
    auto body = d.next();
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "[1,2");
    EXPECT_EQ(d.buffered(), 1u);
}

TEST(FrameDecoder, ByteByByte) {
    const std::string frame = "Content-Length: 13\r\n\r\n{\"hello\":\"x\"}";
    FrameDecoder d;
    std::optional<std::string> body;
    for (char c : frame) {
        EXPECT_FALSE(body.has_value());
        d.feed(std::string_view(&c, 1));
        body = d.next();
    }
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "{\"hello\":\"x\"}");
}

TEST(FrameDecoder, SeveralFramesInOneChunk) {
    FrameDecoder d;
    d.feed("Content-Length: 1\r\n\r\n1Content-Length: 2\r\n\r\n22Content-Length: 3\r\n\r\n333");
    EXPECT_EQ(d.next().value(), "1");
    EXPECT_EQ(d.next().value(), "22");
    EXPECT_EQ(d.next().value(), "333");
    EXPECT_FALSE(d.next().has_value());
    EXPECT_EQ(d.buffered(), 0u);
}

TEST(FrameDecoder, OtherHeadersIgnored) {
    FrameDecoder d;
    d.feed("Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n"
           "Content-Length: 2\r\n"
           "X-Custom: 99\r\n\r\n{}");
    EXPECT_EQ(d.next().value(), "{}");
}

TEST(FrameDecoder, HeaderKeyIsCaseSensitive) {
    FrameDecoder d;
    d.feed("content-length: 2\r\n\r\n{}");
    EXPECT_THROW((void)d.next(), FramingError);
}

TEST(FrameDecoder, BareNewlinesAccepted) {
    FrameDecoder d;
    d.feed("Content-Length: 2\n\n{}");
    EXPECT_EQ(d.next().value(), "{}");
}

TEST(FrameDecoder, MissingContentLengthIsSkipped) {
    FrameDecoder d;
    d.feed("Content-Type: text/plain\r\n\r\nContent-Length: 2\r\n\r\n{}");
    EXPECT_THROW((void)d.next(), FramingError);
    // The bad header block was consumed; the next frame decodes normally.
    EXPECT_EQ(d.next().value(), "{}");
}

TEST(FrameDecoder, InvalidContentLengthIsSkipped) {
    FrameDecoder d;
    d.feed("Content-Length: abc\r\n\r\nContent-Length: 2\r\n\r\n{}");
    try {
        (void)d.next();
        FAIL() << "expected FramingError";
    } catch (const FramingError& e) {
        EXPECT_NE(std::string(e.what()).find("abc"), std::string::npos);
    }
    EXPECT_EQ(d.next().value(), "{}");
}

TEST(FrameDecoder, ZeroLengthIsSkipped) {
    FrameDecoder d;
    d.feed("Content-Length: 0\r\n\r\nContent-Length: 2\r\n\r\n{}");
    EXPECT_THROW((void)d.next(), FramingError);
    EXPECT_EQ(d.next().value(), "{}");
}

TEST(FrameDecoder, ValueWhitespaceTrimmed) {
    FrameDecoder d;
    d.feed("Content-Length:\t  2  \r\n\r\n{}");
    EXPECT_EQ(d.next().value(), "{}");
}

TEST(FrameDecoder, BodyIsExactlyContentLengthBytes) {
    // The body is 3 bytes but the header claims 5: the decoder must take two
    // bytes of the following header block as part of the body.
    FrameDecoder d;
    d.feed("Content-Length: 5\r\n\r\n[1]Content-Length: 2\r\n\r\n{}");
    EXPECT_EQ(d.next().value(), "[1]Co");

    // What is left starts mid-header; that block has no usable length.
    EXPECT_THROW((void)d.next(), FramingError);
    EXPECT_FALSE(d.next().has_value());
    EXPECT_EQ(d.buffered(), 2u);
}

TEST(FrameDecoder, BodyMayContainNewlinesAndHeaderText) {
    const std::string body = "{\"text\":\"a\\r\\n\\r\\nContent-Length: 9\"}";
    FrameDecoder d;
    d.feed(Codec::encode_frame(body));
    EXPECT_EQ(d.next().value(), body);
}
