#include <gtest/gtest.h>

#include "transport/transport.hpp"

using errors::ErrorKind;

TEST(ChunkResponseTest, AcknowledgedChunk)
{
    auto res = transport::parseChunkResponse(200, R"({"chunkUploaded": true, "nextOffset": 5242880})");
    EXPECT_TRUE(res.success);
    EXPECT_TRUE(res.chunkUploaded);
    ASSERT_TRUE(res.nextOffset.has_value());
    EXPECT_EQ(*res.nextOffset, 5242880);
    EXPECT_EQ(res.kind, ErrorKind::None);
}

TEST(ChunkResponseTest, NotAcknowledgedIsTransient)
{
    auto res = transport::parseChunkResponse(200, R"({"chunkUploaded": false})");
    EXPECT_FALSE(res.chunkUploaded);
    EXPECT_EQ(res.kind, ErrorKind::TransientIO);
}

TEST(ChunkResponseTest, MalformedBodyIsTransient)
{
    auto res = transport::parseChunkResponse(200, "<html>proxy error</html>");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.kind, ErrorKind::TransientIO);
}

TEST(ChunkResponseTest, HttpErrorsAreClassified)
{
    EXPECT_EQ(transport::parseChunkResponse(401, "").kind, ErrorKind::Unauthenticated);
    EXPECT_EQ(transport::parseChunkResponse(503, "").kind, ErrorKind::TransientIO);
    EXPECT_EQ(transport::parseChunkResponse(400, "").kind, ErrorKind::Validation);
    EXPECT_FALSE(transport::parseChunkResponse(500, R"({"chunkUploaded": true})").chunkUploaded);
}
