#include <gtest/gtest.h>

#include <curl/curl.h>

#include "errors/errors.hpp"

using errors::ErrorKind;

TEST(ErrorsTest, HttpStatusClassification)
{
    EXPECT_EQ(errors::classifyHttpStatus(200), ErrorKind::None);
    EXPECT_EQ(errors::classifyHttpStatus(204), ErrorKind::None);
    EXPECT_EQ(errors::classifyHttpStatus(401), ErrorKind::Unauthenticated);
    EXPECT_EQ(errors::classifyHttpStatus(403), ErrorKind::Unauthenticated);
    EXPECT_EQ(errors::classifyHttpStatus(404), ErrorKind::NotFound);
    EXPECT_EQ(errors::classifyHttpStatus(409), ErrorKind::Conflict);
    EXPECT_EQ(errors::classifyHttpStatus(400), ErrorKind::Validation);
    EXPECT_EQ(errors::classifyHttpStatus(413), ErrorKind::Validation);
    EXPECT_EQ(errors::classifyHttpStatus(408), ErrorKind::TransientIO);
    EXPECT_EQ(errors::classifyHttpStatus(429), ErrorKind::TransientIO);
    EXPECT_EQ(errors::classifyHttpStatus(500), ErrorKind::TransientIO);
    EXPECT_EQ(errors::classifyHttpStatus(503), ErrorKind::TransientIO);
    EXPECT_EQ(errors::classifyHttpStatus(0), ErrorKind::TransientIO);
}

TEST(ErrorsTest, CurlCodeClassification)
{
    EXPECT_EQ(errors::classifyCurlCode(CURLE_OK), ErrorKind::None);
    EXPECT_EQ(errors::classifyCurlCode(CURLE_OPERATION_TIMEDOUT), ErrorKind::TransientIO);
    EXPECT_EQ(errors::classifyCurlCode(CURLE_COULDNT_CONNECT), ErrorKind::TransientIO);
    EXPECT_EQ(errors::classifyCurlCode(CURLE_COULDNT_RESOLVE_HOST), ErrorKind::TransientIO);
    EXPECT_EQ(errors::classifyCurlCode(CURLE_URL_MALFORMAT), ErrorKind::Validation);
    EXPECT_EQ(errors::classifyCurlCode(CURLE_READ_ERROR), ErrorKind::PermanentResource);
}

TEST(ErrorsTest, OnlyTransientIOIsRetryable)
{
    EXPECT_TRUE(errors::isRetryable(ErrorKind::TransientIO));
    EXPECT_FALSE(errors::isRetryable(ErrorKind::Validation));
    EXPECT_FALSE(errors::isRetryable(ErrorKind::PermanentResource));
    EXPECT_FALSE(errors::isRetryable(ErrorKind::NetworkUnavailable));
    EXPECT_FALSE(errors::isRetryable(ErrorKind::Unauthenticated));
    EXPECT_FALSE(errors::isRetryable(ErrorKind::Conflict));
    EXPECT_FALSE(errors::isRetryable(ErrorKind::Storage));
}

TEST(ErrorsTest, SyncErrorCarriesKind)
{
    try
    {
        throw errors::validationError("bad input");
    }
    catch (const std::runtime_error &e)
    {
        auto *sync = dynamic_cast<const errors::SyncError *>(&e);
        ASSERT_NE(sync, nullptr);
        EXPECT_EQ(sync->kind(), ErrorKind::Validation);
        EXPECT_STREQ(e.what(), "bad input");
    }
    EXPECT_EQ(errors::toString(ErrorKind::TransientIO), "TransientIOError");
}
