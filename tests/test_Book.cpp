#include <gtest/gtest.h>

#include "Book.h"

TEST(Book, SupportedFormats) {
    for (const char* f : {"epub", "pdf", "txt", "md", "html", "mobi", "azw3"})
        EXPECT_TRUE(isSupportedFormat(f)) << f;
    EXPECT_FALSE(isSupportedFormat("EPUB"));
    EXPECT_FALSE(isSupportedFormat("docx"));
    EXPECT_FALSE(isSupportedFormat(""));
}

TEST(Book, ClientViewLeavesOutStorageDetails) {
    BookRecord b;
    b.id = "b1";
    b.title = "T";
    b.location = "books/b1/b1.epub";
    b.styles = "p{}";
    b.createdAt = 5;

    const Json::Value j = b.toJson();
    EXPECT_EQ(j["id"].asString(), "b1");
    EXPECT_TRUE(j["cover"].isNull());
    EXPECT_TRUE(j["parsedAt"].isNull());
    EXPECT_FALSE(j.isMember("location"));
    EXPECT_FALSE(j.isMember("styles"));
}

TEST(Book, ReadTimeDeltaWholeSeconds) {
    long long secs = -1;
    ASSERT_TRUE(readTimeDeltaFromJson(Json::Value(12), secs));
    EXPECT_EQ(secs, 12);
    ASSERT_TRUE(readTimeDeltaFromJson(Json::Value(7.9), secs));
    EXPECT_EQ(secs, 7);
    ASSERT_TRUE(readTimeDeltaFromJson(Json::Value(-3), secs));
    EXPECT_EQ(secs, 0);
}

TEST(Book, ReadTimeDeltaOutOfRangeIsClamped) {
    long long secs = -1;
    ASSERT_TRUE(readTimeDeltaFromJson(Json::Value(1e300), secs));
    EXPECT_EQ(secs, MAX_READ_TIME_DELTA);
    ASSERT_TRUE(readTimeDeltaFromJson(Json::Value(-1e300), secs));
    EXPECT_EQ(secs, 0);
    ASSERT_TRUE(readTimeDeltaFromJson(Json::Value(Json::UInt64(18446744073709551615ULL)), secs));
    EXPECT_EQ(secs, MAX_READ_TIME_DELTA);
}

TEST(Book, ReadTimeDeltaMustBeANumber) {
    long long secs = 0;
    EXPECT_FALSE(readTimeDeltaFromJson(Json::Value("10"), secs));
    EXPECT_FALSE(readTimeDeltaFromJson(Json::Value(true), secs));
    EXPECT_FALSE(readTimeDeltaFromJson(Json::Value(Json::objectValue), secs));
}
