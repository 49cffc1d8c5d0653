// Unit coverage for the neutral cover entry helpers.
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cover_reference.hpp"

using namespace tagmerge;

TEST(CoverReference, EmbeddedCoverKeepsBytesAndMime) {
    const std::vector<unsigned char> bytes = {0xFF, 0xD8, 0xFF, 0xE0, 0x00};
    const CoverPicture cover = make_embedded_cover(bytes, "image/jpeg");

    EXPECT_EQ(cover.data, bytes);
    EXPECT_EQ(cover.mime_type, "image/jpeg");
    EXPECT_EQ(cover.description, "Front cover");
    EXPECT_EQ(cover.picture_type, 3);
    EXPECT_FALSE(is_url_reference(cover));
    EXPECT_FALSE(cover_url(cover).has_value());
}

TEST(CoverReference, UrlCoverUsesSentinelMime) {
    const CoverPicture cover = make_url_cover("https://x/y.jpg");

    EXPECT_EQ(cover.mime_type, "-->");
    EXPECT_EQ(std::string(cover.data.begin(), cover.data.end()), "https://x/y.jpg");
    EXPECT_EQ(cover.picture_type, kFrontCoverPictureType);
    EXPECT_TRUE(is_url_reference(cover));
    ASSERT_TRUE(cover_url(cover).has_value());
    EXPECT_EQ(*cover_url(cover), "https://x/y.jpg");
}

TEST(CoverReference, SentinelIsExactlyThreeBytes) {
    EXPECT_EQ(kUrlMimeSentinel.size(), 3u);
    EXPECT_EQ(kUrlMimeSentinel, "-->");
}

TEST(CoverReference, EmptyUrlStillMarkedAsReference) {
    const CoverPicture cover = make_url_cover("");
    EXPECT_TRUE(cover.data.empty());
    EXPECT_TRUE(is_url_reference(cover));
    EXPECT_EQ(cover_url(cover).value_or("unset"), "");
}
