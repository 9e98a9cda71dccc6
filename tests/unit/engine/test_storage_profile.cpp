/**
 * @file test_storage_profile.cpp
 * @brief Unit tests for region and endpoint normalization
 */

#include <gtest/gtest.h>

#include <cloudxfer/engine/storage_profile.h>

namespace cloudxfer::test {

// =============================================================================
// Region Tests
// =============================================================================

TEST(StorageProfileTest, RegionPrefixRemoved) {
    EXPECT_EQ(normalize_region("oss-cn-hangzhou"), "cn-hangzhou");
    EXPECT_EQ(normalize_region("  oss-us-west-1 "), "us-west-1");
}

TEST(StorageProfileTest, RegionWithoutPrefixUnchanged) {
    EXPECT_EQ(normalize_region("cn-beijing"), "cn-beijing");
    EXPECT_EQ(normalize_region(""), "");
}

// =============================================================================
// Endpoint Tests
// =============================================================================

TEST(StorageProfileTest, EndpointFromUrl) {
    EXPECT_EQ(normalize_endpoint("https://oss-cn-hangzhou.aliyuncs.com/"),
              "oss-cn-hangzhou.aliyuncs.com");
    EXPECT_EQ(normalize_endpoint("http://user:pw@example.com:8080/path?q=1#frag"),
              "example.com:8080");
}

TEST(StorageProfileTest, EndpointBareHost) {
    EXPECT_EQ(normalize_endpoint("oss-cn-hangzhou.aliyuncs.com"), "oss-cn-hangzhou.aliyuncs.com");
    EXPECT_EQ(normalize_endpoint(" example.com/extra "), "example.com");
    EXPECT_EQ(normalize_endpoint("example.com?x=1"), "example.com");
}

TEST(StorageProfileTest, EndpointTrailingDotStripped) {
    EXPECT_EQ(normalize_endpoint("example.com."), "example.com");
    EXPECT_EQ(normalize_endpoint("https://example.com./"), "example.com");
}

TEST(StorageProfileTest, EmptyEndpoint) {
    EXPECT_EQ(normalize_endpoint(""), "");
    EXPECT_EQ(normalize_endpoint("   "), "");
}

// =============================================================================
// Locator Tests
// =============================================================================

TEST(StorageProfileTest, RemoteLocator) {
    storage_profile profile;
    EXPECT_EQ(remote_locator(profile, "bucket", "dir/file.txt"), "oss://bucket/dir/file.txt");

    profile.scheme = "s3";
    EXPECT_EQ(remote_locator(profile, "b", "k"), "s3://b/k");

    profile.scheme.clear();
    EXPECT_EQ(remote_locator(profile, "b", "k"), "oss://b/k");
}

}  // namespace cloudxfer::test
