#include <gtest/gtest.h>

#include "aktk/constants.hpp"
#include "aktk/env.hpp"

#include <cstdlib>
#include <string>

namespace {

class EnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("AKTK_TEST_VALUE");
        unsetenv("AKTK_CONCURRENCY");
        unsetenv("AKTK_ASSET_BASE_URL");
    }
};

}  // namespace

TEST_F(EnvTest, UnsignedParsing) {
    unsetenv("AKTK_TEST_VALUE");
    EXPECT_EQ(aktk::env::GetUnsigned("AKTK_TEST_VALUE", 16), 16U);

    setenv("AKTK_TEST_VALUE", "32", 1);
    EXPECT_EQ(aktk::env::GetUnsigned("AKTK_TEST_VALUE", 16), 32U);

    for (const char* bad : {"0", "-4", "12abc", "abc", ""}) {
        setenv("AKTK_TEST_VALUE", bad, 1);
        EXPECT_EQ(aktk::env::GetUnsigned("AKTK_TEST_VALUE", 16), 16U) << "value '" << bad << "'";
    }
}

TEST_F(EnvTest, FlagParsing) {
    setenv("AKTK_TEST_VALUE", "Yes", 1);
    EXPECT_TRUE(aktk::env::IsEnabled("AKTK_TEST_VALUE"));
    setenv("AKTK_TEST_VALUE", "off", 1);
    EXPECT_FALSE(aktk::env::IsEnabled("AKTK_TEST_VALUE", true));
    unsetenv("AKTK_TEST_VALUE");
    EXPECT_TRUE(aktk::env::IsEnabled("AKTK_TEST_VALUE", true));
}

TEST_F(EnvTest, OverridesReachConfiguration) {
    EXPECT_EQ(aktk::constants::DefaultConcurrency(), aktk::constants::kDefaultConcurrency);
    setenv("AKTK_CONCURRENCY", "3", 1);
    EXPECT_EQ(aktk::constants::DefaultConcurrency(), 3U);

    EXPECT_EQ(aktk::constants::AssetBaseUrl(), std::string(aktk::constants::kAssetBaseUrl));
    setenv("AKTK_ASSET_BASE_URL", "http://127.0.0.1:8080/asset", 1);
    EXPECT_EQ(aktk::constants::AssetBaseUrl(), "http://127.0.0.1:8080/asset");
}
