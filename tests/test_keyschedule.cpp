#include <gtest/gtest.h>

#include "aktk/keyschedule.hpp"

#include <algorithm>
#include <cstdint>

using aktk::cipher::BuildKeyString;
using aktk::cipher::DeriveKeyMaterial;

TEST(KeyScheduleTest, KeyStringFormat) {
    EXPECT_EQ(BuildKeyString("chara_001", 100, "abcdef0123456789", 12345), "chara_001-100-abcdef0123456789-12345");
    EXPECT_EQ(BuildKeyString("", 0, "", 0), "-0--0");
    EXPECT_EQ(BuildKeyString("b", 1, "h", -5), "b-1-h--5");
}

TEST(KeyScheduleTest, KnownKeyPrefix) {
    auto material = DeriveKeyMaterial("chara_001", 100, "abcdef0123456789", 12345);
    const std::uint8_t expected[] = {0xe8, 0x16, 0x15, 0x10, 0x0f, 0x1f, 0xb0, 0x0a};
    for (std::size_t i = 0; i < sizeof(expected); ++i) {
        EXPECT_EQ(material.key[i], expected[i]) << "byte " << i;
    }
}

TEST(KeyScheduleTest, PureFunction) {
    auto a = DeriveKeyMaterial("ui_common", 4096, "00ff", 99);
    auto b = DeriveKeyMaterial("ui_common", 4096, "00ff", 99);
    EXPECT_EQ(a.key, b.key);
    EXPECT_EQ(a.nonce_material, b.nonce_material);
}

TEST(KeyScheduleTest, EveryInputChangesMaterial) {
    auto base = DeriveKeyMaterial("ui_common", 4096, "00ff", 99);
    EXPECT_NE(base.key, DeriveKeyMaterial("ui_common2", 4096, "00ff", 99).key);
    EXPECT_NE(base.key, DeriveKeyMaterial("ui_common", 4097, "00ff", 99).key);
    EXPECT_NE(base.key, DeriveKeyMaterial("ui_common", 4096, "00fe", 99).key);
    EXPECT_NE(base.key, DeriveKeyMaterial("ui_common", 4096, "00ff", 98).key);
}

TEST(KeyScheduleTest, DescriptorUsesCatalogPlainSize) {
    aktk::BundleDescriptor bundle;
    bundle.bundle_name = "chara_001";
    bundle.content_hash = "abcdef0123456789";
    bundle.crc = 12345;
    bundle.file_size = 128;
    bundle.compression_mode = 3;

    auto from_bundle = DeriveKeyMaterial(bundle);
    auto direct = DeriveKeyMaterial("chara_001", 100, "abcdef0123456789", 12345);
    EXPECT_EQ(from_bundle.key, direct.key);
    EXPECT_EQ(from_bundle.nonce_material, direct.nonce_material);
}

TEST(KeyScheduleTest, NonceMaterialDiffersFromKey) {
    auto material = DeriveKeyMaterial("chara_001", 100, "abcdef0123456789", 12345);
    EXPECT_FALSE(std::equal(material.key.begin(), material.key.end(), material.nonce_material.begin()));
}
