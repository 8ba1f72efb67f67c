#include <gtest/gtest.h>

#include "aktk/cascade.hpp"
#include "aktk/keyschedule.hpp"
#include "aktk/stream_cipher.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace {

using aktk::cipher::CascadeKeystream;
using aktk::cipher::DeriveKeyMaterial;
using aktk::cipher::KeyMaterial;

std::vector<std::uint8_t> FromHex(const std::string& hex) {
    std::vector<std::uint8_t> out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

std::uint32_t LoadLe(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8)
           | (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

KeyMaterial SampleMaterial() {
    return DeriveKeyMaterial("chara_001", 100, "abcdef0123456789", 12345);
}

}  // namespace

TEST(CascadeNonceTest, FirstMegaBlockUsesFixedLanes) {
    KeyMaterial material = SampleMaterial();
    const std::uint8_t* pool = material.nonce_material.data();
    const std::uint32_t seed = LoadLe(pool + 0x30) ^ LoadLe(pool);

    auto nonce = aktk::cipher::DeriveMegaBlockNonce(material.nonce_material, 0);
    EXPECT_EQ(nonce[0], seed);
    EXPECT_EQ(nonce[1], seed ^ LoadLe(pool + 0x10));
    EXPECT_EQ(nonce[2], nonce[1] ^ LoadLe(pool + 0x20));
}

TEST(CascadeNonceTest, KnownNonceWords) {
    KeyMaterial material = SampleMaterial();
    auto n0 = aktk::cipher::DeriveMegaBlockNonce(material.nonce_material, 0);
    auto n1 = aktk::cipher::DeriveMegaBlockNonce(material.nonce_material, 1);
    EXPECT_EQ(n0[0], 0x9892254dU);
    EXPECT_EQ(n0[1], 0xed63b983U);
    EXPECT_EQ(n0[2], 0x626b67b5U);
    EXPECT_EQ(n1[0], 0x681210e1U);
    EXPECT_EQ(n1[1], 0x1de38c2fU);
    EXPECT_EQ(n1[2], 0x92eb5219U);
}

TEST(CascadeStateTest, LayoutMatchesConstantsKeyCounterNonce) {
    std::array<std::uint8_t, aktk::constants::kCipherKeyLen> key{};
    for (std::size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<std::uint8_t>(i);
    }
    auto state = aktk::cipher::SetupState(key, {7U, 8U, 9U}, 42U);
    EXPECT_EQ(state[0], 0x61707865U);
    EXPECT_EQ(state[3], 0x6b206574U);
    EXPECT_EQ(state[4], 0x03020100U);
    EXPECT_EQ(state[11], 0x1f1e1d1cU);
    EXPECT_EQ(state[12], 42U);
    EXPECT_EQ(state[13], 7U);
    EXPECT_EQ(state[14], 8U);
    EXPECT_EQ(state[15], 9U);
}

TEST(CascadeKeystreamTest, KnownAnswer) {
    CascadeKeystream stream(SampleMaterial());
    auto first = stream.NextMegaBlock();
    auto second = stream.NextMegaBlock();
    auto third = stream.NextMegaBlock();

    EXPECT_EQ(std::vector<std::uint8_t>(first.begin(), first.begin() + 16), FromHex("a9dced9919083f0531b4397e4e17ec8a"));
    EXPECT_EQ(std::vector<std::uint8_t>(second.begin(), second.begin() + 16), FromHex("39ebe486ef51d2417f93a00d8ecda504"));
    EXPECT_EQ(std::vector<std::uint8_t>(third.begin(), third.begin() + 16), FromHex("bf1470a2f165b6896c360cf3188493d6"));
    EXPECT_EQ(stream.counter(), 3U);
}

TEST(CascadeKeystreamTest, DeterministicAfterReset) {
    CascadeKeystream stream(SampleMaterial());
    auto first = stream.NextMegaBlock();
    auto second = stream.NextMegaBlock();
    EXPECT_NE(first, second);

    stream.Reset();
    EXPECT_EQ(stream.counter(), 0U);
    EXPECT_EQ(stream.NextMegaBlock(), first);
    EXPECT_EQ(stream.NextMegaBlock(), second);
}

TEST(CascadeKeystreamTest, BundleNamesDivergeOnFirstMegaBlock) {
    CascadeKeystream a(DeriveKeyMaterial("chara_001", 100, "abcdef0123456789", 12345));
    CascadeKeystream b(DeriveKeyMaterial("chara_002", 100, "abcdef0123456789", 12345));
    auto block_a = a.NextMegaBlock();
    auto block_b = b.NextMegaBlock();

    std::size_t differing = 0;
    for (std::size_t i = 0; i < block_a.size(); ++i) {
        differing += block_a[i] != block_b[i] ? 1 : 0;
    }
    EXPECT_GT(differing, block_a.size() / 2);
}

TEST(CascadeKeystreamTest, SubBlocksAreChained) {
    CascadeKeystream stream(SampleMaterial());
    auto block = stream.NextMegaBlock();
    for (std::size_t i = 1; i < aktk::constants::kSubBlockCount; ++i) {
        auto prev = block.begin() + static_cast<std::ptrdiff_t>((i - 1) * aktk::constants::kSubBlockSize);
        auto cur = block.begin() + static_cast<std::ptrdiff_t>(i * aktk::constants::kSubBlockSize);
        EXPECT_FALSE(std::equal(prev, prev + aktk::constants::kSubBlockSize, cur)) << "sub-block " << i;
    }
}

TEST(StreamCipherTest, ZeroInputYieldsKeystreamWithPartialTail) {
    KeyMaterial material = SampleMaterial();
    std::vector<std::uint8_t> zeros(1100, 0);
    auto out = aktk::cipher::ApplyKeystream(zeros, material);
    ASSERT_EQ(out.size(), zeros.size());

    CascadeKeystream stream(material);
    std::vector<std::uint8_t> expected;
    while (expected.size() < zeros.size()) {
        const auto& block = stream.NextMegaBlock();
        expected.insert(expected.end(), block.begin(), block.end());
    }
    expected.resize(zeros.size());
    EXPECT_EQ(out, expected);
}

TEST(StreamCipherTest, TransformIsItsOwnInverse) {
    KeyMaterial material = SampleMaterial();
    std::vector<std::uint8_t> plain(777);
    for (std::size_t i = 0; i < plain.size(); ++i) {
        plain[i] = static_cast<std::uint8_t>(i * 31 + 7);
    }
    auto encrypted = aktk::cipher::ApplyKeystream(plain, material);
    EXPECT_NE(encrypted, plain);
    EXPECT_EQ(aktk::cipher::ApplyKeystream(encrypted, material), plain);
}

TEST(StreamCipherTest, EmptyInput) {
    EXPECT_TRUE(aktk::cipher::ApplyKeystream(std::vector<std::uint8_t>{}, SampleMaterial()).empty());
}
