#include "aktk/cascade.hpp"

#include "aktk/crypto_utils.hpp"

#include <algorithm>

namespace aktk::cipher {

namespace {

using aktk::crypto::detail::LoadU32Le;
using aktk::crypto::detail::StoreU32Le;

constexpr std::uint32_t kIndexModulus = 0xD;
constexpr std::uint32_t kStrideA = 0xA9;
constexpr std::uint32_t kStrideB = 0x895;
constexpr std::uint32_t kRotationPeriod = 0x93E;
constexpr std::uint32_t kRotationModulus = 0x1B;
constexpr std::uint32_t kXorLane1 = 0x10;
constexpr std::uint32_t kXorLane2 = 0x20;
constexpr std::uint32_t kSeedLane = 0x30;

constexpr std::array<std::uint32_t, 4> kSigma = {0x61707865U, 0x3320646eU, 0x79622d32U, 0x6b206574U};

std::uint32_t RotateLeft(std::uint32_t value, unsigned int shift) {
    return (value << shift) | (value >> ((32U - shift) & 31U));
}

// Offset is reduced modulo 32, so a negative offset rotates left.
std::uint32_t RotateRight(std::uint32_t value, int offset) {
    unsigned int shift = static_cast<unsigned int>(offset) & 31U;
    return (value >> shift) | (value << ((32U - shift) & 31U));
}

void QuarterRound(CipherState& x, std::size_t a, std::size_t b, std::size_t c, std::size_t d) {
    x[a] += x[b];
    x[d] = RotateLeft(x[d] ^ x[a], 16);
    x[c] += x[d];
    x[b] = RotateLeft(x[b] ^ x[c], 12);
    x[a] += x[b];
    x[d] = RotateLeft(x[d] ^ x[a], 8);
    x[c] += x[d];
    x[b] = RotateLeft(x[b] ^ x[c], 7);
}

void ApplyRounds(CipherState& x, int rounds) {
    for (int i = rounds; i > 0; i -= 2) {
        QuarterRound(x, 0, 4, 8, 12);
        QuarterRound(x, 1, 5, 9, 13);
        QuarterRound(x, 2, 6, 10, 14);
        QuarterRound(x, 3, 7, 11, 15);

        QuarterRound(x, 0, 5, 10, 15);
        QuarterRound(x, 1, 6, 11, 12);
        QuarterRound(x, 2, 7, 8, 13);
        QuarterRound(x, 3, 4, 9, 14);
    }
}

}  // namespace

Nonce DeriveMegaBlockNonce(const std::array<std::uint8_t, constants::kNonceMaterialLen>& nonce_material,
                           std::uint32_t c) {
    const std::uint8_t* pool = nonce_material.data();
    const std::uint32_t m1 = LoadU32Le(pool + ((c % kIndexModulus) | kSeedLane));
    const std::uint32_t m2 = LoadU32Le(pool + ((c / kIndexModulus) % kIndexModulus));
    const std::uint32_t x1 = LoadU32Le(pool + (((c / kStrideA) % kIndexModulus) | kXorLane1));
    const std::uint32_t x2 = LoadU32Le(pool + (((c / kStrideB) % kIndexModulus) | kXorLane2));

    const int shift1 = static_cast<int>((2 * ((c % kRotationPeriod) / kStrideA)) % kRotationModulus);
    const int shift2 = static_cast<int>((3 * (c / kRotationPeriod)) % kRotationModulus);
    const std::uint32_t seed = RotateRight(m1, -shift1) ^ RotateRight(m2, -shift2);

    Nonce nonce;
    nonce[0] = seed;
    nonce[1] = seed ^ x1;
    nonce[2] = nonce[1] ^ x2;
    return nonce;
}

CipherState SetupState(const std::array<std::uint8_t, constants::kCipherKeyLen>& key,
                       const Nonce& nonce,
                       std::uint32_t block_counter) {
    CipherState state{};
    std::copy(kSigma.begin(), kSigma.end(), state.begin());
    for (std::size_t i = 0; i < 8; ++i) {
        state[4 + i] = LoadU32Le(key.data() + i * 4);
    }
    state[12] = block_counter;
    state[13] = nonce[0];
    state[14] = nonce[1];
    state[15] = nonce[2];
    return state;
}

CascadeKeystream::CascadeKeystream(const KeyMaterial& material) : material_(material) {}

void CascadeKeystream::Reset() noexcept {
    counter_ = 0;
    state_.fill(0);
    context_.fill(0);
}

const CascadeKeystream::MegaBlock& CascadeKeystream::NextMegaBlock() {
    const Nonce nonce = DeriveMegaBlockNonce(material_.nonce_material, counter_);
    state_ = SetupState(material_.key, nonce, ++counter_);
    for (std::size_t index = 0; index < constants::kSubBlockCount; ++index) {
        GenerateSubBlock(index);
    }
    return context_;
}

void CascadeKeystream::GenerateSubBlock(std::size_t index) {
    CipherState x = state_;
    if (index > 0) {
        const std::uint8_t* prior = context_.data() + (index - 1) * constants::kSubBlockSize;
        for (std::size_t j = 0; j < x.size(); ++j) {
            x[j] ^= LoadU32Le(prior + j * 4);
        }
    }
    const CipherState y = x;

    ApplyRounds(x, constants::kRoundSchedule[index]);

    std::uint8_t* out = context_.data() + index * constants::kSubBlockSize;
    for (std::size_t j = 0; j < x.size(); ++j) {
        StoreU32Le(out + j * 4, x[j] + y[j]);
    }

    if (++state_[12] == 0) {
        ++state_[13];
    }
}

}  // namespace aktk::cipher
