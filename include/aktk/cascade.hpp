#pragma once

#include "aktk/constants.hpp"
#include "aktk/keyschedule.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace aktk::cipher {

using Nonce = std::array<std::uint32_t, 3>;
using CipherState = std::array<std::uint32_t, 16>;

// Nonce words for the mega-block whose running counter (before increment) is c.
Nonce DeriveMegaBlockNonce(const std::array<std::uint8_t, constants::kNonceMaterialLen>& nonce_material,
                           std::uint32_t c);

// "expand 32-byte k" | key | block counter | nonce
CipherState SetupState(const std::array<std::uint8_t, constants::kCipherKeyLen>& key,
                       const Nonce& nonce,
                       std::uint32_t block_counter);

// Keystream generator for one bundle. Each mega-block is eight chained
// sub-blocks; sub-block i starts from the state XOR sub-block i-1 and runs
// kRoundSchedule[i] rounds with a single final add-back.
class CascadeKeystream {
public:
    using MegaBlock = std::array<std::uint8_t, constants::kMegaBlockSize>;

    explicit CascadeKeystream(const KeyMaterial& material);

    // Produces the next 512 keystream bytes. The reference stays valid until
    // the following call.
    const MegaBlock& NextMegaBlock();

    std::uint32_t counter() const noexcept { return counter_; }
    void Reset() noexcept;

private:
    void GenerateSubBlock(std::size_t index);

    KeyMaterial material_;
    CipherState state_{};
    MegaBlock context_{};
    std::uint32_t counter_ = 0;
};

}  // namespace aktk::cipher
