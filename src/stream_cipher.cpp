#include "aktk/stream_cipher.hpp"

#include "aktk/cascade.hpp"

namespace aktk::cipher {

void ApplyKeystream(std::uint8_t* data, std::size_t len, const KeyMaterial& material) {
    if (len == 0) {
        return;
    }
    CascadeKeystream keystream(material);
    const std::size_t full_blocks = len / constants::kMegaBlockSize;
    const std::size_t tail = len % constants::kMegaBlockSize;

    std::uint8_t* cursor = data;
    for (std::size_t block = 0; block < full_blocks; ++block) {
        const auto& ks = keystream.NextMegaBlock();
        for (std::size_t i = 0; i < constants::kMegaBlockSize; ++i) {
            cursor[i] ^= ks[i];
        }
        cursor += constants::kMegaBlockSize;
    }
    if (tail > 0) {
        const auto& ks = keystream.NextMegaBlock();
        for (std::size_t i = 0; i < tail; ++i) {
            cursor[i] ^= ks[i];
        }
    }
}

Bytes ApplyKeystream(const Bytes& data, const KeyMaterial& material) {
    Bytes out(data);
    ApplyKeystream(out.data(), out.size(), material);
    return out;
}

}  // namespace aktk::cipher
