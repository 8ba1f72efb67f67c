#pragma once

#include "aktk/keyschedule.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace aktk::cipher {

using Bytes = std::vector<std::uint8_t>;

// XORs the bundle keystream over data in place, mega-block by mega-block.
// The transform is its own inverse.
void ApplyKeystream(std::uint8_t* data, std::size_t len, const KeyMaterial& material);

Bytes ApplyKeystream(const Bytes& data, const KeyMaterial& material);

}  // namespace aktk::cipher
