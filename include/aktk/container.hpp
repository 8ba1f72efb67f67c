#pragma once

#include "aktk/bundle.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace aktk::container {

using Bytes = std::vector<std::uint8_t>;

// Little-endian on the wire: 'A' 'k' 't' 'k' | u16 version | u16 reserved | u32 encrypted
struct ContainerHeader {
    std::uint32_t magic = 0;
    std::uint16_t version = 0;
    std::uint16_t reserved = 0;
    std::uint32_t encrypted = 0;
};

struct InspectResult {
    ContainerHeader header;
    bool header_valid = false;
    bool hash_matches = false;
    std::size_t payload_len = 0;
};

// Throws BundleError(MalformedContainer) when the framing is short or a field is out of range.
ContainerHeader ParseHeader(const Bytes& data);

// Throws BundleError(IntegrityMismatch) when MD5 of the payload differs from the stored hash.
void VerifyPayloadHash(const Bytes& data);

// Header + hash check, then deciphers when the encrypted flag is set.
Bytes DecodeContainer(const Bytes& data, const BundleDescriptor& bundle);

// Container bundles go through DecodeContainer; anything else is returned verbatim.
// Unexpected decoder failures surface as BundleError(ProtocolCorruption).
Bytes DecodeBundle(Bytes raw, const BundleDescriptor& bundle);

// Builds a container around plaintext. bundle.file_size must equal the framed size.
Bytes EncodeBundle(const Bytes& plaintext, const BundleDescriptor& bundle, bool encrypt);

InspectResult Inspect(const Bytes& data);

}  // namespace aktk::container
