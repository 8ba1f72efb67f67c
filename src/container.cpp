#include "aktk/container.hpp"

#include "aktk/constants.hpp"
#include "aktk/crypto.hpp"
#include "aktk/crypto_utils.hpp"
#include "aktk/errors.hpp"
#include "aktk/keyschedule.hpp"
#include "aktk/stream_cipher.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace aktk::container {

namespace {

using aktk::crypto::detail::LoadU16Le;
using aktk::crypto::detail::LoadU32Le;
using aktk::crypto::detail::StoreU32Le;

void StoreU16Le(std::uint8_t* out, std::uint16_t value) {
    out[0] = static_cast<std::uint8_t>(value & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
}

ContainerHeader ReadHeader(const Bytes& data) {
    ContainerHeader header;
    header.magic = LoadU32Le(data.data());
    header.version = LoadU16Le(data.data() + 4);
    header.reserved = LoadU16Le(data.data() + 6);
    header.encrypted = LoadU32Le(data.data() + 8);
    return header;
}

const char* HeaderDefect(const ContainerHeader& header) {
    if (header.magic != constants::kContainerMagic) {
        return "bad magic";
    }
    if (header.version != constants::kContainerVersion) {
        return "unsupported version";
    }
    if (header.reserved != 0) {
        return "reserved field is not zero";
    }
    if (header.encrypted > 1) {
        return "encrypted flag out of range";
    }
    return nullptr;
}

bool PayloadHashMatches(const Bytes& data) {
    const std::uint8_t* payload = data.data() + constants::kFramingSize;
    const std::size_t payload_len = data.size() - constants::kFramingSize;
    const Bytes digest = aktk::crypto::Md5(payload, payload_len);
    return std::equal(digest.begin(), digest.end(), data.begin() + constants::kHeaderSize,
                      data.begin() + constants::kFramingSize);
}

}  // namespace

ContainerHeader ParseHeader(const Bytes& data) {
    if (data.size() < constants::kFramingSize) {
        throw BundleError(ErrorKind::MalformedContainer,
                          "Bundle is shorter than its framing (" + std::to_string(data.size()) + " bytes)");
    }
    ContainerHeader header = ReadHeader(data);
    if (const char* defect = HeaderDefect(header)) {
        throw BundleError(ErrorKind::MalformedContainer, std::string("Bundle had an invalid header: ") + defect);
    }
    return header;
}

void VerifyPayloadHash(const Bytes& data) {
    if (data.size() < constants::kFramingSize) {
        throw BundleError(ErrorKind::MalformedContainer, "Bundle is shorter than its framing");
    }
    if (!PayloadHashMatches(data)) {
        throw BundleError(ErrorKind::IntegrityMismatch, "Encrypted bundle hash mismatch");
    }
}

Bytes DecodeContainer(const Bytes& data, const BundleDescriptor& bundle) {
    const ContainerHeader header = ParseHeader(data);
    VerifyPayloadHash(data);

    Bytes payload(data.begin() + constants::kFramingSize, data.end());
    if (header.encrypted == 1) {
        const cipher::KeyMaterial material = cipher::DeriveKeyMaterial(bundle);
        cipher::ApplyKeystream(payload.data(), payload.size(), material);
    }
    return payload;
}

Bytes DecodeBundle(Bytes raw, const BundleDescriptor& bundle) {
    if (!UsesContainer(bundle)) {
        return raw;
    }
    try {
        return DecodeContainer(raw, bundle);
    } catch (const BundleError&) {
        throw;
    } catch (const std::exception& exc) {
        throw BundleError(ErrorKind::ProtocolCorruption,
                          "Unexpected failure decoding " + bundle.relative_path + ": " + exc.what());
    }
}

Bytes EncodeBundle(const Bytes& plaintext, const BundleDescriptor& bundle, bool encrypt) {
    const std::int64_t framed = static_cast<std::int64_t>(plaintext.size() + constants::kFramingSize);
    if (bundle.file_size != framed) {
        throw std::invalid_argument("Bundle file_size does not match the framed payload size");
    }
    Bytes payload = plaintext;
    if (encrypt) {
        cipher::ApplyKeystream(payload.data(), payload.size(), cipher::DeriveKeyMaterial(bundle));
    }

    Bytes out(constants::kFramingSize);
    StoreU32Le(out.data(), constants::kContainerMagic);
    StoreU16Le(out.data() + 4, constants::kContainerVersion);
    StoreU16Le(out.data() + 6, 0);
    StoreU32Le(out.data() + 8, encrypt ? 1U : 0U);
    const Bytes digest = aktk::crypto::Md5(payload);
    std::copy(digest.begin(), digest.end(), out.begin() + constants::kHeaderSize);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

InspectResult Inspect(const Bytes& data) {
    InspectResult result;
    if (data.size() < constants::kFramingSize) {
        return result;
    }
    result.header = ReadHeader(data);
    result.header_valid = HeaderDefect(result.header) == nullptr;
    result.payload_len = data.size() - constants::kFramingSize;
    result.hash_matches = PayloadHashMatches(data);
    return result;
}

}  // namespace aktk::container
