#pragma once

#include "aktk/constants.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace aktk::transport {

using Bytes = std::vector<std::uint8_t>;

// Fetches complete payloads by path relative to an endpoint. Implementations
// must be callable from several worker threads at once and throw
// BundleError(TransportFailure) on any failure. No retries happen here.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Bytes Fetch(const std::string& relative_path) = 0;

    // Aborts in-flight and future fetches.
    virtual void Cancel() noexcept {}
};

struct CurlOptions {
    long timeout_seconds = constants::kDefaultHttpTimeoutSeconds;
    long connect_timeout_seconds = constants::kConnectTimeoutSeconds;
};

class CurlTransport : public Transport {
public:
    explicit CurlTransport(std::string base_url, CurlOptions options = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Bytes Fetch(const std::string& relative_path) override;
    void Cancel() noexcept override;

    std::string ResolveUrl(const std::string& relative_path) const;

private:
    struct Impl;

    std::string base_url_;
    CurlOptions options_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace aktk::transport
