#include "aktk/transport.hpp"

#include "aktk/errors.hpp"

#include <curl/curl.h>

#include <array>
#include <atomic>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace aktk::transport {

namespace {

constexpr const char* kUserAgent = "aktk/1.0";

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept {
        if (handle) curl_easy_cleanup(handle);
    }
};

struct CurlShareDeleter {
    void operator()(CURLSH* share) const noexcept {
        if (share) curl_share_cleanup(share);
    }
};

struct CurlStringDeleter {
    void operator()(char* str) const noexcept {
        if (str) curl_free(str);
    }
};

using UniqueEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using UniqueShare = std::unique_ptr<CURLSH, CurlShareDeleter>;
using UniqueCurlString = std::unique_ptr<char, CurlStringDeleter>;

void EnsureGlobalInit() {
    static std::once_flag once;
    static CURLcode result = CURLE_OK;
    std::call_once(once, []() { result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (result != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(result));
    }
}

std::size_t WriteCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<Bytes*>(userdata);
    const std::size_t len = size * nmemb;
    try {
        out->insert(out->end(), reinterpret_cast<std::uint8_t*>(ptr), reinterpret_cast<std::uint8_t*>(ptr) + len);
    } catch (const std::bad_alloc&) {
        // A short count makes curl fail the transfer with CURLE_WRITE_ERROR.
        return 0;
    }
    return len;
}

int XferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancelled = static_cast<const std::atomic<bool>*>(userdata);
    return cancelled->load() ? 1 : 0;
}

}  // namespace

struct CurlTransport::Impl {
    UniqueShare share;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;
    std::atomic<bool> cancelled{false};

    static void Lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Impl*>(userptr)->locks[static_cast<std::size_t>(data)].lock();
    }

    static void Unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Impl*>(userptr)->locks[static_cast<std::size_t>(data)].unlock();
    }
};

CurlTransport::CurlTransport(std::string base_url, CurlOptions options)
    : base_url_(std::move(base_url)), options_(options), impl_(std::make_unique<Impl>()) {
    EnsureGlobalInit();
    impl_->share.reset(curl_share_init());
    if (!impl_->share) {
        throw std::runtime_error("curl_share_init failed");
    }
    CURLSH* share = impl_->share.get();
    curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &Impl::Lock);
    curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &Impl::Unlock);
    curl_share_setopt(share, CURLSHOPT_USERDATA, impl_.get());
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

CurlTransport::~CurlTransport() = default;

std::string CurlTransport::ResolveUrl(const std::string& relative_path) const {
    std::string url = base_url_;
    if (relative_path.empty()) {
        return url;
    }
    if (url.empty() || url.back() != '/') {
        url.push_back('/');
    }
    std::size_t start = relative_path.front() == '/' ? 1 : 0;
    while (start <= relative_path.size()) {
        std::size_t slash = relative_path.find('/', start);
        std::size_t end = slash == std::string::npos ? relative_path.size() : slash;
        std::string segment = relative_path.substr(start, end - start);
        UniqueCurlString escaped(curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size())));
        if (!escaped) {
            throw std::runtime_error("curl_easy_escape failed for " + relative_path);
        }
        url += escaped.get();
        if (slash == std::string::npos) {
            break;
        }
        url.push_back('/');
        start = slash + 1;
    }
    return url;
}

Bytes CurlTransport::Fetch(const std::string& relative_path) {
    if (impl_->cancelled.load()) {
        throw BundleError(ErrorKind::TransportFailure, "Transfer cancelled: " + relative_path);
    }
    const std::string url = ResolveUrl(relative_path);
    UniqueEasy curl(curl_easy_init());
    if (!curl) {
        throw BundleError(ErrorKind::TransportFailure, "curl_easy_init failed");
    }

    Bytes body;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_SHARE, impl_->share.get());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, XferInfoCallback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &impl_->cancelled);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, options_.timeout_seconds);

    CURLcode res = curl_easy_perform(handle);
    if (res != CURLE_OK) {
        std::string reason = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(res);
        throw BundleError(ErrorKind::TransportFailure, "GET " + url + " failed: " + reason);
    }
    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        throw BundleError(ErrorKind::TransportFailure, "GET " + url + " returned HTTP " + std::to_string(status));
    }
    return body;
}

void CurlTransport::Cancel() noexcept {
    impl_->cancelled = true;
}

}  // namespace aktk::transport
