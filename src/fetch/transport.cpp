#include "unbox/transport.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <openssl/evp.h>
#include <curl/curl.h>

namespace unbox {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Feeds chunks through one digest; returns the hex digest or sets error
class Sha256Digest {
public:
    bool init(std::string& error) {
        if (!ctx_) {
            error = "EVP_MD_CTX_new failed";
            return false;
        }
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            error = "EVP_DigestInit_ex failed";
            return false;
        }
        return true;
    }

    bool update(const void* data, size_t len, std::string& error) {
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            error = "EVP_DigestUpdate failed";
            return false;
        }
        return true;
    }

    bool finish(std::string& hex, std::string& error) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
            error = "EVP_DigestFinal_ex failed";
            return false;
        }
        hex = bytes_to_hex(hash, hash_len);
        return true;
    }

private:
    EvpMdCtx ctx_;
};

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    Sha256Digest digest;
    if (!digest.init(result.error)) return result;
    if (!digest.update(data.data(), data.size(), result.error)) return result;
    if (!digest.finish(result.hex_digest, result.error)) return result;

    result.ok = true;
    return result;
}

HashResult compute_sha256(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    Sha256Digest digest;
    if (!digest.init(result.error)) return result;

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (!digest.update(buffer, static_cast<size_t>(file.gcount()), result.error)) {
            return result;
        }
    }

    if (!digest.finish(result.hex_digest, result.error)) return result;

    result.ok = true;
    return result;
}

Sha256VerifyResult verify_sha256(const std::vector<uint8_t>& data,
                                  const std::string& expected_hex) {
    Sha256VerifyResult result;
    result.expected_digest = to_lower(expected_hex);

    auto hash_result = compute_sha256(data);
    if (!hash_result.ok) {
        result.error = hash_result.error;
        return result;
    }

    result.actual_digest = hash_result.hex_digest;

    if (hash_result.hex_digest != result.expected_digest) {
        result.error = "SHA-256 mismatch: expected " + result.expected_digest +
                      ", got " + hash_result.hex_digest;
        return result;
    }

    result.ok = true;
    return result;
}

bool is_sha256_hex(const std::string& hex) {
    return hex.size() == 64 &&
           std::all_of(hex.begin(), hex.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// ============================================================================
// HTTP with libcurl
// ============================================================================

namespace {

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(userdata);
    size_t total = size * nmemb;
    buffer->insert(buffer->end(), ptr, ptr + total);
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

FetchResult perform(const std::string& url, bool head_only) {
    FetchResult result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.transport_error = true;
        result.error = "failed to initialize CURL";
        return result;
    }

    std::vector<uint8_t> buffer;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 50L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 300L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "unbox/" UNBOX_VERSION);

    if (head_only) {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        result.transport_error = true;
        result.error = std::string("HTTP request failed: ") +
                      (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    char* content_type = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
        result.content_type = content_type;
    }

    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status);
        return result;
    }

    result.data = std::move(buffer);
    result.ok = true;
    return result;
}

} // namespace

FetchResult fetch_url(const std::string& url) {
    return perform(url, false);
}

FetchResult probe_url(const std::string& url) {
    return perform(url, true);
}

} // namespace unbox
