#include "binwheel/hashing.hpp"

#include <algorithm>
#include <fstream>

#include <openssl/evp.h>

namespace binwheel {

namespace {

constexpr std::size_t kReadChunk = 8192;

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

} // namespace

std::string to_hex(const unsigned char* data, std::size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

std::string base64url_nopad(const unsigned char* data, std::size_t len) {
    if (len == 0) {
        return {};
    }

    // EVP_EncodeBlock writes standard base64 with padding plus a NUL
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(len));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);

    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

// ============================================================================
// Sha256 (incremental)
// ============================================================================

struct Sha256::Impl {
    EvpMdCtx ctx;
    bool initialized = false;
    bool finished = false;
    std::string error;
    std::uint64_t size = 0;
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx) {
        impl_->error = "EVP_MD_CTX_new failed";
        return;
    }
    if (EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        impl_->error = "EVP_DigestInit_ex failed";
        return;
    }
    impl_->initialized = true;
}

Sha256::~Sha256() = default;

bool Sha256::update(const void* data, std::size_t len) {
    if (!impl_->initialized || impl_->finished || !impl_->error.empty()) {
        return false;
    }
    if (len == 0) {
        return true;
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        impl_->error = "EVP_DigestUpdate failed";
        return false;
    }
    impl_->size += len;
    return true;
}

HashResult Sha256::finish() {
    HashResult result;

    if (!impl_->error.empty()) {
        result.error = impl_->error;
        return result;
    }
    if (impl_->finished) {
        result.error = "digest already finished";
        return result;
    }
    impl_->finished = true;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(impl_->ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = to_hex(hash, hash_len);
    result.record_digest = "sha256=" + base64url_nopad(hash, hash_len);
    result.size = impl_->size;
    result.ok = true;
    return result;
}

// ============================================================================
// One-shot helpers
// ============================================================================

HashResult compute_sha256(const std::vector<std::uint8_t>& data) {
    Sha256 hasher;
    if (!hasher.update(data.data(), data.size())) {
        HashResult result = hasher.finish();
        result.ok = false;
        return result;
    }
    return hasher.finish();
}

HashResult compute_sha256(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    Sha256 hasher;
    char buffer[kReadChunk];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (!hasher.update(buffer, static_cast<std::size_t>(file.gcount()))) {
            auto failed = hasher.finish();
            result.error = "failed to hash " + file_path + ": " + failed.error;
            return result;
        }
    }

    if (file.bad()) {
        result.error = "failed to read file: " + file_path;
        return result;
    }

    result = hasher.finish();
    if (!result.ok) {
        result.error = "failed to hash " + file_path + ": " + result.error;
    }
    return result;
}

} // namespace binwheel
