#include "Crypto.hpp"
#include <algorithm>
#include <utility>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/crypto.h>

namespace filepush {

namespace {
    void handleOpenSSLError(const std::string& operation) {
        std::string error;
        while (unsigned long err = ERR_get_error()) {
            char err_buf[256];
            ERR_error_string_n(err, err_buf, sizeof(err_buf));
            if (!error.empty()) error += "; ";
            error += err_buf;
        }
        throw TransferError(ErrorCode::CryptoError, operation + " failed: " + error);
    }
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()), bytes_hashed_(0) {
    if (!ctx_) handleOpenSSLError("EVP_MD_CTX_new");
    reset();
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

Sha256::Sha256(Sha256&& other) noexcept
    : ctx_(std::exchange(other.ctx_, nullptr)),
      bytes_hashed_(std::exchange(other.bytes_hashed_, 0)) {}

Sha256& Sha256::operator=(Sha256&& other) noexcept {
    if (this != &other) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = std::exchange(other.ctx_, nullptr);
        bytes_hashed_ = std::exchange(other.bytes_hashed_, 0);
    }
    return *this;
}

void Sha256::reset() {
    if (!EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr)) {
        handleOpenSSLError("EVP_DigestInit_ex");
    }
    bytes_hashed_ = 0;
}

void Sha256::update(const void* data, size_t length) {
    if (!ctx_) {
        throw TransferError(ErrorCode::CryptoError, "SHA-256 context was moved from");
    }
    if (length == 0) return;

    if (!EVP_DigestUpdate(ctx_, data, length)) {
        handleOpenSSLError("EVP_DigestUpdate");
    }
    bytes_hashed_ += length;
}

Digest Sha256::finish() {
    if (!ctx_) {
        throw TransferError(ErrorCode::CryptoError, "SHA-256 context was moved from");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(ctx_, hash, &hash_len)) {
        handleOpenSSLError("EVP_DigestFinal_ex");
    }
    if (hash_len != Digest().size()) {
        throw TransferError(ErrorCode::CryptoError,
            "Unexpected SHA-256 length " + std::to_string(hash_len));
    }

    Digest result;
    std::copy(hash, hash + hash_len, result.begin());
    reset();
    return result;
}

Digest Crypto::sha256(std::string_view data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish();
}

bool Crypto::digestsEqual(const Digest& a, const Digest& b) {
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string Crypto::toHex(const Digest& digest) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (uint8_t byte : digest) {
        out.push_back(hex[byte >> 4]);
        out.push_back(hex[byte & 0x0f]);
    }
    return out;
}

} // namespace filepush
