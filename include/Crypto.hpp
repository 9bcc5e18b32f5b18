#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "TransferTypes.hpp"

// Forward declaration keeps OpenSSL headers out of the public interface
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace filepush {

// Incremental SHA-256 over a payload that arrives in chunks.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(Sha256&& other) noexcept;
    Sha256& operator=(Sha256&& other) noexcept;
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t length);

    // Completes the hash. The context is reset afterwards and may be reused.
    Digest finish();

    uint64_t bytesHashed() const { return bytes_hashed_; }

private:
    void reset();

    EVP_MD_CTX* ctx_;
    uint64_t bytes_hashed_;
};

class Crypto {
public:
    // One-shot hashing
    static Digest sha256(std::string_view data);

    // Constant-time digest comparison
    static bool digestsEqual(const Digest& a, const Digest& b);

    static std::string toHex(const Digest& digest);

private:
    // Prevent instantiation
    Crypto() = delete;
    ~Crypto() = delete;
    Crypto(const Crypto&) = delete;
    Crypto& operator=(const Crypto&) = delete;
};

} // namespace filepush
