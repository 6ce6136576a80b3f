// ==============================================================================
// hash.cpp - Hash Engine
// ==============================================================================

#include "rccopy/hash.hpp"

#include <openssl/evp.h>
#include <stdexcept>
#include <xxhash.h>

namespace rccopy::hash {

namespace {

// ----------------------------------------------------------------------------
// EvpHasher - MD5/SHA-1 через OpenSSL EVP
// ----------------------------------------------------------------------------

class EvpHasher final : public Hasher {
public:
    explicit EvpHasher(const EVP_MD* md) : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    void update(const void* data, std::size_t size) override {
        if (size == 0) {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    std::string finalize() override {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int out_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out, &out_len) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return to_hex(out, out_len);
    }

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

// ----------------------------------------------------------------------------
// Xxh64Hasher - xxHash64 через libxxhash
// ----------------------------------------------------------------------------

class Xxh64Hasher final : public Hasher {
public:
    Xxh64Hasher() : state_(XXH64_createState()) {
        if (!state_) {
            throw std::runtime_error("XXH64_createState failed");
        }
        if (XXH64_reset(state_.get(), 0) == XXH_ERROR) {
            throw std::runtime_error("XXH64_reset failed");
        }
    }

    void update(const void* data, std::size_t size) override {
        if (size == 0) {
            return;
        }
        if (XXH64_update(state_.get(), data, size) == XXH_ERROR) {
            throw std::runtime_error("XXH64_update failed");
        }
    }

    std::string finalize() override {
        // Канонический вид - big-endian, отсюда тег "xxhash64be" в MHL
        XXH64_canonical_t canonical;
        XXH64_canonicalFromHash(&canonical, XXH64_digest(state_.get()));
        return to_hex(canonical.digest, sizeof(canonical.digest));
    }

private:
    struct StateDeleter {
        void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
    };
    std::unique_ptr<XXH64_state_t, StateDeleter> state_;
};

std::unique_ptr<Hasher> make_md5() {
    return std::make_unique<EvpHasher>(EVP_md5());
}

std::unique_ptr<Hasher> make_sha1() {
    return std::make_unique<EvpHasher>(EVP_sha1());
}

std::unique_ptr<Hasher> make_xxh64() {
    return std::make_unique<Xxh64Hasher>();
}

const std::array<AlgorithmInfo, 3> ALGORITHMS = {{
    {Algorithm::Md5, "md5", "md5", 32, &make_md5},
    {Algorithm::Sha1, "sha1", "sha1", 40, &make_sha1},
    {Algorithm::Xxh64, "xxhash64", "xxhash64be", 16, &make_xxh64},
}};

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

const std::array<AlgorithmInfo, 3>& algorithms() {
    return ALGORITHMS;
}

const AlgorithmInfo& info(Algorithm algorithm) {
    for (const auto& entry : ALGORITHMS) {
        if (entry.algorithm == algorithm) {
            return entry;
        }
    }
    throw std::invalid_argument("unknown checksum algorithm");
}

Algorithm parse_algorithm(std::string_view name) {
    for (const auto& entry : ALGORITHMS) {
        if (name == entry.name) {
            return entry.algorithm;
        }
    }
    throw std::invalid_argument("unknown checksum method, must be: md5, sha1, or xxhash64");
}

std::optional<Algorithm> algorithm_from_mhl_tag(std::string_view tag) {
    for (const auto& entry : ALGORITHMS) {
        if (tag == entry.mhl_tag) {
            return entry.algorithm;
        }
    }
    return std::nullopt;
}

std::string to_string(Algorithm algorithm) {
    return info(algorithm).name;
}

std::unique_ptr<Hasher> make_hasher(Algorithm algorithm) {
    return info(algorithm).make();
}

std::string hash_bytes(Algorithm algorithm, std::string_view data) {
    auto hasher = make_hasher(algorithm);
    hasher->update(data.data(), data.size());
    return hasher->finalize();
}

std::string to_hex(const unsigned char* data, std::size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0x0F];
    }
    return result;
}

bool is_valid_digest(Algorithm algorithm, std::string_view digest) {
    if (digest.size() != info(algorithm).hex_width) {
        return false;
    }
    for (char c : digest) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex) {
            return false;
        }
    }
    return true;
}

}  // namespace rccopy::hash
