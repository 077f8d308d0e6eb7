#include "nodefs/digest.hpp"
#include "nodefs/error.hpp"
#include <openssl/evp.h>

namespace nodefs {

namespace {

// RAII wrapper for an EVP digest context
class EvpDigest : public Digest {
public:
    explicit EvpDigest(const EVP_MD* md) : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) {
            throw FSError(ErrorCode::IOFailure, "Failed to allocate digest context");
        }
        if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw FSError(ErrorCode::IOFailure, "Failed to initialize digest");
        }
    }
    ~EvpDigest() override {
        EVP_MD_CTX_free(ctx_);
    }
    EvpDigest(const EvpDigest&) = delete;
    EvpDigest& operator=(const EvpDigest&) = delete;

    void update(const std::byte* data, size_t size) override {
        if (EVP_DigestUpdate(ctx_, data, size) != 1) {
            throw FSError(ErrorCode::IOFailure, "Digest update failed");
        }
    }

    std::vector<std::byte> finish() override {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_, out, &length) != 1) {
            throw FSError(ErrorCode::IOFailure, "Digest finalization failed");
        }
        const std::byte* begin = reinterpret_cast<const std::byte*>(out);
        return std::vector<std::byte>(begin, begin + length);
    }

private:
    EVP_MD_CTX* ctx_;
};

} // anonymous namespace

std::string Digest::hexdigest() {
    static const char* digits = "0123456789abcdef";
    std::string hex;
    for (std::byte b : finish()) {
        unsigned value = std::to_integer<unsigned>(b);
        hex += digits[value >> 4];
        hex += digits[value & 0x0f];
    }
    return hex;
}

std::unique_ptr<Digest> make_digest(const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (!md) {
        throw FSError(ErrorCode::UnsupportedOperation,
            "Unknown digest algorithm '" + algorithm + "'");
    }
    return std::make_unique<EvpDigest>(md);
}

} // namespace nodefs
