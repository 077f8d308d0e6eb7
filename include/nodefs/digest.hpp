#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace nodefs {

// Incremental message digest consumed by Readable::hash()
class Digest {
public:
    virtual ~Digest() = default;

    virtual void update(const std::byte* data, size_t size) = 0;

    // Finish and return the raw digest; the object is spent afterwards
    virtual std::vector<std::byte> finish() = 0;

    // Finish and return the lowercase hexadecimal digest
    std::string hexdigest();
};

// OpenSSL EVP digest by name: "md5", "sha1", "sha256", "sha512", ...
// Throws FSError(UnsupportedOperation) for an unknown algorithm name
std::unique_ptr<Digest> make_digest(const std::string& algorithm);

} // namespace nodefs
