#ifndef SEEDWISE_SHA256_HASHER_HEADER
#define SEEDWISE_SHA256_HASHER_HEADER

#include <array>
#include <cstdint>
#include <string>

#include <openssl/evp.h>

namespace seedwise {

using sha256_hash = std::array<uint8_t, 32>;

/**
 * Incremental SHA-256, used to fingerprint file manifests. The data need not be
 * available at once, feed it with update() and collect the digest with finish(),
 * after which the hasher is reset and may be reused.
 */
class sha256_hasher
{
    EVP_MD_CTX* context_;

public:

    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(const sha256_hasher&) = delete;
    sha256_hasher& operator=(const sha256_hasher&) = delete;

    void reset();

    sha256_hasher& update(const void* data, const size_t length);
    sha256_hasher& update(const std::string& buffer)
    {
        return update(buffer.data(), buffer.size());
    }

    sha256_hash finish();
};

} // namespace seedwise

#endif // SEEDWISE_SHA256_HASHER_HEADER
