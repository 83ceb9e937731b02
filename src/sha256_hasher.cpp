#include "sha256_hasher.hpp"

#include <stdexcept>
#include <new>

namespace seedwise {

sha256_hasher::sha256_hasher()
    : context_(EVP_MD_CTX_new())
{
    if(context_ == nullptr) {
        throw std::bad_alloc();
    }
    reset();
}

sha256_hasher::~sha256_hasher()
{
    EVP_MD_CTX_free(context_);
}

void sha256_hasher::reset()
{
    if(EVP_DigestInit_ex(context_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("could not initialize SHA-256 context");
    }
}

sha256_hasher& sha256_hasher::update(const void* data, const size_t length)
{
    EVP_DigestUpdate(context_, data, length);
    return *this;
}

sha256_hash sha256_hasher::finish()
{
    sha256_hash digest;
    unsigned int length = 0;
    EVP_DigestFinal_ex(context_, digest.data(), &length);
    reset();
    return digest;
}

} // namespace seedwise
