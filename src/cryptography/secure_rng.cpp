#include <stdexcept>

#include <plog/Log.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "secure_rng.hpp"

using namespace std;

namespace relaycast
{
namespace cryptography
{
void SecureRng::fill(void* buffer, size_t length)
{
    if (RAND_bytes(static_cast<unsigned char*>(buffer), static_cast<int>(length)) != 1)
    {
        PLOG_ERROR << "Failed to generate random bytes";
        throw runtime_error("SecureRng::fill: OpenSSL could not generate random bytes.");
    }
};

void SecureRng::zero(void* buffer, size_t length)
{
    OPENSSL_cleanse(buffer, length);
};
} // namespace cryptography
} // namespace relaycast
