#include <cstring>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "noscrypt_context.hpp"
#include "secure_rng.hpp"
#include "relaycast/cryptography/hex.hpp"
#include "relaycast/errors.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;

namespace relaycast
{
namespace cryptography
{
static void freeContext(NCContext* ctx)
{
    NCDestroyContext(ctx);
    operator delete(ctx);
};

static void freeSecretKey(NCSecretKey* secret)
{
    SecureRng::zero(secret, sizeof(NCSecretKey));
    delete secret;
};

static shared_ptr<const NCContext> initNoscryptContext()
{
    // The context struct is opaque, so its storage is sized at runtime.
    void* ctxMemory = operator new(NCGetContextStructSize());
    auto ctx = shared_ptr<NCContext>(static_cast<NCContext*>(ctxMemory), freeContext);

    vector<uint8_t> entropy(NC_CONTEXT_ENTROPY_SIZE);
    SecureRng::fill(entropy);

    NCResult initResult = NCInitContext(ctx.get(), entropy.data());
    SecureRng::zero(entropy.data(), entropy.size());

    if (!RC_LOG_NC_ERROR(initResult))
    {
        throw runtime_error("noscryptContext: Failed to initialize the noscrypt context.");
    }

    return ctx;
};

shared_ptr<const NCContext> noscryptContext()
{
    static mutex contextMutex;
    static shared_ptr<const NCContext> context;

    lock_guard<mutex> lock(contextMutex);
    if (context == nullptr)
    {
        context = initNoscryptContext();
    }

    return context;
};

unique_ptr<NCSecretKey, void(*)(NCSecretKey*)> loadSecretKey(const string& privateKeyHex)
{
    vector<uint8_t> bytes = decodeHex(privateKeyHex, sizeof(NCSecretKey));

    unique_ptr<NCSecretKey, void(*)(NCSecretKey*)> secret(new NCSecretKey(), freeSecretKey);
    memcpy(secret->key, bytes.data(), sizeof(NCSecretKey));
    SecureRng::zero(bytes.data(), bytes.size());

    auto ctx = noscryptContext();
    if (NCValidateSecretKey(ctx.get(), secret.get()) != NC_SUCCESS)
    {
        throw DecodeError("loadSecretKey: The private key is not a valid secp256k1 secret.");
    }

    return secret;
};
} // namespace cryptography
} // namespace relaycast
