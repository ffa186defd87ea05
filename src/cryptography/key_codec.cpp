#include <tuple>

#include "noscrypt_context.hpp"
#include "relaycast/cryptography/bech32.hpp"
#include "relaycast/cryptography/hex.hpp"
#include "relaycast/cryptography/key_codec.hpp"
#include "relaycast/errors.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;

namespace relaycast
{
namespace cryptography
{
KeyPair KeyPair::fromPrivateKey(const string& privateKeyHex)
{
    KeyPair keys;
    keys.publicKey = KeyCodec::derivePublicKey(privateKeyHex);
    keys.privateKey = privateKeyHex;

    return keys;
};

string KeyCodec::decode(const string& bech32Key, const string& expectedPrefix)
{
    auto [hrp, words] = Bech32::decode(bech32Key, MAX_ENCODED_LENGTH);
    if (!expectedPrefix.empty() && hrp != expectedPrefix)
    {
        throw DecodeError("KeyCodec::decode: Expected a key with prefix " + expectedPrefix + ", but found " + hrp + ".");
    }

    return encodeHex(Bech32::fromWords(words));
};

string KeyCodec::encode(const string& rawKeyHex, const string& prefix)
{
    vector<uint8_t> bytes = decodeHex(rawKeyHex);
    return Bech32::encode(prefix, Bech32::toWords(bytes), MAX_ENCODED_LENGTH);
};

string KeyCodec::derivePublicKey(const string& privateKeyHex)
{
    auto ctx = noscryptContext();
    auto secret = loadSecretKey(privateKeyHex);

    NCPublicKey pubkey;
    NCResult result = NCGetPublicKey(ctx.get(), secret.get(), &pubkey);
    if (!RC_LOG_NC_ERROR(result))
    {
        throw DecodeError("KeyCodec::derivePublicKey: Could not derive a public key from the private key.");
    }

    return encodeHex(pubkey.key, sizeof(pubkey.key));
};
} // namespace cryptography
} // namespace relaycast
