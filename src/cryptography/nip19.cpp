#include "relaycast/cryptography/hex.hpp"
#include "relaycast/cryptography/key_codec.hpp"
#include "relaycast/cryptography/nip19.hpp"
#include "relaycast/errors.hpp"

using namespace std;

namespace relaycast
{
namespace cryptography
{
string Nip19Codec::encodePublicKey(const string& publicKeyHex)
{
    return KeyCodec::encode(publicKeyHex, PUBLIC_KEY_PREFIX);
};

string Nip19Codec::encodePrivateKey(const string& privateKeyHex)
{
    return KeyCodec::encode(privateKeyHex, PRIVATE_KEY_PREFIX);
};

string Nip19Codec::decode(const string& key)
{
    string prefix = key.substr(0, 4);
    if (prefix != PUBLIC_KEY_PREFIX && prefix != PRIVATE_KEY_PREFIX)
    {
        return key;
    }

    // Strings such as `npubx1...` share the first four characters but carry another prefix.
    string rawKey = KeyCodec::decode(key, prefix);
    if (rawKey.length() != 64)
    {
        throw DecodeError("Nip19Codec::decode: Keys must decode to exactly 32 bytes.");
    }

    return rawKey;
};

string Nip19Codec::decodePublicKey(const string& key)
{
    if (key.rfind(PRIVATE_KEY_PREFIX, 0) == 0)
    {
        throw DecodeError("Nip19Codec::decodePublicKey: Expected a public key, but received a private key.");
    }

    string publicKeyHex = decode(key);

    // Rejects anything that is not 32 bytes of hex.
    decodeHex(publicKeyHex, 32);

    return publicKeyHex;
};
} // namespace cryptography
} // namespace relaycast
