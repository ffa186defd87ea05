#include <cstring>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <plog/Log.h>

#include "noscrypt_context.hpp"
#include "relaycast/cryptography/event_codec.hpp"
#include "relaycast/cryptography/hex.hpp"
#include "relaycast/errors.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace nlohmann;
using namespace std;

namespace relaycast
{
namespace cryptography
{
string EventCodec::canonicalize(const data::Event& event)
{
    json arr = json::array({ 0, event.pubkey, event.createdAt, event.kind, event.tags, event.content });
    return arr.dump();
};

string EventCodec::computeId(const data::Event& event)
{
    string serializedData = canonicalize(event);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (EVP_Digest(serializedData.c_str(), serializedData.length(), hash, nullptr, EVP_sha256(), nullptr) != 1)
    {
        throw runtime_error("EventCodec::computeId: OpenSSL failed to hash the event.");
    }

    return encodeHex(hash, SHA256_DIGEST_LENGTH);
};

string EventCodec::sign(const string& idHex, const string& privateKeyHex)
{
    vector<uint8_t> digest = decodeHex(idHex, 32);
    auto secret = loadSecretKey(privateKeyHex);
    auto ctx = noscryptContext();

    // Zeroed auxiliary data keeps signatures reproducible for a given ID and key.
    uint8_t auxiliary[32] = { 0 };
    uint8_t signature[64];

    NCResult result = NCSignDigest(ctx.get(), secret.get(), auxiliary, digest.data(), signature);
    if (!RC_LOG_NC_ERROR(result))
    {
        throw runtime_error("EventCodec::sign: noscrypt failed to sign the event ID.");
    }

    return encodeHex(signature, sizeof(signature));
};

bool EventCodec::verify(const string& sigHex, const string& idHex, const string& pubkeyHex)
{
    vector<uint8_t> signature;
    vector<uint8_t> digest;
    NCPublicKey pubkey;

    try
    {
        signature = decodeHex(sigHex, 64);
        digest = decodeHex(idHex, 32);
        vector<uint8_t> pubkeyBytes = decodeHex(pubkeyHex, sizeof(pubkey.key));
        memcpy(pubkey.key, pubkeyBytes.data(), sizeof(pubkey.key));
    }
    catch (const DecodeError& e)
    {
        PLOG_VERBOSE << "Signature check skipped for malformed input: " << e.what();
        return false;
    }

    auto ctx = noscryptContext();
    return NCVerifyDigest(ctx.get(), &pubkey, digest.data(), signature.data()) == NC_SUCCESS;
};

void EventCodec::signEvent(data::Event& event, const KeyPair& keys)
{
    event.pubkey = keys.publicKey;
    event.validate();

    event.id = computeId(event);
    event.sig = sign(event.id, keys.privateKey);
};

bool EventCodec::isValid(const data::Event& event)
{
    string expectedId;
    try
    {
        expectedId = computeId(event);
    }
    catch (const json::exception& je)
    {
        PLOG_VERBOSE << "Could not canonicalize event " << event.id << ": " << je.what();
        return false;
    }

    if (expectedId != event.id)
    {
        PLOG_VERBOSE << "Event ID " << event.id << " does not match its content.";
        return false;
    }

    return verify(event.sig, event.id, event.pubkey);
};
} // namespace cryptography
} // namespace relaycast
