#pragma once

#include <string>

namespace relaycast
{
namespace cryptography
{
/**
 * @brief A private key and the public key derived from it, both hex-encoded.
 * @remark Construct through `fromPrivateKey` so that the public half always matches the private
 * half.  The private key must never be written to a log.
 */
struct KeyPair
{
    std::string privateKey;
    std::string publicKey;

    /**
     * @brief Builds a key pair from a hex-encoded private key.
     * @throws `DecodeError` if the key is not 32 bytes of hex or is not a valid secp256k1 secret.
     */
    static KeyPair fromPrivateKey(const std::string& privateKeyHex);

    bool empty() const { return this->privateKey.empty(); };
};

/**
 * @brief Converts keys between raw hex and their bech32 form, and derives public keys.
 */
class KeyCodec
{
public:
    ///< NIP-19 strings are allowed to run well past the BIP-173 length limit.
    static constexpr size_t MAX_ENCODED_LENGTH = 5000;

    /**
     * @brief Decodes a bech32 key such as `npub1...` or `nsec1...`.
     * @param expectedPrefix If not empty, the human-readable part the key must carry.
     * @returns The raw key bytes, lowercase hex-encoded.
     * @throws `DecodeError` if the string is malformed, its checksum does not match, or its
     * prefix is not the expected one.
     */
    static std::string decode(const std::string& bech32Key, const std::string& expectedPrefix = "");

    /**
     * @brief Encodes a hex key under the given prefix.
     * @throws `DecodeError` if `rawKeyHex` is not valid hex.
     */
    static std::string encode(const std::string& rawKeyHex, const std::string& prefix);

    /**
     * @brief Derives the BIP-340 x-only public key for a private key.
     * @param privateKeyHex A 32-byte private key, hex-encoded.
     * @returns The 32-byte public key, lowercase hex-encoded.
     * @throws `DecodeError` if the private key is malformed or out of range.
     */
    static std::string derivePublicKey(const std::string& privateKeyHex);
};
} // namespace cryptography
} // namespace relaycast
