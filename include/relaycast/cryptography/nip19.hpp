#pragma once

#include <string>

namespace relaycast
{
namespace cryptography
{
/**
 * @brief NIP-19 helpers for the two key prefixes the client understands.
 */
class Nip19Codec
{
public:
    static constexpr const char* PUBLIC_KEY_PREFIX = "npub";
    static constexpr const char* PRIVATE_KEY_PREFIX = "nsec";

    static std::string encodePublicKey(const std::string& publicKeyHex);

    static std::string encodePrivateKey(const std::string& privateKeyHex);

    /**
     * @brief Normalizes a key to raw hex.
     * @returns The decoded key for `npub` and `nsec` strings; any other input is returned
     * unchanged, on the assumption that it is already hex.
     * @throws `DecodeError` if an `npub` or `nsec` string is malformed.
     */
    static std::string decode(const std::string& key);

    /**
     * @brief Normalizes a public key to raw hex.
     * @throws `DecodeError` if the key is malformed, is not 32 bytes, or is an `nsec` string.
     */
    static std::string decodePublicKey(const std::string& key);
};
} // namespace cryptography
} // namespace relaycast
