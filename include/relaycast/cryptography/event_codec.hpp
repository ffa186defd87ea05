#pragma once

#include <string>

#include "relaycast/cryptography/key_codec.hpp"
#include "relaycast/data/data.hpp"

namespace relaycast
{
namespace cryptography
{
/**
 * @brief Computes event identifiers and BIP-340 signatures.
 */
class EventCodec
{
public:
    /**
     * @brief Builds the canonical serialization `[0,pubkey,created_at,kind,tags,content]`.
     * @remark The output is compact JSON with UTF-8 left unescaped.  Any change to this output
     * breaks ID compatibility with other clients.
     */
    static std::string canonicalize(const data::Event& event);

    /**
     * @brief Computes the event ID.
     * @returns The SHA-256 hash of the canonical serialization, lowercase hex-encoded.
     */
    static std::string computeId(const data::Event& event);

    /**
     * @brief Signs an event ID.
     * @param idHex A 32-byte event ID, hex-encoded.
     * @param privateKeyHex A 32-byte private key, hex-encoded.
     * @returns A 64-byte schnorr signature, lowercase hex-encoded.
     * @throws `DecodeError` if either argument is malformed.
     * @throws `std::runtime_error` if noscrypt fails to produce a signature.
     * @remark Signing uses zeroed auxiliary data, so the same ID and key always give the same
     * signature.
     */
    static std::string sign(const std::string& idHex, const std::string& privateKeyHex);

    /**
     * @brief Checks a signature over an event ID.
     * @returns True if the signature is valid, false if it is invalid or any argument is
     * malformed.
     */
    static bool verify(const std::string& sigHex, const std::string& idHex, const std::string& pubkeyHex);

    /**
     * @brief Fills in the event's `pubkey`, `id` and `sig` from the given key pair.
     * @throws `std::invalid_argument` if the event is invalid.
     */
    static void signEvent(data::Event& event, const KeyPair& keys);

    /**
     * @brief Checks that an event's ID matches its content and that its signature is valid.
     */
    static bool isValid(const data::Event& event);
};
} // namespace cryptography
} // namespace relaycast
