#pragma once

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace relaycast
{
namespace cryptography
{
/**
 * @brief Bech32 encoding as defined in BIP-173, with a configurable length ceiling.
 * @remark NIP-19 strings may exceed the 90-character limit of BIP-173, so callers pass the
 * maximum length they are prepared to accept.
 */
class Bech32
{
public:
    static constexpr size_t DEFAULT_MAX_LENGTH = 90;

    /**
     * @brief Encodes 5-bit words under the given human-readable prefix.
     * @throws `DecodeError` if the prefix is invalid, a word is out of range, or the result would
     * exceed `maxLength`.
     */
    static std::string encode(
        const std::string& hrp,
        const std::vector<uint8_t>& words,
        size_t maxLength = DEFAULT_MAX_LENGTH);

    /**
     * @brief Decodes a bech32 string into its prefix and 5-bit words, checksum removed.
     * @returns A tuple of the form `<hrp, words>`.  The prefix is returned in lowercase.
     * @throws `DecodeError` on mixed case, a missing separator, an invalid character, a bad
     * checksum, or a string longer than `maxLength`.
     */
    static std::tuple<std::string, std::vector<uint8_t>> decode(
        const std::string& encoded,
        size_t maxLength = DEFAULT_MAX_LENGTH);

    /**
     * @brief Regroups 8-bit bytes into 5-bit words, padding the final word.
     */
    static std::vector<uint8_t> toWords(const std::vector<uint8_t>& bytes);

    /**
     * @brief Regroups 5-bit words into 8-bit bytes.
     * @throws `DecodeError` if the words carry non-zero padding or more than four padding bits.
     */
    static std::vector<uint8_t> fromWords(const std::vector<uint8_t>& words);

private:
    static uint32_t _polymod(const std::vector<uint8_t>& values);

    static std::vector<uint8_t> _expandHrp(const std::string& hrp);

    static bool _convertBits(
        const std::vector<uint8_t>& input,
        int fromBits,
        int toBits,
        bool pad,
        std::vector<uint8_t>& output);
};
} // namespace cryptography
} // namespace relaycast
