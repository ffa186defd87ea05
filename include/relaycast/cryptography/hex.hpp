#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace relaycast
{
namespace cryptography
{
/**
 * @brief Encodes bytes as lowercase hex, two characters per byte.
 */
std::string encodeHex(const uint8_t* data, size_t length);

std::string encodeHex(const std::vector<uint8_t>& data);

/**
 * @brief Decodes a hex string of either case.
 * @throws `DecodeError` if the string has odd length or contains a non-hex character.
 */
std::vector<uint8_t> decodeHex(const std::string& hex);

/**
 * @brief Decodes a hex string that must describe exactly `length` bytes.
 * @throws `DecodeError` if the string is not valid hex or has the wrong length.
 */
std::vector<uint8_t> decodeHex(const std::string& hex, size_t length);
} // namespace cryptography
} // namespace relaycast
