#include "relaycast/cryptography/hex.hpp"
#include "relaycast/errors.hpp"

using namespace std;

namespace relaycast
{
namespace cryptography
{
static const char HEX_TABLE[] = "0123456789abcdef";

static int hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
};

string encodeHex(const uint8_t* data, size_t length)
{
    string hex(length * 2, '0');
    for (size_t i = 0; i < length; i++)
    {
        hex[i * 2] = HEX_TABLE[data[i] >> 4];
        hex[i * 2 + 1] = HEX_TABLE[data[i] & 0x0f];
    }

    return hex;
};

string encodeHex(const vector<uint8_t>& data)
{
    return encodeHex(data.data(), data.size());
};

vector<uint8_t> decodeHex(const string& hex)
{
    if (hex.length() % 2 != 0)
    {
        throw DecodeError("decodeHex: Hex strings must have an even length.");
    }

    vector<uint8_t> bytes;
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2)
    {
        int high = hexValue(hex[i]);
        int low = hexValue(hex[i + 1]);
        if (high < 0 || low < 0)
        {
            throw DecodeError("decodeHex: Invalid hex character at position " + to_string(high < 0 ? i : i + 1) + ".");
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return bytes;
};

vector<uint8_t> decodeHex(const string& hex, size_t length)
{
    if (hex.length() != length * 2)
    {
        throw DecodeError(
            "decodeHex: Expected " + to_string(length) + " bytes of hex, got " + to_string(hex.length()) + " characters.");
    }

    return decodeHex(hex);
};
} // namespace cryptography
} // namespace relaycast
