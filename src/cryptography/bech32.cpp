#include <cctype>

#include "relaycast/cryptography/bech32.hpp"
#include "relaycast/errors.hpp"

using namespace std;

namespace relaycast
{
namespace cryptography
{
static const char BECH32_ALPHABET[33] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

static int alphabetIndex(char c)
{
    for (int i = 0; i < 32; i++)
    {
        if (BECH32_ALPHABET[i] == c)
        {
            return i;
        }
    }
    return -1;
};

string Bech32::encode(const string& hrp, const vector<uint8_t>& words, size_t maxLength)
{
    if (hrp.empty())
    {
        throw DecodeError("Bech32::encode: The human-readable prefix must not be empty.");
    }

    for (char c : hrp)
    {
        if (c < 33 || c > 126 || isupper(static_cast<unsigned char>(c)))
        {
            throw DecodeError("Bech32::encode: The human-readable prefix must be lowercase printable ASCII.");
        }
    }

    size_t length = hrp.length() + 1 + words.size() + 6;
    if (length > maxLength)
    {
        throw DecodeError("Bech32::encode: Encoded length " + to_string(length) + " exceeds the limit of " + to_string(maxLength) + ".");
    }

    vector<uint8_t> values = _expandHrp(hrp);
    for (uint8_t word : words)
    {
        if (word >> 5)
        {
            throw DecodeError("Bech32::encode: Words must be 5-bit values.");
        }
        values.push_back(word);
    }
    values.insert(values.end(), 6, 0);
    uint32_t checksum = _polymod(values) ^ 1;

    string encoded = hrp + '1';
    encoded.reserve(length);
    for (uint8_t word : words)
    {
        encoded.push_back(BECH32_ALPHABET[word]);
    }
    for (int i = 0; i < 6; i++)
    {
        encoded.push_back(BECH32_ALPHABET[(checksum >> (5 * (5 - i))) & 31]);
    }

    return encoded;
};

tuple<string, vector<uint8_t>> Bech32::decode(const string& encoded, size_t maxLength)
{
    if (encoded.length() > maxLength)
    {
        throw DecodeError("Bech32::decode: Input exceeds the limit of " + to_string(maxLength) + " characters.");
    }

    bool hasLower = false;
    bool hasUpper = false;
    for (char c : encoded)
    {
        if (c < 33 || c > 126)
        {
            throw DecodeError("Bech32::decode: Input contains a non-printable character.");
        }
        hasLower = hasLower || islower(static_cast<unsigned char>(c));
        hasUpper = hasUpper || isupper(static_cast<unsigned char>(c));
    }
    if (hasLower && hasUpper)
    {
        throw DecodeError("Bech32::decode: Input mixes upper and lower case.");
    }

    size_t separator = encoded.rfind('1');
    if (separator == string::npos || separator == 0 || separator + 7 > encoded.length())
    {
        throw DecodeError("Bech32::decode: Input has no valid separator.");
    }

    string hrp;
    for (size_t i = 0; i < separator; i++)
    {
        hrp.push_back(static_cast<char>(tolower(static_cast<unsigned char>(encoded[i]))));
    }

    vector<uint8_t> words;
    words.reserve(encoded.length() - separator - 1);
    for (size_t i = separator + 1; i < encoded.length(); i++)
    {
        int index = alphabetIndex(static_cast<char>(tolower(static_cast<unsigned char>(encoded[i]))));
        if (index < 0)
        {
            throw DecodeError("Bech32::decode: Invalid character '" + string(1, encoded[i]) + "'.");
        }
        words.push_back(static_cast<uint8_t>(index));
    }

    vector<uint8_t> values = _expandHrp(hrp);
    values.insert(values.end(), words.begin(), words.end());
    if (_polymod(values) != 1)
    {
        throw DecodeError("Bech32::decode: Checksum mismatch.");
    }

    words.resize(words.size() - 6);
    return make_tuple(hrp, words);
};

vector<uint8_t> Bech32::toWords(const vector<uint8_t>& bytes)
{
    vector<uint8_t> words;
    _convertBits(bytes, 8, 5, true, words);
    return words;
};

vector<uint8_t> Bech32::fromWords(const vector<uint8_t>& words)
{
    vector<uint8_t> bytes;
    if (!_convertBits(words, 5, 8, false, bytes))
    {
        throw DecodeError("Bech32::fromWords: Invalid padding in the data part.");
    }
    return bytes;
};

uint32_t Bech32::_polymod(const vector<uint8_t>& values)
{
    static const uint32_t GENERATOR[5] = { 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };

    uint32_t checksum = 1;
    for (uint8_t value : values)
    {
        uint8_t top = checksum >> 25;
        checksum = ((checksum & 0x1ffffff) << 5) ^ value;
        for (int i = 0; i < 5; i++)
        {
            if ((top >> i) & 1)
            {
                checksum ^= GENERATOR[i];
            }
        }
    }

    return checksum;
};

vector<uint8_t> Bech32::_expandHrp(const string& hrp)
{
    vector<uint8_t> expanded;
    expanded.reserve(hrp.length() * 2 + 1);
    for (char c : hrp)
    {
        expanded.push_back(static_cast<uint8_t>(c) >> 5);
    }
    expanded.push_back(0);
    for (char c : hrp)
    {
        expanded.push_back(static_cast<uint8_t>(c) & 31);
    }

    return expanded;
};

bool Bech32::_convertBits(
    const vector<uint8_t>& input,
    int fromBits,
    int toBits,
    bool pad,
    vector<uint8_t>& output)
{
    uint32_t accumulator = 0;
    int bits = 0;
    const uint32_t maxValue = (1u << toBits) - 1;

    for (uint8_t value : input)
    {
        if (value >> fromBits)
        {
            return false;
        }
        accumulator = (accumulator << fromBits) | value;
        bits += fromBits;
        while (bits >= toBits)
        {
            bits -= toBits;
            output.push_back(static_cast<uint8_t>((accumulator >> bits) & maxValue));
        }
    }

    if (pad)
    {
        if (bits > 0)
        {
            output.push_back(static_cast<uint8_t>((accumulator << (toBits - bits)) & maxValue));
        }
    }
    else if (bits >= fromBits || ((accumulator << (toBits - bits)) & maxValue))
    {
        return false;
    }

    return true;
};
} // namespace cryptography
} // namespace relaycast
