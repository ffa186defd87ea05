#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace relaycast
{
namespace cryptography
{
class SecureRng
{
public:
    /**
     * @brief Fills the given buffer with secure random bytes.
     * @throws `std::runtime_error` if OpenSSL cannot produce random bytes.
     */
    static void fill(void* buffer, size_t length);

    static inline void fill(std::vector<uint8_t>& buffer)
    {
        fill(buffer.data(), buffer.size());
    }

    /*
     * @brief Securely zeroes out the given buffer.
     */
    static void zero(void* buffer, size_t length);
};
} // namespace cryptography
} // namespace relaycast
