#pragma once

#include <memory>
#include <string>

#include <noscrypt.h>

namespace relaycast
{
namespace cryptography
{
/**
 * @brief Returns the process-wide noscrypt context, initializing it on first use.
 * @throws `std::runtime_error` if the context cannot be initialized.
 * @remark The context is only read after initialization, so it may be shared across threads.
 */
std::shared_ptr<const NCContext> noscryptContext();

/**
 * @brief Loads a hex-encoded secret key into a noscrypt key structure.
 * @throws `DecodeError` if the key is not 32 bytes of hex or is rejected by noscrypt.
 */
std::unique_ptr<NCSecretKey, void(*)(NCSecretKey*)> loadSecretKey(const std::string& privateKeyHex);
} // namespace cryptography
} // namespace relaycast
