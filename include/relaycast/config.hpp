#pragma once

#include <chrono>

#include <plog/Severity.h>

namespace relaycast
{
/**
 * @brief Runtime settings for a `NostrClient` and its relay sessions.
 */
struct ClientConfig
{
    ///< The most verbose log level that will be written to the appender.
    plog::Severity severity = plog::info;

    ///< How long to wait for a relay's opening handshake.
    std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(5000);

    ///< How long to wait for a relay's `OK` after publishing an event.
    std::chrono::milliseconds publishTimeout = std::chrono::milliseconds(5000);

    ///< How long a batch query waits for a relay's `EOSE` before giving up on that relay.
    std::chrono::milliseconds queryTimeout = std::chrono::milliseconds(10000);
};
} // namespace relaycast
