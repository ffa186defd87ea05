#pragma once

#include <functional>
#include <string>

#include "relaycast/data/data.hpp"

namespace relaycast
{
namespace relay
{
/**
 * @brief Callbacks for relay lifecycle notifications.
 * @remark Every member is optional.  Callbacks may be invoked from the WebSocket client's I/O
 * thread or from the threads of a batch operation, so they must not block for long.
 */
struct RelayObserver
{
    std::function<void(const data::RelayEndpoint&)> onConnected;

    std::function<void(const data::RelayEndpoint&, const std::string&)> onError;

    std::function<void(const data::RelayEndpoint&, const std::string&)> onNotice;

    std::function<void(const data::PublishResult&)> onPublished;
};
} // namespace relay
} // namespace relaycast
