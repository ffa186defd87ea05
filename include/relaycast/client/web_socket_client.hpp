#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <tuple>

namespace relaycast
{
namespace client
{
/**
 * @brief An interface for a WebSocket client that manages one connection per server URI.
 */
class IWebSocketClient
{
public:
    virtual ~IWebSocketClient() = default;

    /**
     * @brief Starts the client.
     * @remark This method must be called before any other client methods.
     */
    virtual void start() = 0;

    /**
     * @brief Stops the client.
     * @remark This method should be called when the client is no longer needed, before it is
     * destroyed.
     */
    virtual void stop() = 0;

    /**
     * @brief Opens a connection to the given server.
     * @param timeout How long to wait for the opening handshake.
     * @remark The call returns once the handshake completes, fails, or times out.  Use
     * `isConnected` to learn the outcome.
     */
    virtual void openConnection(std::string uri, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Indicates whether the client is connected to the given server.
     * @returns True if the client is connected, false otherwise.
     */
    virtual bool isConnected(std::string uri) = 0;

    /**
     * @brief Sends the given message to the given server.
     * @returns A tuple indicating the server URI and whether the message was successfully
     * sent.
     */
    virtual std::tuple<std::string, bool> send(std::string message, std::string uri) = 0;

    /**
     * @brief Sets up a message handler for the given server.
     * @param uri The URI of the server to which the message handler should be attached.
     * @param messageHandler A callable object that will be invoked with the payload the client
     * receives from the server.
     * @remark Each connection has a single handler; a later call replaces an earlier one.
     */
    virtual void receive(std::string uri, std::function<void(const std::string&)> messageHandler) = 0;

    /**
     * @brief Sets up a handler to be told when the given server's connection is lost.
     * @param closeHandler A callable object that will be invoked with a description of why the
     * connection ended.
     * @remark The handler fires when the server closes the connection or the connection fails,
     * but not when the connection is closed through `closeConnection`.  Each connection has a
     * single close handler; a later call replaces an earlier one.
     */
    virtual void onClose(std::string uri, std::function<void(const std::string&)> closeHandler) = 0;

    /**
     * @brief Closes the connection to the given server.
     */
    virtual void closeConnection(std::string uri) = 0;
};
} // namespace client
} // namespace relaycast
