#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "relaycast/client/web_socket_client.hpp"

namespace relaycast
{
namespace client
{
/**
 * @brief An implementation of the `IWebSocketClient` interface that uses the WebSocket++ library.
 * @remark `wss://` URIs are reached over TLS and `ws://` URIs over plain TCP.  Both kinds of
 * connection share one ASIO event loop, which runs on a dedicated thread between `start` and
 * `stop`.  Message and close handlers are invoked on that thread.
 */
class WebsocketppClient : public IWebSocketClient
{
public:
    ~WebsocketppClient() override;

    void start() override;

    void stop() override;

    void openConnection(std::string uri, std::chrono::milliseconds timeout) override;

    bool isConnected(std::string uri) override;

    std::tuple<std::string, bool> send(std::string message, std::string uri) override;

    void receive(std::string uri, std::function<void(const std::string&)> messageHandler) override;

    void onClose(std::string uri, std::function<void(const std::string&)> closeHandler) override;

    void closeConnection(std::string uri) override;

private:
    typedef websocketpp::client<websocketpp::config::asio_tls_client> websocketpp_tls_client;
    typedef websocketpp::client<websocketpp::config::asio_client> websocketpp_plain_client;
    typedef std::shared_ptr<websocketpp::lib::asio::ssl::context> ssl_context_ptr;

    struct Connection
    {
        websocketpp::connection_hdl handle;
        bool secure = true;
    };

    websocketpp_tls_client _tlsClient;
    websocketpp_plain_client _plainClient;
    std::thread _ioThread;

    ///< A mutex to protect the instance properties.
    std::mutex _propertyMutex;

    std::unordered_map<std::string, Connection> _connections;
    std::unordered_map<std::string, std::function<void(const std::string&)>> _closeHandlers;

    static bool _isSecure(const std::string& uri);

    template <typename Endpoint>
    void _connect(Endpoint& endpoint, const std::string& uri, bool secure, std::chrono::milliseconds timeout);

    template <typename Endpoint>
    void _setMessageHandler(
        Endpoint& endpoint,
        const std::string& uri,
        websocketpp::connection_hdl handle,
        std::function<void(const std::string&)> messageHandler);

    template <typename Endpoint>
    static std::string _closeReason(Endpoint& endpoint, websocketpp::connection_hdl handle);

    /**
     * @brief Forgets a connection that ended without being asked to, and notifies its close
     * handler.
     * @remark Does nothing if `handle` is not the current connection for `uri`.
     */
    void _onConnectionLost(const std::string& uri, websocketpp::connection_hdl handle, const std::string& reason);

    static ssl_context_ptr _initTls(websocketpp::connection_hdl handle);
};
} // namespace client
} // namespace relaycast
