#include <atomic>
#include <future>

#include <plog/Log.h>

#include "relaycast/client/websocketpp_client.hpp"

using std::atomic;
using std::error_code;
using std::function;
using std::future_status;
using std::lock_guard;
using std::make_shared;
using std::make_tuple;
using std::move;
using std::mutex;
using std::promise;
using std::string;
using std::thread;
using std::to_string;
using std::tuple;

namespace asio = websocketpp::lib::asio;

namespace relaycast
{
namespace client
{
WebsocketppClient::~WebsocketppClient()
{
    this->stop();
};

void WebsocketppClient::start()
{
    if (this->_ioThread.joinable())
    {
        return;
    }

    this->_tlsClient.clear_access_channels(websocketpp::log::alevel::all);
    this->_tlsClient.clear_error_channels(websocketpp::log::elevel::all);
    this->_plainClient.clear_access_channels(websocketpp::log::alevel::all);
    this->_plainClient.clear_error_channels(websocketpp::log::elevel::all);

    // Both endpoints run on the TLS endpoint's io_service, so one thread drives every connection.
    this->_tlsClient.init_asio();
    this->_tlsClient.set_tls_init_handler(&WebsocketppClient::_initTls);
    this->_plainClient.init_asio(&this->_tlsClient.get_io_service());
    this->_tlsClient.start_perpetual();

    this->_ioThread = thread([this]() {
        this->_tlsClient.run();
    });
};

void WebsocketppClient::stop()
{
    if (!this->_ioThread.joinable())
    {
        return;
    }

    this->_tlsClient.stop_perpetual();

    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (auto& [uri, connection] : this->_connections)
        {
            error_code error;
            if (connection.secure)
            {
                this->_tlsClient.close(connection.handle, websocketpp::close::status::going_away, "Client stopped.", error);
            }
            else
            {
                this->_plainClient.close(connection.handle, websocketpp::close::status::going_away, "Client stopped.", error);
            }
        }
        this->_connections.clear();
        this->_closeHandlers.clear();
    }

    this->_ioThread.join();
};

void WebsocketppClient::openConnection(string uri, std::chrono::milliseconds timeout)
{
    if (_isSecure(uri))
    {
        this->_connect(this->_tlsClient, uri, true, timeout);
    }
    else
    {
        this->_connect(this->_plainClient, uri, false, timeout);
    }
};

bool WebsocketppClient::isConnected(string uri)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_connections.find(uri) != this->_connections.end();
};

tuple<string, bool> WebsocketppClient::send(string message, string uri)
{
    error_code error;

    // Make sure the connection isn't closed from under us.
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connections.find(uri);
    if (it == this->_connections.end())
    {
        return make_tuple(uri, false);
    }

    if (it->second.secure)
    {
        this->_tlsClient.send(it->second.handle, message, websocketpp::frame::opcode::text, error);
    }
    else
    {
        this->_plainClient.send(it->second.handle, message, websocketpp::frame::opcode::text, error);
    }

    if (error)
    {
        PLOG_WARNING << "Error sending message to relay " << uri << ": " << error.message();
        return make_tuple(uri, false);
    }

    return make_tuple(uri, true);
};

void WebsocketppClient::receive(string uri, function<void(const string&)> messageHandler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connections.find(uri);
    if (it == this->_connections.end())
    {
        PLOG_WARNING << "Cannot receive from relay " << uri << ": not connected.";
        return;
    }

    if (it->second.secure)
    {
        this->_setMessageHandler(this->_tlsClient, uri, it->second.handle, messageHandler);
    }
    else
    {
        this->_setMessageHandler(this->_plainClient, uri, it->second.handle, messageHandler);
    }
};

void WebsocketppClient::onClose(string uri, function<void(const string&)> closeHandler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_closeHandlers[uri] = closeHandler;
};

void WebsocketppClient::closeConnection(string uri)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_closeHandlers.erase(uri);

    auto it = this->_connections.find(uri);
    if (it == this->_connections.end())
    {
        return;
    }

    error_code error;
    if (it->second.secure)
    {
        this->_tlsClient.close(it->second.handle, websocketpp::close::status::going_away, "Client requested close.", error);
    }
    else
    {
        this->_plainClient.close(it->second.handle, websocketpp::close::status::going_away, "Client requested close.", error);
    }
    if (error)
    {
        PLOG_WARNING << "Error closing connection to relay " << uri << ": " << error.message();
    }

    // Erasing the connection first keeps the close handler from reporting a requested close.
    this->_connections.erase(it);
};

bool WebsocketppClient::_isSecure(const string& uri)
{
    return uri.rfind("ws://", 0) != 0;
};

template <typename Endpoint>
void WebsocketppClient::_connect(Endpoint& endpoint, const string& uri, bool secure, std::chrono::milliseconds timeout)
{
    error_code error;
    typename Endpoint::connection_ptr connection = endpoint.get_connection(uri, error);

    if (error)
    {
        PLOG_ERROR << "Error connecting to relay " << uri << ": " << error.message();
        return;
    }

    auto openPromise = make_shared<promise<bool>>();
    auto settled = make_shared<atomic<bool>>(false);
    auto openFuture = openPromise->get_future();

    connection->set_open_handler([this, uri, secure, openPromise, settled](websocketpp::connection_hdl handle) {
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_connections[uri] = Connection{ handle, secure };
        }
        if (!settled->exchange(true))
        {
            openPromise->set_value(true);
        }
    });

    connection->set_fail_handler([this, &endpoint, uri, openPromise, settled](websocketpp::connection_hdl handle) {
        string reason = _closeReason(endpoint, handle);
        PLOG_ERROR << "Error connecting to relay " << uri << ": " << reason;

        this->_onConnectionLost(uri, handle, reason);
        if (!settled->exchange(true))
        {
            openPromise->set_value(false);
        }
    });

    connection->set_close_handler([this, &endpoint, uri](websocketpp::connection_hdl handle) {
        PLOG_INFO << "Connection to relay " << uri << " closed.";
        this->_onConnectionLost(uri, handle, _closeReason(endpoint, handle));
    });

    endpoint.connect(connection);

    if (openFuture.wait_for(timeout) == future_status::timeout)
    {
        PLOG_ERROR << "Timed out connecting to relay " << uri;
        if (!settled->exchange(true))
        {
            connection->terminate(error);
        }
    }
};

template <typename Endpoint>
void WebsocketppClient::_setMessageHandler(
    Endpoint& endpoint,
    const string& uri,
    websocketpp::connection_hdl handle,
    function<void(const string&)> messageHandler)
{
    error_code error;
    auto connection = endpoint.get_con_from_hdl(handle, error);
    if (error)
    {
        PLOG_WARNING << "Cannot receive from relay " << uri << ": " << error.message();
        return;
    }

    connection->set_message_handler([messageHandler](
        websocketpp::connection_hdl connectionHandle,
        typename Endpoint::message_ptr message)
    {
        messageHandler(message->get_payload());
    });
};

template <typename Endpoint>
string WebsocketppClient::_closeReason(Endpoint& endpoint, websocketpp::connection_hdl handle)
{
    error_code error;
    auto connection = endpoint.get_con_from_hdl(handle, error);
    if (error)
    {
        return error.message();
    }

    string reason = connection->get_remote_close_reason();
    if (!reason.empty())
    {
        return reason;
    }

    if (connection->get_ec())
    {
        return connection->get_ec().message();
    }

    return "Connection closed with code " + to_string(connection->get_remote_close_code()) + ".";
};

void WebsocketppClient::_onConnectionLost(const string& uri, websocketpp::connection_hdl handle, const string& reason)
{
    function<void(const string&)> closeHandler;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_connections.find(uri);
        if (it == this->_connections.end()
            || it->second.handle.owner_before(handle)
            || handle.owner_before(it->second.handle))
        {
            return;
        }
        this->_connections.erase(it);

        auto handlerIt = this->_closeHandlers.find(uri);
        if (handlerIt != this->_closeHandlers.end())
        {
            closeHandler = move(handlerIt->second);
            this->_closeHandlers.erase(handlerIt);
        }
    }

    PLOG_WARNING << "Lost connection to relay " << uri << ": " << reason;

    // The handler may call back into the client, so it runs without the lock held.
    if (closeHandler)
    {
        closeHandler(reason);
    }
};

WebsocketppClient::ssl_context_ptr WebsocketppClient::_initTls(websocketpp::connection_hdl handle)
{
    auto context = make_shared<asio::ssl::context>(asio::ssl::context::sslv23_client);

    try
    {
        context->set_options(
            asio::ssl::context::default_workarounds
            | asio::ssl::context::no_sslv2
            | asio::ssl::context::no_sslv3
            | asio::ssl::context::single_dh_use);
        context->set_default_verify_paths();
        context->set_verify_mode(asio::ssl::verify_peer);
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << "Failed to initialize the TLS context: " << e.what();
    }

    return context;
};
} // namespace client
} // namespace relaycast
