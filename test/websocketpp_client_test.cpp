#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "relaycast/client/websocketpp_client.hpp"

using namespace relaycast;
using namespace std;

namespace relaycast_test
{
/**
 * @brief Runs the client against a plain `ws://` echo server on the loopback interface.
 */
class WebsocketppClientTest : public testing::Test
{
protected:
    typedef websocketpp::server<websocketpp::config::asio> echo_server;

    echo_server server;
    thread serverThread;
    uint16_t port = 0;

    mutex serverMutex;
    vector<websocketpp::connection_hdl> serverConnections;

    client::WebsocketppClient relayClient;

    static void SetUpTestSuite()
    {
        static plog::ConsoleAppender<plog::TxtFormatter> testAppender;
        plog::init(plog::warning, &testAppender);
    };

    void SetUp() override
    {
        server.clear_access_channels(websocketpp::log::alevel::all);
        server.clear_error_channels(websocketpp::log::elevel::all);
        server.init_asio();
        server.set_reuse_addr(true);

        server.set_open_handler([this](websocketpp::connection_hdl handle) {
            lock_guard<mutex> lock(serverMutex);
            serverConnections.push_back(handle);
        });
        server.set_message_handler([this](websocketpp::connection_hdl handle, echo_server::message_ptr message) {
            error_code error;
            server.send(handle, message->get_payload(), message->get_opcode(), error);
        });

        server.listen(websocketpp::lib::asio::ip::tcp::v4(), 0);
        server.start_accept();

        websocketpp::lib::asio::error_code error;
        port = server.get_local_endpoint(error).port();
        ASSERT_FALSE(error) << error.message();

        serverThread = thread([this]() { server.run(); });
        relayClient.start();
    };

    void TearDown() override
    {
        relayClient.stop();

        error_code error;
        server.stop_listening(error);
        {
            lock_guard<mutex> lock(serverMutex);
            for (auto& handle : serverConnections)
            {
                server.close(handle, websocketpp::close::status::going_away, "Test finished.", error);
            }
        }
        server.stop();
        serverThread.join();
    };

    string uri() const
    {
        return "ws://127.0.0.1:" + to_string(port);
    };

    void closeFromServer(const string& reason)
    {
        lock_guard<mutex> lock(serverMutex);
        for (auto& handle : serverConnections)
        {
            error_code error;
            server.close(handle, websocketpp::close::status::normal, reason, error);
        }
    };
};

TEST_F(WebsocketppClientTest, OpenConnection_ConnectsWithoutTls_ForWsUri)
{
    relayClient.openConnection(uri(), chrono::seconds(2));

    ASSERT_TRUE(relayClient.isConnected(uri()));
};

TEST_F(WebsocketppClientTest, Send_DeliversMessage_AndReceiveGetsReply)
{
    relayClient.openConnection(uri(), chrono::seconds(2));
    ASSERT_TRUE(relayClient.isConnected(uri()));

    auto replyPromise = make_shared<promise<string>>();
    auto replyFuture = replyPromise->get_future();
    relayClient.receive(uri(), [replyPromise](const string& message) {
        replyPromise->set_value(message);
    });

    auto [sentTo, sent] = relayClient.send("[\"NOTICE\",\"ping\"]", uri());

    ASSERT_TRUE(sent);
    ASSERT_EQ(sentTo, uri());
    ASSERT_EQ(replyFuture.wait_for(chrono::seconds(2)), future_status::ready);
    ASSERT_EQ(replyFuture.get(), "[\"NOTICE\",\"ping\"]");
};

TEST_F(WebsocketppClientTest, OnClose_IsNotified_WhenServerClosesConnection)
{
    relayClient.openConnection(uri(), chrono::seconds(2));
    ASSERT_TRUE(relayClient.isConnected(uri()));

    auto closedPromise = make_shared<promise<string>>();
    auto closedFuture = closedPromise->get_future();
    relayClient.onClose(uri(), [closedPromise](const string& reason) {
        closedPromise->set_value(reason);
    });

    closeFromServer("relay restarting");

    ASSERT_EQ(closedFuture.wait_for(chrono::seconds(2)), future_status::ready);
    ASSERT_EQ(closedFuture.get(), "relay restarting");
    ASSERT_FALSE(relayClient.isConnected(uri()));

    auto [sentTo, sent] = relayClient.send("[\"NOTICE\",\"ping\"]", uri());
    ASSERT_FALSE(sent);
};

TEST_F(WebsocketppClientTest, CloseConnection_DoesNotNotifyCloseHandler)
{
    relayClient.openConnection(uri(), chrono::seconds(2));
    ASSERT_TRUE(relayClient.isConnected(uri()));

    auto notified = make_shared<atomic<bool>>(false);
    relayClient.onClose(uri(), [notified](const string& reason) {
        notified->store(true);
    });

    relayClient.closeConnection(uri());
    this_thread::sleep_for(chrono::milliseconds(200));

    ASSERT_FALSE(relayClient.isConnected(uri()));
    ASSERT_FALSE(notified->load());
};

TEST_F(WebsocketppClientTest, OpenConnection_LeavesClientDisconnected_WhenNothingListens)
{
    string unreachable = "ws://127.0.0.1:1";
    relayClient.openConnection(unreachable, chrono::seconds(2));

    ASSERT_FALSE(relayClient.isConnected(unreachable));
};
} // namespace relaycast_test
