#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include "relaycast/client/web_socket_client.hpp"
#include "relaycast/cryptography/event_codec.hpp"
#include "relaycast/cryptography/key_codec.hpp"
#include "relaycast/data/data.hpp"

namespace relaycast_test
{
class MockWebSocketClient : public relaycast::client::IWebSocketClient
{
public:
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, openConnection, (std::string uri, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(bool, isConnected, (std::string uri), (override));
    MOCK_METHOD((std::tuple<std::string, bool>), send, (std::string message, std::string uri), (override));
    MOCK_METHOD(void, receive, (std::string uri, std::function<void(const std::string&)> messageHandler), (override));
    MOCK_METHOD(void, onClose, (std::string uri, std::function<void(const std::string&)> closeHandler), (override));
    MOCK_METHOD(void, closeConnection, (std::string uri), (override));
};

/**
 * @brief Answers a `MockWebSocketClient` the way a set of relays would.
 * @remark Replies are delivered synchronously, through the handler captured by `receive`, before
 * `send` returns.  `REQ` is answered with the matching stored events and `EOSE`; `EVENT` is
 * answered with `OK` and the event is kept for inspection.
 */
class FakeRelayNetwork
{
public:
    void addRelay(const std::string& uri, bool reachable = true)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_relays[uri].reachable = reachable;
    };

    void setReachable(const std::string& uri, bool reachable)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_relays[uri].reachable = reachable;
    };

    void store(const std::string& uri, const relaycast::data::Event& event)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_relays[uri].stored.push_back(event);
    };

    void rejectEvents(const std::string& uri, const std::string& reason)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_relays[uri].rejectReason = reason;
    };

    ///< The relay receives messages but never answers.
    void silence(const std::string& uri)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_relays[uri].silent = true;
    };

    std::vector<std::string> sentMessages(const std::string& uri)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_relays[uri].sent;
    };

    std::vector<std::string> sentMessages(const std::string& uri, const std::string& type)
    {
        std::vector<std::string> matching;
        for (const std::string& message : this->sentMessages(uri))
        {
            if (nlohmann::json::parse(message)[0] == type)
            {
                matching.push_back(message);
            }
        }
        return matching;
    };

    std::vector<relaycast::data::Event> published(const std::string& uri)
    {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_relays[uri].published;
    };

    /**
     * @brief Closes the connection from the relay's side and notifies the close handler.
     */
    void drop(const std::string& uri, const std::string& reason = "Connection reset by relay.")
    {
        std::function<void(const std::string&)> closeHandler;
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            RelayState& relay = this->_relays[uri];
            if (!relay.connected)
            {
                return;
            }
            relay.connected = false;
            relay.handler = nullptr;
            closeHandler = relay.closeHandler;
            relay.closeHandler = nullptr;
        }

        if (closeHandler)
        {
            closeHandler(reason);
        }
    };

    /**
     * @brief Delivers a raw message from the relay, as if it arrived unprompted.
     */
    void push(const std::string& uri, const std::string& message)
    {
        std::function<void(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            handler = this->_relays[uri].handler;
        }

        if (handler)
        {
            handler(message);
        }
    };

    void attach(MockWebSocketClient& client)
    {
        using ::testing::_;
        using ::testing::Invoke;

        ON_CALL(client, openConnection(_, _))
            .WillByDefault(Invoke([this](std::string uri, std::chrono::milliseconds timeout)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                auto it = this->_relays.find(uri);
                if (it != this->_relays.end() && it->second.reachable)
                {
                    it->second.connected = true;
                }
            }));

        ON_CALL(client, isConnected(_))
            .WillByDefault(Invoke([this](std::string uri)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                auto it = this->_relays.find(uri);
                return it != this->_relays.end() && it->second.connected;
            }));

        ON_CALL(client, receive(_, _))
            .WillByDefault(Invoke([this](std::string uri, std::function<void(const std::string&)> handler)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                this->_relays[uri].handler = handler;
            }));

        ON_CALL(client, onClose(_, _))
            .WillByDefault(Invoke([this](std::string uri, std::function<void(const std::string&)> closeHandler)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                this->_relays[uri].closeHandler = closeHandler;
            }));

        ON_CALL(client, closeConnection(_))
            .WillByDefault(Invoke([this](std::string uri)
            {
                std::lock_guard<std::mutex> lock(this->_mutex);
                this->_relays[uri].connected = false;
                this->_relays[uri].closeHandler = nullptr;
            }));

        ON_CALL(client, send(_, _))
            .WillByDefault(Invoke([this](std::string message, std::string uri)
            {
                return this->_onSend(message, uri);
            }));
    };

    /**
     * @brief Builds a signed event, so that it survives signature checks on receipt.
     */
    static relaycast::data::Event makeSignedEvent(
        const std::string& privateKeyHex,
        int kind,
        const std::string& content,
        std::vector<std::vector<std::string>> tags = {},
        std::time_t createdAt = 1700000000)
    {
        relaycast::data::Event event;
        event.kind = kind;
        event.content = content;
        event.tags = tags;
        event.createdAt = createdAt;

        relaycast::cryptography::EventCodec::signEvent(
            event,
            relaycast::cryptography::KeyPair::fromPrivateKey(privateKeyHex));
        return event;
    };

private:
    struct RelayState
    {
        bool reachable = true;
        bool connected = false;
        bool silent = false;
        std::string rejectReason;
        std::function<void(const std::string&)> handler;
        std::function<void(const std::string&)> closeHandler;
        std::vector<relaycast::data::Event> stored;
        std::vector<relaycast::data::Event> published;
        std::vector<std::string> sent;
    };

    std::mutex _mutex;
    std::unordered_map<std::string, RelayState> _relays;

    std::tuple<std::string, bool> _onSend(const std::string& message, const std::string& uri)
    {
        using nlohmann::json;

        std::vector<std::string> replies;
        std::function<void(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lock(this->_mutex);
            auto it = this->_relays.find(uri);
            if (it == this->_relays.end() || !it->second.connected)
            {
                return std::make_tuple(uri, false);
            }

            RelayState& relay = it->second;
            relay.sent.push_back(message);
            handler = relay.handler;

            json jMessage = json::parse(message);
            std::string type = jMessage[0].get<std::string>();

            if (relay.silent)
            {
                return std::make_tuple(uri, true);
            }

            if (type == "REQ")
            {
                std::string subscriptionId = jMessage[1].get<std::string>();
                json filter = jMessage[2];

                std::vector<relaycast::data::Event> matching;
                for (const auto& event : relay.stored)
                {
                    if (_matches(filter, event))
                    {
                        matching.push_back(event);
                    }
                }

                std::stable_sort(matching.begin(), matching.end(), [](const auto& a, const auto& b) {
                    return a.createdAt > b.createdAt;
                });
                if (filter.contains("limit") && matching.size() > filter["limit"].get<size_t>())
                {
                    matching.resize(filter["limit"].get<size_t>());
                }

                for (const auto& event : matching)
                {
                    replies.push_back(json::array({ "EVENT", subscriptionId, event }).dump());
                }
                replies.push_back(json::array({ "EOSE", subscriptionId }).dump());
            }
            else if (type == "EVENT")
            {
                relaycast::data::Event event = jMessage[1].get<relaycast::data::Event>();
                bool accepted = relay.rejectReason.empty();
                if (accepted)
                {
                    relay.published.push_back(event);
                }
                replies.push_back(json::array({ "OK", event.id, accepted, relay.rejectReason }).dump());
            }
        }

        for (const std::string& reply : replies)
        {
            if (handler)
            {
                handler(reply);
            }
        }

        return std::make_tuple(uri, true);
    };

    static bool _contains(const nlohmann::json& values, const nlohmann::json& value)
    {
        return std::find(values.begin(), values.end(), value) != values.end();
    };

    static bool _matches(const nlohmann::json& filter, const relaycast::data::Event& event)
    {
        if (filter.contains("ids") && !_contains(filter["ids"], event.id))
        {
            return false;
        }
        if (filter.contains("authors") && !_contains(filter["authors"], event.pubkey))
        {
            return false;
        }
        if (filter.contains("kinds") && !_contains(filter["kinds"], event.kind))
        {
            return false;
        }
        if (filter.contains("since") && event.createdAt < filter["since"].get<std::time_t>())
        {
            return false;
        }
        if (filter.contains("until") && event.createdAt > filter["until"].get<std::time_t>())
        {
            return false;
        }

        for (auto& item : filter.items())
        {
            if (item.key().empty() || item.key()[0] != '#')
            {
                continue;
            }

            std::string tagName = item.key().substr(1);
            bool tagged = std::any_of(event.tags.begin(), event.tags.end(), [&](const auto& tag) {
                return tag.size() > 1 && tag[0] == tagName && _contains(item.value(), tag[1]);
            });
            if (!tagged)
            {
                return false;
            }
        }

        return true;
    };
};
} // namespace relaycast_test
