#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "relaycast/client/web_socket_client.hpp"
#include "relaycast/config.hpp"
#include "relaycast/data/data.hpp"
#include "relaycast/relay/event_stream.hpp"
#include "relaycast/relay/relay_observer.hpp"

namespace relaycast
{
namespace relay
{
class RelaySession;

enum class RelaySessionState
{
    Disconnected,
    Connecting,
    Connected,
    Disconnecting
};

enum class SubscriptionMode
{
    ///< The stream ends when the relay reports the end of its stored events.
    Batch,
    ///< The stream keeps delivering new events until it is closed.
    Live
};

/**
 * @brief A single `REQ` subscription on a single relay.
 * @remark Events arrive in the order the relay sends them.  Closing the subscription sends a
 * `CLOSE` message to the relay, if it is still connected, and releases any reader waiting in
 * `next`.
 */
class Subscription : public IEventSource
{
public:
    Subscription(
        std::string id,
        data::Filters filters,
        SubscriptionMode mode,
        std::string relay,
        std::weak_ptr<RelaySession> session,
        std::chrono::steady_clock::time_point deadline);

    const std::string& id() const { return this->_id; };

    const data::Filters& filters() const { return this->_filters; };

    SubscriptionMode mode() const { return this->_mode; };

    /**
     * @returns True once the relay has sent `EOSE` for this subscription.
     */
    bool storedEventsComplete() const { return this->_storedEventsComplete; };

    bool isClosed() const { return this->_closed; };

    std::optional<std::shared_ptr<data::Event>> next() override;

    void close() override;

    std::string name() const override;

private:
    friend class RelaySession;

    std::string _id;
    data::Filters _filters;
    SubscriptionMode _mode;
    std::string _relay;
    std::weak_ptr<RelaySession> _session;
    std::chrono::steady_clock::time_point _deadline;

    EventStream _stream;
    std::atomic<bool> _storedEventsComplete{ false };
    std::atomic<bool> _closed{ false };

    void _onEvent(std::shared_ptr<data::Event> event);

    void _onEose();

    void _finish();
};

/**
 * @brief Owns the connection to one relay and the subscriptions open on it.
 * @remark Sessions must be owned by a `std::shared_ptr`, since the message handler registered
 * with the WebSocket client holds a weak reference to the session.
 */
class RelaySession : public std::enable_shared_from_this<RelaySession>
{
public:
    RelaySession(
        data::RelayEndpoint endpoint,
        std::shared_ptr<client::IWebSocketClient> client,
        ClientConfig config,
        RelayObserver observer);

    ~RelaySession();

    const data::RelayEndpoint& endpoint() const { return this->_endpoint; };

    RelaySessionState state() const;

    /**
     * @brief Opens the connection to the relay.
     * @throws `ConnectionError` if the relay cannot be reached.  The session is left
     * `Disconnected`.
     */
    void connect();

    /**
     * @brief Closes the connection and finishes every open subscription.
     * @remark Safe to call in any state.  Never throws.
     */
    void disconnect();

    /**
     * @brief Replaces the connection with a new one and reissues every open subscription.
     * @throws `ConnectionError` if the relay cannot be reached.  Open subscriptions are finished
     * and the session is left `Disconnected`.
     */
    void reconnect();

    /**
     * @brief Sends a signed event to the relay and waits for its acknowledgment.
     * @returns The relay's acceptance of the event.
     * @throws `PublishRejected` if the relay rejects the event, the event cannot be sent, or no
     * acknowledgment arrives within the publish timeout.
     */
    data::PublishResult publish(const data::Event& event);

    /**
     * @brief Opens a subscription for events matching the given filters.
     * @throws `std::invalid_argument` if the filters are invalid.
     * @throws `ConnectionError` if the session is not connected.
     * @remark If the request cannot be sent, the returned subscription is already finished and
     * the failure is reported to the observer.
     */
    std::shared_ptr<Subscription> openSubscription(
        const data::Filters& filters,
        SubscriptionMode mode = SubscriptionMode::Live);

    /**
     * @brief Fetches the relay's stored events matching the given filters.
     * @remark Reads until `EOSE` or the query timeout, then closes the subscription.
     */
    std::vector<std::shared_ptr<data::Event>> collectOnce(const data::Filters& filters);

    /**
     * @returns The IDs of the subscriptions currently open on this relay.
     */
    std::vector<std::string> subscriptions() const;

private:
    friend class Subscription;

    typedef std::promise<std::tuple<bool, std::string>> acknowledgment_promise;

    data::RelayEndpoint _endpoint;
    std::shared_ptr<client::IWebSocketClient> _client;
    ClientConfig _config;
    RelayObserver _observer;

    ///< A mutex to protect the instance properties.
    mutable std::mutex _propertyMutex;

    RelaySessionState _state = RelaySessionState::Disconnected;

    ///< Open subscriptions, keyed by subscription ID.
    std::unordered_map<std::string, std::shared_ptr<Subscription>> _subscriptions;

    ///< Publishes waiting for an `OK`, keyed by event ID.
    std::unordered_map<std::string, std::shared_ptr<acknowledgment_promise>> _pendingAcknowledgments;

    void _setState(RelaySessionState state);

    /**
     * @brief Opens the transport and attaches the message handler.
     * @returns True if the relay is connected, false otherwise.
     */
    bool _openTransport();

    /**
     * @brief Finishes every open subscription and fails every pending publish.
     */
    void _releaseAll(const std::string& reason);

    /**
     * @brief Handles a connection the relay closed or that failed.
     * @remark Open subscriptions are finished and pending publishes fail, as for `disconnect`.
     * The session can be brought back with `connect` or `reconnect`.
     */
    void _onConnectionLost(const std::string& reason);

    bool _sendRequest(const std::shared_ptr<Subscription>& subscription);

    void _closeSubscription(const std::string& subscriptionId);

    std::shared_ptr<Subscription> _findSubscription(const std::string& subscriptionId) const;

    std::string _generateSubscriptionId() const;

    static std::string _generateCloseRequest(const std::string& subscriptionId);

    /**
     * @brief Dispatches a message received from the relay.
     * @remark Malformed messages are logged and reported to the observer; this method never
     * throws, as it runs on the WebSocket client's I/O thread.
     */
    void _onMessage(const std::string& message);

    void _onEventMessage(const nlohmann::json& jMessage);

    void _onAcceptance(const nlohmann::json& jMessage);

    void _notifyError(const std::string& message) const;
};
} // namespace relay
} // namespace relaycast
