#include <random>

#include <plog/Log.h>
#include <uuid_v4.h>

#include "relaycast/cryptography/event_codec.hpp"
#include "relaycast/errors.hpp"
#include "relaycast/relay/relay_session.hpp"

using namespace nlohmann;
using namespace std;

namespace relaycast
{
namespace relay
{
Subscription::Subscription(
    string id,
    data::Filters filters,
    SubscriptionMode mode,
    string relay,
    weak_ptr<RelaySession> session,
    chrono::steady_clock::time_point deadline)
: _id(move(id)),
  _filters(move(filters)),
  _mode(mode),
  _relay(move(relay)),
  _session(move(session)),
  _deadline(deadline) { };

optional<shared_ptr<data::Event>> Subscription::next()
{
    if (this->_mode == SubscriptionMode::Live)
    {
        return this->_stream.next();
    }

    auto event = this->_stream.next(this->_deadline);
    if (!event && !this->_stream.finished())
    {
        PLOG_WARNING << "Subscription " << this->_id << " on relay " << this->_relay
                     << " timed out before the end of stored events.";
        this->close();
    }

    return event;
};

void Subscription::close()
{
    if (this->_closed.exchange(true))
    {
        return;
    }

    auto session = this->_session.lock();
    if (session)
    {
        session->_closeSubscription(this->_id);
    }

    this->_stream.finish();
};

string Subscription::name() const
{
    return this->_relay + " (" + this->_id + ")";
};

void Subscription::_onEvent(shared_ptr<data::Event> event)
{
    this->_stream.push(move(event));
};

void Subscription::_onEose()
{
    this->_storedEventsComplete = true;

    if (this->_mode == SubscriptionMode::Batch)
    {
        this->close();
    }
};

void Subscription::_finish()
{
    this->_closed = true;
    this->_stream.finish();
};

RelaySession::RelaySession(
    data::RelayEndpoint endpoint,
    shared_ptr<client::IWebSocketClient> client,
    ClientConfig config,
    RelayObserver observer)
: _endpoint(move(endpoint)),
  _client(move(client)),
  _config(config),
  _observer(move(observer)) { };

RelaySession::~RelaySession()
{
    this->disconnect();
};

RelaySessionState RelaySession::state() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_state;
};

void RelaySession::connect()
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_state == RelaySessionState::Connected)
        {
            PLOG_VERBOSE << "Already connected to relay " << this->_endpoint.url;
            return;
        }
        this->_state = RelaySessionState::Connecting;
    }

    PLOG_VERBOSE << "Connecting to relay " << this->_endpoint.url;

    if (!this->_openTransport())
    {
        this->_setState(RelaySessionState::Disconnected);
        this->_notifyError("Failed to connect to relay.");
        throw ConnectionError(this->_endpoint.url, "Failed to connect to relay " + this->_endpoint.url);
    }

    this->_setState(RelaySessionState::Connected);
    PLOG_INFO << "Connected to relay " << this->_endpoint.name << " (" << this->_endpoint.url << ")";

    if (this->_observer.onConnected)
    {
        this->_observer.onConnected(this->_endpoint);
    }
};

void RelaySession::disconnect()
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_state == RelaySessionState::Disconnected)
        {
            return;
        }
        this->_state = RelaySessionState::Disconnecting;
    }

    try
    {
        this->_client->closeConnection(this->_endpoint.url);
    }
    catch (const exception& e)
    {
        PLOG_WARNING << "Error closing connection to relay " << this->_endpoint.url << ": " << e.what();
    }

    this->_releaseAll("Disconnected from relay.");
    this->_setState(RelaySessionState::Disconnected);

    PLOG_INFO << "Disconnected from relay " << this->_endpoint.url;
};

void RelaySession::reconnect()
{
    PLOG_INFO << "Reconnecting to relay " << this->_endpoint.url;
    this->_setState(RelaySessionState::Connecting);

    try
    {
        this->_client->closeConnection(this->_endpoint.url);
    }
    catch (const exception& e)
    {
        PLOG_WARNING << "Error closing connection to relay " << this->_endpoint.url << ": " << e.what();
    }

    // Acknowledgments for events sent on the old connection will never arrive.
    unordered_map<string, shared_ptr<acknowledgment_promise>> acknowledgments;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        acknowledgments.swap(this->_pendingAcknowledgments);
    }
    for (auto& [eventId, acknowledgment] : acknowledgments)
    {
        acknowledgment->set_value(make_tuple(false, string("Connection reset before acknowledgment.")));
    }

    if (!this->_openTransport())
    {
        this->_releaseAll("Failed to reconnect to relay.");
        this->_setState(RelaySessionState::Disconnected);
        this->_notifyError("Failed to reconnect to relay.");
        throw ConnectionError(this->_endpoint.url, "Failed to reconnect to relay " + this->_endpoint.url);
    }

    this->_setState(RelaySessionState::Connected);

    if (this->_observer.onConnected)
    {
        this->_observer.onConnected(this->_endpoint);
    }

    vector<shared_ptr<Subscription>> openSubscriptions;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (auto& [subscriptionId, subscription] : this->_subscriptions)
        {
            openSubscriptions.push_back(subscription);
        }
    }

    for (auto& subscription : openSubscriptions)
    {
        if (this->_sendRequest(subscription))
        {
            PLOG_VERBOSE << "Reissued subscription " << subscription->id() << " to relay " << this->_endpoint.url;
            continue;
        }

        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_subscriptions.erase(subscription->id());
        }
        subscription->_finish();
    }
};

data::PublishResult RelaySession::publish(const data::Event& event)
{
    // Serializing first rejects unsigned events before anything is sent.
    string message = "[\"EVENT\"," + event.serialize() + "]";

    auto acknowledgment = make_shared<acknowledgment_promise>();
    auto acknowledgmentFuture = acknowledgment->get_future();

    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_state != RelaySessionState::Connected)
        {
            throw PublishRejected(this->_endpoint.url, event.id, "Not connected to relay.");
        }
        this->_pendingAcknowledgments[event.id] = acknowledgment;
    }

    PLOG_VERBOSE << "Publishing event " << event.id << " to relay " << this->_endpoint.url;
    auto [uri, success] = this->_client->send(message, this->_endpoint.url);

    if (!success)
    {
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_pendingAcknowledgments.erase(event.id);
        }
        throw PublishRejected(uri, event.id, "Failed to send event to relay.");
    }

    if (acknowledgmentFuture.wait_for(this->_config.publishTimeout) == future_status::timeout)
    {
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_pendingAcknowledgments.erase(event.id);
        }
        throw PublishRejected(uri, event.id, "Timed out waiting for the relay to acknowledge the event.");
    }

    auto [accepted, reason] = acknowledgmentFuture.get();
    if (!accepted)
    {
        throw PublishRejected(uri, event.id, reason);
    }

    data::PublishResult result;
    result.relay = uri;
    result.eventId = event.id;
    result.accepted = true;
    result.message = reason;

    return result;
};

shared_ptr<Subscription> RelaySession::openSubscription(const data::Filters& filters, SubscriptionMode mode)
{
    filters.validate();

    if (this->state() != RelaySessionState::Connected)
    {
        throw ConnectionError(this->_endpoint.url, "Cannot subscribe: not connected to relay " + this->_endpoint.url);
    }

    auto subscription = make_shared<Subscription>(
        this->_generateSubscriptionId(),
        filters,
        mode,
        this->_endpoint.url,
        this->weak_from_this(),
        chrono::steady_clock::now() + this->_config.queryTimeout);

    // Register before sending so that replies arriving on the I/O thread find the subscription.
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        this->_subscriptions[subscription->id()] = subscription;
    }

    if (!this->_sendRequest(subscription))
    {
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_subscriptions.erase(subscription->id());
        }
        subscription->_finish();
        this->_notifyError("Failed to send subscription request.");
    }

    return subscription;
};

vector<shared_ptr<data::Event>> RelaySession::collectOnce(const data::Filters& filters)
{
    auto subscription = this->openSubscription(filters, SubscriptionMode::Batch);

    vector<shared_ptr<data::Event>> events;
    while (auto event = subscription->next())
    {
        events.push_back(*event);
    }
    subscription->close();

    PLOG_VERBOSE << "Collected " << events.size() << " events from relay " << this->_endpoint.url;
    return events;
};

vector<string> RelaySession::subscriptions() const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    vector<string> subscriptionIds;
    for (auto& [subscriptionId, subscription] : this->_subscriptions)
    {
        subscriptionIds.push_back(subscriptionId);
    }

    return subscriptionIds;
};

void RelaySession::_setState(RelaySessionState state)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_state = state;
};

bool RelaySession::_openTransport()
{
    this->_client->openConnection(this->_endpoint.url, this->_config.connectTimeout);
    if (!this->_client->isConnected(this->_endpoint.url))
    {
        return false;
    }

    weak_ptr<RelaySession> weakSelf = this->shared_from_this();
    this->_client->receive(this->_endpoint.url, [weakSelf](const string& message)
    {
        auto session = weakSelf.lock();
        if (session)
        {
            session->_onMessage(message);
        }
    });
    this->_client->onClose(this->_endpoint.url, [weakSelf](const string& reason)
    {
        auto session = weakSelf.lock();
        if (session)
        {
            session->_onConnectionLost(reason);
        }
    });

    // The relay may have dropped the connection before the close handler was attached.
    return this->_client->isConnected(this->_endpoint.url);
};

void RelaySession::_releaseAll(const string& reason)
{
    unordered_map<string, shared_ptr<Subscription>> subscriptions;
    unordered_map<string, shared_ptr<acknowledgment_promise>> acknowledgments;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        subscriptions.swap(this->_subscriptions);
        acknowledgments.swap(this->_pendingAcknowledgments);
    }

    for (auto& [subscriptionId, subscription] : subscriptions)
    {
        subscription->_finish();
    }

    for (auto& [eventId, acknowledgment] : acknowledgments)
    {
        acknowledgment->set_value(make_tuple(false, reason));
    }
};

void RelaySession::_onConnectionLost(const string& reason)
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_state != RelaySessionState::Connected)
        {
            return;
        }
        this->_state = RelaySessionState::Disconnected;
    }

    this->_releaseAll("Connection to relay lost.");
    this->_notifyError("Connection to relay lost: " + reason);
};

bool RelaySession::_sendRequest(const shared_ptr<Subscription>& subscription)
{
    string request = subscription->filters().serialize(subscription->id());
    PLOG_VERBOSE << "Sending subscription request to relay " << this->_endpoint.url << ": " << request;

    auto [uri, success] = this->_client->send(request, this->_endpoint.url);
    if (!success)
    {
        PLOG_WARNING << "Failed to send subscription request " << subscription->id() << " to relay " << uri;
    }

    return success;
};

void RelaySession::_closeSubscription(const string& subscriptionId)
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        bool wasOpen = this->_subscriptions.erase(subscriptionId) > 0;
        if (!wasOpen || this->_state != RelaySessionState::Connected)
        {
            return;
        }
    }

    auto [uri, success] = this->_client->send(_generateCloseRequest(subscriptionId), this->_endpoint.url);
    if (!success)
    {
        PLOG_WARNING << "Failed to close subscription " << subscriptionId << " on relay " << uri;
    }
};

shared_ptr<Subscription> RelaySession::_findSubscription(const string& subscriptionId) const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        return nullptr;
    }

    return it->second;
};

string RelaySession::_generateSubscriptionId() const
{
    UUIDv4::UUIDGenerator<std::mt19937_64> uuidGenerator;
    UUIDv4::UUID uuid = uuidGenerator.getUUID();
    return uuid.str();
};

string RelaySession::_generateCloseRequest(const string& subscriptionId)
{
    json jarr = json::array({ "CLOSE", subscriptionId });
    return jarr.dump();
};

void RelaySession::_onMessage(const string& message)
{
    PLOG_VERBOSE << "Received message from relay " << this->_endpoint.url << ": " << message;

    try
    {
        json jMessage = json::parse(message);
        if (!jMessage.is_array() || jMessage.empty() || !jMessage[0].is_string())
        {
            this->_notifyError("Received a message that is not a relay message: " + message);
            return;
        }

        string messageType = jMessage[0].get<string>();

        if (messageType == "EVENT")
        {
            this->_onEventMessage(jMessage);
        }
        else if (messageType == "EOSE")
        {
            auto subscription = this->_findSubscription(jMessage.at(1).get<string>());
            if (subscription)
            {
                subscription->_onEose();
            }
        }
        else if (messageType == "OK")
        {
            this->_onAcceptance(jMessage);
        }
        else if (messageType == "NOTICE")
        {
            string notice = jMessage.at(1).get<string>();
            PLOG_INFO << "Notice from relay " << this->_endpoint.url << ": " << notice;

            if (this->_observer.onNotice)
            {
                this->_observer.onNotice(this->_endpoint, notice);
            }
        }
        else if (messageType == "CLOSED")
        {
            string subscriptionId = jMessage.at(1).get<string>();
            string reason = jMessage.size() > 2 && jMessage[2].is_string()
                ? jMessage[2].get<string>()
                : "";

            shared_ptr<Subscription> subscription;
            {
                lock_guard<mutex> lock(this->_propertyMutex);
                auto it = this->_subscriptions.find(subscriptionId);
                if (it != this->_subscriptions.end())
                {
                    subscription = it->second;
                    this->_subscriptions.erase(it);
                }
            }

            if (subscription)
            {
                subscription->_finish();
                this->_notifyError("Relay closed subscription " + subscriptionId + ": " + reason);
            }
        }
        else
        {
            PLOG_VERBOSE << "Ignoring " << messageType << " message from relay " << this->_endpoint.url;
        }
    }
    catch (const json::exception& je)
    {
        this->_notifyError(string("Failed to parse relay message: ") + je.what());
    }
    catch (const invalid_argument& e)
    {
        this->_notifyError(string("Received an invalid event: ") + e.what());
    }
};

void RelaySession::_onEventMessage(const json& jMessage)
{
    string subscriptionId = jMessage.at(1).get<string>();
    auto subscription = this->_findSubscription(subscriptionId);
    if (!subscription)
    {
        PLOG_VERBOSE << "Ignoring event for unknown subscription " << subscriptionId;
        return;
    }

    auto event = make_shared<data::Event>(data::Event::fromJson(jMessage.at(2)));
    if (!cryptography::EventCodec::isValid(*event))
    {
        PLOG_WARNING << "Dropped event " << event->id << " from relay " << this->_endpoint.url
                     << ": ID or signature does not verify.";
        return;
    }

    subscription->_onEvent(event);
};

void RelaySession::_onAcceptance(const json& jMessage)
{
    string eventId = jMessage.at(1).get<string>();
    bool accepted = jMessage.at(2).get<bool>();
    string reason = jMessage.size() > 3 && jMessage[3].is_string()
        ? jMessage[3].get<string>()
        : "";

    shared_ptr<acknowledgment_promise> acknowledgment;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_pendingAcknowledgments.find(eventId);
        if (it != this->_pendingAcknowledgments.end())
        {
            acknowledgment = it->second;
            this->_pendingAcknowledgments.erase(it);
        }
    }

    if (!acknowledgment)
    {
        PLOG_VERBOSE << "Ignoring acknowledgment for unknown event " << eventId;
        return;
    }

    acknowledgment->set_value(make_tuple(accepted, reason));
};

void RelaySession::_notifyError(const string& message) const
{
    PLOG_WARNING << "Relay " << this->_endpoint.url << ": " << message;

    if (this->_observer.onError)
    {
        this->_observer.onError(this->_endpoint, message);
    }
};
} // namespace relay
} // namespace relaycast
