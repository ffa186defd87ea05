#include <algorithm>
#include <ctime>
#include <future>
#include <thread>
#include <unordered_set>

#include <plog/Log.h>

#include "relaycast/cryptography/event_codec.hpp"
#include "relaycast/cryptography/nip19.hpp"
#include "relaycast/errors.hpp"
#include "relaycast/service/nostr_client.hpp"
#include "../internal/logging.hpp"

using namespace nlohmann;
using namespace relaycast::cryptography;
using namespace relaycast::data;
using namespace relaycast::relay;
using namespace std;

namespace relaycast
{
namespace service
{
NostrClient::NostrClient(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<client::IWebSocketClient> client,
    vector<RelayEndpoint> relays,
    ClientConfig config,
    RelayObserver observer)
: _client(client), _relays(relays), _config(config), _observer(observer)
{
    internal::initLogging(appender, config.severity);
    client->start();
};

NostrClient::~NostrClient()
{
    this->disconnectAll();
    this->_client->stop();
};

string NostrClient::setIdentity(const string& privateKey)
{
    if (privateKey.rfind(Nip19Codec::PUBLIC_KEY_PREFIX, 0) == 0)
    {
        throw DecodeError("NostrClient::setIdentity: Expected a private key, but received a public key.");
    }

    KeyPair keys = KeyPair::fromPrivateKey(Nip19Codec::decode(privateKey));

    lock_guard<mutex> lock(this->_propertyMutex);
    this->_keys = keys;
    this->_publicKey = keys.publicKey;

    PLOG_INFO << "Identity set to " << Nip19Codec::encodePublicKey(keys.publicKey);
    return keys.publicKey;
};

string NostrClient::setPublicKey(const string& publicKey)
{
    string publicKeyHex = Nip19Codec::decodePublicKey(publicKey);

    lock_guard<mutex> lock(this->_propertyMutex);
    this->_keys = KeyPair();
    this->_publicKey = publicKeyHex;

    PLOG_INFO << "Read-only identity set to " << Nip19Codec::encodePublicKey(publicKeyHex);
    return publicKeyHex;
};

string NostrClient::publicKey() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_publicKey;
};

vector<RelayEndpoint> NostrClient::relays() const { return this->_relays; };

vector<RelayEndpoint> NostrClient::activeRelays() const
{
    vector<RelayEndpoint> activeRelays;
    for (auto& session : this->_connectedSessions())
    {
        activeRelays.push_back(session->endpoint());
    }

    return activeRelays;
};

tuple<vector<string>, vector<string>> NostrClient::connectAll()
{
    PLOG_INFO << "Attempting to connect to Nostr relays.";

    vector<shared_ptr<RelaySession>> newSessions;
    {
        lock_guard<mutex> lock(this->_propertyMutex);

        // Sessions only join the set once connected, so a disconnected one has lost its relay.
        this->_sessions.erase(
            remove_if(
                this->_sessions.begin(),
                this->_sessions.end(),
                [](const shared_ptr<RelaySession>& session) {
                    return session->state() == RelaySessionState::Disconnected;
                }),
            this->_sessions.end());

        for (const RelayEndpoint& endpoint : this->_relays)
        {
            bool hasSession = any_of(
                this->_sessions.begin(),
                this->_sessions.end(),
                [&endpoint](const shared_ptr<RelaySession>& session) {
                    return session->endpoint().url == endpoint.url;
                });
            if (!hasSession)
            {
                newSessions.push_back(make_shared<RelaySession>(endpoint, this->_client, this->_config, this->_observer));
            }
        }
    }

    vector<string> successes;
    vector<string> failures;
    mutex resultMutex;

    vector<thread> connectionThreads;
    for (auto& session : newSessions)
    {
        thread connectionThread([this, session, &successes, &failures, &resultMutex]() {
            try
            {
                session->connect();
            }
            catch (const ConnectionError& e)
            {
                PLOG_ERROR << e.what();
                lock_guard<mutex> lock(resultMutex);
                failures.push_back(e.relay());
                return;
            }

            {
                lock_guard<mutex> lock(this->_propertyMutex);
                this->_sessions.push_back(session);
            }

            lock_guard<mutex> lock(resultMutex);
            successes.push_back(session->endpoint().url);
        });
        connectionThreads.push_back(move(connectionThread));
    }

    for (thread& connectionThread : connectionThreads)
    {
        connectionThread.join();
    }

    size_t targetCount = this->_relays.size();
    size_t activeCount = this->activeRelays().size();
    PLOG_INFO << "Connected to " << activeCount << "/" << targetCount << " target relays.";

    if (activeCount == 0)
    {
        PLOG_WARNING << "No relays are connected.";
    }

    return make_tuple(successes, failures);
};

tuple<vector<string>, vector<string>> NostrClient::disconnectAll()
{
    vector<shared_ptr<RelaySession>> sessions;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        sessions.swap(this->_sessions);
    }

    if (sessions.empty())
    {
        PLOG_VERBOSE << "No active relay connections to close.";
        return make_tuple(vector<string>(), vector<string>());
    }

    PLOG_INFO << "Disconnecting from Nostr relays.";

    vector<thread> disconnectionThreads;
    for (auto& session : sessions)
    {
        thread disconnectionThread([session]() {
            session->disconnect();
        });
        disconnectionThreads.push_back(move(disconnectionThread));
    }

    for (thread& disconnectionThread : disconnectionThreads)
    {
        disconnectionThread.join();
    }

    vector<string> successes;
    vector<string> failures;
    for (auto& session : sessions)
    {
        if (session->state() == RelaySessionState::Disconnected)
        {
            successes.push_back(session->endpoint().url);
        }
        else
        {
            failures.push_back(session->endpoint().url);
        }
    }

    PLOG_INFO << "Disconnected from " << successes.size() << "/" << sessions.size() << " relays.";
    return make_tuple(successes, failures);
};

tuple<vector<string>, vector<string>> NostrClient::reconnectAll()
{
    vector<shared_ptr<RelaySession>> sessions;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        sessions = this->_sessions;
    }

    PLOG_INFO << "Reconnecting to " << sessions.size() << " Nostr relays.";

    vector<string> successes;
    vector<string> failures;
    mutex resultMutex;

    vector<thread> reconnectionThreads;
    for (auto& session : sessions)
    {
        thread reconnectionThread([session, &successes, &failures, &resultMutex]() {
            try
            {
                session->reconnect();
            }
            catch (const ConnectionError& e)
            {
                PLOG_ERROR << e.what();
                lock_guard<mutex> lock(resultMutex);
                failures.push_back(e.relay());
                return;
            }

            lock_guard<mutex> lock(resultMutex);
            successes.push_back(session->endpoint().url);
        });
        reconnectionThreads.push_back(move(reconnectionThread));
    }

    for (thread& reconnectionThread : reconnectionThreads)
    {
        reconnectionThread.join();
    }

    {
        lock_guard<mutex> lock(this->_propertyMutex);
        this->_sessions.erase(
            remove_if(
                this->_sessions.begin(),
                this->_sessions.end(),
                [&failures](const shared_ptr<RelaySession>& session) {
                    return find(failures.begin(), failures.end(), session->endpoint().url) != failures.end();
                }),
            this->_sessions.end());
    }

    PLOG_INFO << "Reconnected to " << successes.size() << "/" << sessions.size() << " relays.";
    return make_tuple(successes, failures);
};

unique_ptr<SubscriptionMultiplexer> NostrClient::filter(const Filters& filters, bool unique)
{
    filters.validate();

    vector<shared_ptr<IEventSource>> sources;
    for (auto& session : this->_connectedSessions())
    {
        try
        {
            sources.push_back(session->openSubscription(filters, SubscriptionMode::Batch));
        }
        catch (const ConnectionError& e)
        {
            PLOG_WARNING << "Skipping relay " << e.relay() << " for this query: " << e.what();
        }
    }

    return make_unique<SubscriptionMultiplexer>(sources, unique);
};

bool NostrClient::isValidEvent(const Event& event) const
{
    return EventCodec::isValid(event);
};

Profile NostrClient::queryProfile(const string& publicKey)
{
    // A private key must never end up in a filter sent to relays.
    string publicKeyHex = Nip19Codec::decodePublicKey(publicKey);
    Profile profile;

    Filters metadataFilters;
    metadataFilters.kinds.push_back(static_cast<int>(Kind::Metadata));
    metadataFilters.authors.push_back(publicKeyHex);
    metadataFilters.limit = 1;

    auto metadata = _newest(this->filter(metadataFilters)->collect());
    if (metadata)
    {
        try
        {
            json content = _parseContent(*metadata);
            if (content.contains("name") && content["name"].is_string())
            {
                profile.name = content["name"].get<string>();
            }
            if (content.contains("about") && content["about"].is_string())
            {
                profile.about = content["about"].get<string>();
            }
            if (content.contains("picture") && content["picture"].is_string())
            {
                profile.picture = content["picture"].get<string>();
            }
        }
        catch (const ProfileParseSkipped& e)
        {
            PLOG_WARNING << e.what();
        }
    }

    Filters contactFilters;
    contactFilters.kinds.push_back(static_cast<int>(Kind::Contacts));
    contactFilters.authors.push_back(publicKeyHex);

    auto contacts = _newest(this->filter(contactFilters)->collect());
    if (contacts)
    {
        // Relay preferences are optional in a contact list; an empty content carries none.
        if (!contacts->content.empty())
        {
            try
            {
                json content = _parseContent(*contacts);
                for (auto& item : content.items())
                {
                    const json& preference = item.value();

                    RelayPreference relayPreference;
                    relayPreference.url = item.key();
                    relayPreference.read = preference.is_object() && preference.value("read", false);
                    relayPreference.write = preference.is_object() && preference.value("write", false);
                    profile.relays.push_back(relayPreference);
                }
            }
            catch (const ProfileParseSkipped& e)
            {
                PLOG_WARNING << e.what();
            }
            catch (const json::exception& je)
            {
                PLOG_WARNING << "Skipping relay preferences in event " << contacts->id << ": " << je.what();
            }
        }

        for (const auto& tag : contacts->tags)
        {
            if (tag.size() > 1 && tag[0] == "p")
            {
                profile.following.push_back(Contact{ tag[1], "" });
            }
        }
    }

    Filters followerFilters;
    followerFilters.kinds.push_back(static_cast<int>(Kind::Contacts));
    followerFilters.tags["p"] = { publicKeyHex };

    unordered_set<string> followerKeys;
    for (auto& event : this->filter(followerFilters)->collect())
    {
        if (followerKeys.insert(event->pubkey).second)
        {
            profile.followers.push_back(Contact{ event->pubkey, "" });
        }
    }

    PLOG_VERBOSE << "Profile for " << publicKeyHex << ": " << profile.following.size() << " following, "
                 << profile.followers.size() << " followers.";
    return profile;
};

Profile NostrClient::myProfile()
{
    return this->queryProfile(this->_requirePublicKey());
};

vector<Post> NostrClient::globalFeed(const FeedOptions& options)
{
    Filters filters;
    filters.kinds.push_back(static_cast<int>(Kind::TextNote));
    filters.limit = options.limit;
    filters.since = options.since;
    filters.authors = options.authors;

    return this->_queryPosts(filters);
};

vector<Post> NostrClient::myPosts()
{
    Filters filters;
    filters.kinds.push_back(static_cast<int>(Kind::TextNote));
    filters.authors.push_back(this->_requirePublicKey());

    return this->_queryPosts(filters);
};

tuple<Post, vector<PublishResult>> NostrClient::publishText(const string& content)
{
    return this->_publishTextNote(content, {});
};

tuple<Post, vector<PublishResult>> NostrClient::publishReply(const string& content, const Post& parent)
{
    string root = parent.rootReference.value_or(parent.id);

    vector<vector<string>> tags = {
        { "e", root, "", "root" },
        { "e", parent.id, "", "reply" },
        { "p", parent.author }
    };

    return this->_publishTextNote(content, tags);
};

vector<tuple<Post, vector<PublishResult>>> NostrClient::publishThread(const vector<string>& contents)
{
    if (contents.size() < 2)
    {
        throw ThreadTooShortError("NostrClient::publishThread: A thread needs at least 2 posts.");
    }

    vector<tuple<Post, vector<PublishResult>>> posts;
    posts.push_back(this->publishText(contents[0]));

    string rootId = get<0>(posts.front()).id;
    for (size_t i = 1; i < contents.size(); i++)
    {
        string previousId = get<0>(posts.back()).id;

        vector<vector<string>> tags;
        if (i == 1)
        {
            tags.push_back({ "e", rootId, "", "root" });
        }
        tags.push_back({ "e", previousId, "", "reply" });

        posts.push_back(this->_publishTextNote(contents[i], tags));
    }

    PLOG_INFO << "Published a thread of " << posts.size() << " posts.";
    return posts;
};

vector<shared_ptr<RelaySession>> NostrClient::_connectedSessions() const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    vector<shared_ptr<RelaySession>> sessions;
    for (auto& session : this->_sessions)
    {
        if (session->state() == RelaySessionState::Connected)
        {
            sessions.push_back(session);
        }
    }

    return sessions;
};

Event NostrClient::_buildTextNote(const string& content, vector<vector<string>> tags) const
{
    KeyPair keys;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        keys = this->_keys;
    }

    if (keys.empty())
    {
        throw IdentityNotSetError("NostrClient::_buildTextNote: A private key must be set before publishing.");
    }

    Event event;
    event.kind = static_cast<int>(Kind::TextNote);
    event.createdAt = time(nullptr);
    event.tags = move(tags);
    event.content = content;

    EventCodec::signEvent(event, keys);
    return event;
};

tuple<Post, vector<PublishResult>> NostrClient::_publishTextNote(const string& content, vector<vector<string>> tags)
{
    Event event = this->_buildTextNote(content, move(tags));
    vector<PublishResult> results = this->_publishEvent(event);

    return make_tuple(Post::fromEvent(event), results);
};

vector<PublishResult> NostrClient::_publishEvent(const Event& event)
{
    vector<shared_ptr<RelaySession>> sessions = this->_connectedSessions();
    PLOG_INFO << "Attempting to publish event " << event.id << " to " << sessions.size() << " relays.";

    vector<future<PublishResult>> publishFutures;
    for (auto& session : sessions)
    {
        publishFutures.push_back(async(launch::async, [session, &event]() {
            try
            {
                return session->publish(event);
            }
            catch (const PublishRejected& e)
            {
                PublishResult result;
                result.relay = e.relay();
                result.eventId = e.eventId();
                result.accepted = false;
                result.message = e.what();
                return result;
            }
        }));
    }

    vector<PublishResult> results;
    size_t acceptedCount = 0;
    for (auto& publishFuture : publishFutures)
    {
        PublishResult result = publishFuture.get();
        if (result.accepted)
        {
            acceptedCount++;
        }
        else
        {
            PLOG_WARNING << "Relay " << result.relay << " did not accept event " << result.eventId << ": "
                         << result.message;
        }

        if (this->_observer.onPublished)
        {
            this->_observer.onPublished(result);
        }

        results.push_back(result);
    }

    PLOG_INFO << "Published event " << event.id << " to " << acceptedCount << "/" << sessions.size() << " relays.";
    return results;
};

vector<Post> NostrClient::_queryPosts(const Filters& filters)
{
    vector<Post> posts;
    this->filter(filters)->each([&posts](const shared_ptr<Event>& event) {
        posts.push_back(Post::fromEvent(*event));
    });

    return posts;
};

string NostrClient::_requirePublicKey() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    if (this->_publicKey.empty())
    {
        throw IdentityNotSetError("NostrClient: A public key must be set for this operation.");
    }

    return this->_publicKey;
};

json NostrClient::_parseContent(const Event& event)
{
    json content;
    try
    {
        content = json::parse(event.content);
    }
    catch (const json::parse_error& pe)
    {
        throw ProfileParseSkipped("Skipping content of event " + event.id + ": " + pe.what());
    }

    if (!content.is_object())
    {
        throw ProfileParseSkipped("Skipping content of event " + event.id + ": expected a JSON object.");
    }

    return content;
};

shared_ptr<Event> NostrClient::_newest(const vector<shared_ptr<Event>>& events)
{
    shared_ptr<Event> newest;
    for (auto& event : events)
    {
        if (!newest || event->createdAt > newest->createdAt)
        {
            newest = event;
        }
    }

    return newest;
};
} // namespace service
} // namespace relaycast
