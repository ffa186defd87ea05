#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>
#include <plog/Appenders/IAppender.h>

#include "relaycast/client/web_socket_client.hpp"
#include "relaycast/config.hpp"
#include "relaycast/cryptography/key_codec.hpp"
#include "relaycast/data/data.hpp"
#include "relaycast/relay/relay_observer.hpp"
#include "relaycast/relay/relay_session.hpp"
#include "relaycast/service/subscription_multiplexer.hpp"

namespace relaycast
{
namespace service
{
/**
 * @brief Talks to a set of Nostr relays on behalf of a single identity.
 * @remark The client owns one `RelaySession` per connected relay.  Batch operations visit every
 * relay independently: a failure on one relay is logged and reported to the observer, and never
 * prevents the others from being tried.
 */
class NostrClient
{
public:
    NostrClient(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<client::IWebSocketClient> client,
        std::vector<data::RelayEndpoint> relays,
        ClientConfig config = ClientConfig(),
        relay::RelayObserver observer = relay::RelayObserver());

    ~NostrClient();

    NostrClient(const NostrClient&) = delete;
    NostrClient& operator=(const NostrClient&) = delete;

    /**
     * @brief Sets the private key used to sign events.
     * @param privateKey A private key, either hex-encoded or in `nsec` form.
     * @returns The derived public key, hex-encoded.
     * @throws `DecodeError` if the key is malformed, out of range, or is a public key.
     */
    std::string setIdentity(const std::string& privateKey);

    /**
     * @brief Sets a public key for queries, without the ability to sign.
     * @param publicKey A public key, either hex-encoded or in `npub` form.
     * @returns The public key, hex-encoded.
     * @throws `DecodeError` if the key is malformed or is a private key.
     * @remark Any private key set earlier is discarded.
     */
    std::string setPublicKey(const std::string& publicKey);

    /**
     * @returns The current public key, hex-encoded, or an empty string if none is set.
     */
    std::string publicKey() const;

    std::vector<data::RelayEndpoint> relays() const;

    /**
     * @returns The relays with a session in the `Connected` state.
     */
    std::vector<data::RelayEndpoint> activeRelays() const;

    /**
     * @brief Opens a session to every configured relay that does not already have a live one.
     * @remark Sessions whose relay dropped the connection are replaced.
     * @returns A tuple of the relay URLs that connected and the relay URLs that failed.
     * @remark Having no successful connections is not an error; callers decide whether to carry
     * on.
     */
    std::tuple<std::vector<std::string>, std::vector<std::string>> connectAll();

    /**
     * @brief Closes every session.
     * @returns A tuple of the relay URLs that were disconnected and the relay URLs that failed.
     */
    std::tuple<std::vector<std::string>, std::vector<std::string>> disconnectAll();

    /**
     * @brief Reconnects every session and reissues its open subscriptions.
     * @returns A tuple of the relay URLs that reconnected and the relay URLs that failed.
     * @remark Sessions that fail to reconnect are removed.
     */
    std::tuple<std::vector<std::string>, std::vector<std::string>> reconnectAll();

    /**
     * @brief Queries every connected relay and merges the stored events that match.
     * @param unique When true, an event returned by more than one relay is yielded once.
     * @throws `std::invalid_argument` if the filters are invalid.
     */
    std::unique_ptr<SubscriptionMultiplexer> filter(const data::Filters& filters, bool unique = true);

    /**
     * @returns True if the event's ID matches its content and its signature verifies.
     */
    bool isValidEvent(const data::Event& event) const;

    /**
     * @brief Assembles a profile from the metadata and contact lists stored on every connected
     * relay.
     * @param publicKey A public key, either hex-encoded or in `npub` form.
     * @remark The newest metadata and contact list events win.  Content that is not valid JSON
     * is skipped and the corresponding fields are left empty.
     * @throws `DecodeError` if the key is malformed or is a private key.
     */
    data::Profile queryProfile(const std::string& publicKey);

    /**
     * @throws `IdentityNotSetError` if no public key is set.
     */
    data::Profile myProfile();

    /**
     * @brief Fetches text notes from every connected relay.
     */
    std::vector<data::Post> globalFeed(const data::FeedOptions& options = data::FeedOptions());

    /**
     * @brief Fetches the text notes written by the current identity.
     * @throws `IdentityNotSetError` if no public key is set.
     */
    std::vector<data::Post> myPosts();

    /**
     * @brief Signs a text note and publishes it to every connected relay.
     * @returns The published post and the outcome on each relay.
     * @throws `IdentityNotSetError` if no private key is set.
     */
    std::tuple<data::Post, std::vector<data::PublishResult>> publishText(const std::string& content);

    /**
     * @brief Publishes a text note in reply to the given post.
     * @remark The note references the thread root, the parent post, and the parent's author.
     * @throws `IdentityNotSetError` if no private key is set.
     */
    std::tuple<data::Post, std::vector<data::PublishResult>> publishReply(
        const std::string& content,
        const data::Post& parent);

    /**
     * @brief Publishes a chain of text notes, each replying to the one before it.
     * @returns The outcome for each post, in order.
     * @throws `ThreadTooShortError` if fewer than two posts are given.
     * @throws `IdentityNotSetError` if no private key is set.
     * @remark Each post is sent to every relay before the next post is built.
     */
    std::vector<std::tuple<data::Post, std::vector<data::PublishResult>>> publishThread(
        const std::vector<std::string>& contents);

private:
    std::shared_ptr<client::IWebSocketClient> _client;
    std::vector<data::RelayEndpoint> _relays;
    ClientConfig _config;
    relay::RelayObserver _observer;

    ///< A mutex to protect the instance properties.
    mutable std::mutex _propertyMutex;

    cryptography::KeyPair _keys;
    std::string _publicKey;

    std::vector<std::shared_ptr<relay::RelaySession>> _sessions;

    std::vector<std::shared_ptr<relay::RelaySession>> _connectedSessions() const;

    /**
     * @brief Builds and signs a text note with the current identity.
     * @throws `IdentityNotSetError` if no private key is set.
     */
    data::Event _buildTextNote(const std::string& content, std::vector<std::vector<std::string>> tags) const;

    std::tuple<data::Post, std::vector<data::PublishResult>> _publishTextNote(
        const std::string& content,
        std::vector<std::vector<std::string>> tags);

    /**
     * @brief Sends a signed event to every connected relay concurrently.
     * @returns The outcome on each relay.  Failures are reported, not thrown.
     */
    std::vector<data::PublishResult> _publishEvent(const data::Event& event);

    std::vector<data::Post> _queryPosts(const data::Filters& filters);

    std::string _requirePublicKey() const;

    /**
     * @brief Parses the JSON content of a metadata or contact list event.
     * @throws `ProfileParseSkipped` if the content is not a JSON object.
     */
    static nlohmann::json _parseContent(const data::Event& event);

    static std::shared_ptr<data::Event> _newest(const std::vector<std::shared_ptr<data::Event>>& events);
};
} // namespace service
} // namespace relaycast
