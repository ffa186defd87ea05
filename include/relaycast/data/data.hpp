#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace relaycast
{
namespace data
{
/**
 * @brief Event kinds understood by the client.
 * @remark Events of any other kind are still carried, with their integer kind untouched.
 */
enum class Kind : int
{
    Metadata = 0,
    TextNote = 1,
    RecommendServer = 2,
    Contacts = 3,
    DirectMessage = 4
};

/**
 * @brief A Nostr event.
 * @remark All data transmitted over the Nostr protocol is encoded in JSON blobs.  This struct
 * is common to every Nostr event kind.  The significance of each event is determined by the
 * `tags` and `content` fields.
 */
struct Event
{
    std::string id; ///< SHA-256 hash of the event data.
    std::string pubkey; ///< Public key of the event creator.
    std::time_t createdAt = 0; ///< Unix timestamp of the event creation.
    int kind = 0; ///< Event kind.
    std::vector<std::vector<std::string>> tags; ///< Arbitrary event metadata.
    std::string content; ///< Event content.
    std::string sig; ///< Event signature created with the private key of the event creator.

    /**
     * @brief Serializes the event to a JSON object.
     * @returns A stringified JSON object representing the event, including its `id` and `sig`.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark The event must already be signed; use `cryptography::EventCodec` to fill the `id`
     * and `sig` fields.
     */
    std::string serialize() const;

    /**
     * @brief Deserializes the event from a JSON string.
     * @param jsonString A stringified JSON object representing the event.
     * @returns An event instance created from the JSON string.
     * @throws `std::invalid_argument` if the string is not a well-formed event.
     */
    static Event fromString(const std::string& jsonString);

    /**
     * @brief Deserializes the event from a JSON object.
     * @param j A JSON object representing the event.
     * @returns An event instance created from the JSON object.
     * @throws `std::invalid_argument` if a required field is missing or has the wrong type.
     */
    static Event fromJson(const nlohmann::json& j);

    /**
     * @brief Validates the fields that must be set before the event can be hashed and signed.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark The `createdAt` field defaults to the present if it is not already set.
     */
    void validate();

    /**
     * @brief Compares two events for equality.
     * @remark Two events are considered equal if they have the same ID, since the ID is uniquely
     * generated from the event data.  If the `id` field is empty for either event, the comparison
     * function will throw an exception.
     */
    bool operator==(const Event& other) const;
};

/**
 * @brief A set of filters for querying Nostr relays.
 * @remark All present fields must match for an event to be returned; the values inside a single
 * field are alternatives.  Empty vectors and zero timestamps or limits are treated as absent and
 * are left out of the serialized request.  At least one of `ids`, `authors`, `kinds` or `tags`
 * must be set for a valid filter.
 */
struct Filters
{
    std::vector<std::string> ids; ///< Event IDs.
    std::vector<std::string> authors; ///< Event author public keys, hex-encoded.
    std::vector<int> kinds; ///< Kind numbers.
    std::unordered_map<std::string, std::vector<std::string>> tags; ///< Tag names mapped to lists of tag values.
    std::time_t since = 0; ///< Unix timestamp.  Matching events must be newer than this.
    std::time_t until = 0; ///< Unix timestamp.  Matching events must be older than this.
    int limit = 0; ///< The maximum number of events the relay should return on the initial query.

    /**
     * @brief Serializes the filters into a relay subscription request.
     * @param subscriptionId A string up to 64 chars in length that is unique per relay connection.
     * @returns A stringified `REQ` message carrying the filters.
     * @throws `std::invalid_argument` if the filter object is invalid.
     * @remarks The Nostr client is responsible for managing subscription IDs.  Responses from the
     * relay will be organized by subscription ID.
     */
    std::string serialize(const std::string& subscriptionId) const;

    /**
     * @brief Validates the filters.
     * @throws `std::invalid_argument` if the filter object is invalid.
     */
    void validate() const;
};

/**
 * @brief A relay the client is configured to talk to.
 */
struct RelayEndpoint
{
    std::string name; ///< Display name used in logs and notifications.
    std::string url; ///< WebSocket URL of the relay.
};

/**
 * @brief A text note projected from an event of kind `TextNote`.
 */
struct Post
{
    std::string id;
    std::string content;
    std::string author;
    std::time_t createdAt = 0;
    std::optional<std::string> reference; ///< Event ID of the post being replied to.
    std::optional<std::string> rootReference; ///< Event ID of the root of the thread.
    std::optional<std::string> mentionTo; ///< Public key of the first mentioned user.

    /**
     * @brief Builds a post view from a text note.
     * @remark The references are taken from the first `e` tag marked `root`, the first `e` tag
     * marked `reply`, and the first `p` tag.
     */
    static Post fromEvent(const Event& event);
};

struct RelayPreference
{
    std::string url;
    bool read = false;
    bool write = false;
};

struct Contact
{
    std::string publicKey;
    std::string name;
};

/**
 * @brief A user profile aggregated from the metadata and contact list events of all queried
 * relays.
 */
struct Profile
{
    std::optional<std::string> name;
    std::optional<std::string> about;
    std::optional<std::string> picture;
    std::vector<RelayPreference> relays;
    std::vector<Contact> following;
    std::vector<Contact> followers;
};

/**
 * @brief The outcome of sending a single event to a single relay.
 */
struct PublishResult
{
    std::string relay;
    std::string eventId;
    bool accepted = false;
    std::string message; ///< The relay's reason string, or a local failure description.
};

/**
 * @brief Options for a text-note feed query.
 */
struct FeedOptions
{
    int limit = 0;
    std::time_t since = 0;
    std::vector<std::string> authors;
};
} // namespace data
} // namespace relaycast

namespace nlohmann
{
template <>
struct adl_serializer<relaycast::data::Event>
{
    static void to_json(json& j, const relaycast::data::Event& event);
    static void from_json(const json& j, relaycast::data::Event& event);
};

template <>
struct adl_serializer<relaycast::data::Filters>
{
    static void to_json(json& j, const relaycast::data::Filters& filters);
};
} // namespace nlohmann
