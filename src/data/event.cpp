#include <stdexcept>

#include "relaycast/data/data.hpp"

using namespace nlohmann;
using namespace relaycast::data;
using namespace std;

string Event::serialize() const
{
    if (this->id.empty() || this->sig.empty())
    {
        throw invalid_argument("Event::serialize: The event must be signed before it is serialized.");
    }

    json j = *this;
    return j.dump();
};

Event Event::fromString(const string& jstr)
{
    json j;
    try
    {
        j = json::parse(jstr);
    }
    catch (const json::parse_error& pe)
    {
        throw invalid_argument(string("Event::fromString: ") + pe.what());
    }

    return Event::fromJson(j);
};

Event Event::fromJson(const json& j)
{
    try
    {
        return j.get<Event>();
    }
    catch (const json::exception& je)
    {
        throw invalid_argument(string("Event::fromJson: ") + je.what());
    }
};

void Event::validate()
{
    bool hasPubkey = this->pubkey.length() > 0;
    if (!hasPubkey)
    {
        throw invalid_argument("Event::validate: The pubkey of the event author is required.");
    }

    bool hasCreatedAt = this->createdAt > 0;
    if (!hasCreatedAt)
    {
        this->createdAt = time(nullptr);
    }

    bool hasKind = this->kind >= 0 && this->kind < 40000;
    if (!hasKind)
    {
        throw invalid_argument("Event::validate: A valid event kind is required.");
    }
};

bool Event::operator==(const Event& other) const
{
    if (this->id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the left-side argument is undefined.");
    }
    if (other.id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the right-side argument is undefined.");
    }

    return this->id == other.id;
};

Post Post::fromEvent(const Event& event)
{
    Post post;
    post.id = event.id;
    post.author = event.pubkey;
    post.content = event.content;
    post.createdAt = event.createdAt;

    for (const auto& tag : event.tags)
    {
        if (tag.size() < 2)
        {
            continue;
        }

        if (tag[0] == "e" && tag.back() == "root" && !post.rootReference)
        {
            post.rootReference = tag[1];
        }
        else if (tag[0] == "e" && tag.back() == "reply" && !post.reference)
        {
            post.reference = tag[1];
        }
        else if (tag[0] == "p" && !post.mentionTo)
        {
            post.mentionTo = tag[1];
        }
    }

    return post;
};

void adl_serializer<Event>::to_json(json& j, const Event& event)
{
    j = {
        { "id", event.id },
        { "pubkey", event.pubkey },
        { "created_at", event.createdAt },
        { "kind", event.kind },
        { "tags", event.tags },
        { "content", event.content },
        { "sig", event.sig },
    };
};

void adl_serializer<Event>::from_json(const json& j, Event& event)
{
    event.id = j.at("id").get<string>();
    event.pubkey = j.at("pubkey").get<string>();
    event.createdAt = j.at("created_at").get<time_t>();
    event.kind = j.at("kind").get<int>();
    event.tags = j.at("tags").get<vector<vector<string>>>();
    event.content = j.at("content").get<string>();
    event.sig = j.at("sig").get<string>();
};
