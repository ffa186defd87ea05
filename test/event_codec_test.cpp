#include <string>

#include <gtest/gtest.h>

#include "relaycast/cryptography/event_codec.hpp"
#include "relaycast/cryptography/key_codec.hpp"
#include "relaycast/data/data.hpp"

using namespace relaycast;
using namespace relaycast::cryptography;
using namespace std;

namespace relaycast_test
{
class EventCodecTest : public testing::Test
{
public:
    inline static const string secretKey = "0000000000000000000000000000000000000000000000000000000000000003";
    inline static const string publicKey = "f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9";
    inline static const string zeroDigest = "0000000000000000000000000000000000000000000000000000000000000000";
    inline static const string zeroDigestSignature =
        "e907831f80848d1069a5371b402410364bdf1c5f8307b0084c55f1ce2dca8215"
        "25f66a4a85ea8b71e482a74f382d2ce5ebeee8fdb2172f477df4900d310536c0";

    static data::Event getTextNoteTestEvent()
    {
        data::Event event;
        event.pubkey = publicKey;
        event.createdAt = 1700000000;
        event.kind = 1;
        event.tags =
        {
            { "p", "7e7e9c42a91bfef19fa929e5fda1b72e0ebc1a4c1141673e2794234d86addf4e" }
        };
        event.content = "Hello, World!";

        return event;
    };

    static string alterHexCharacter(string hex, size_t position)
    {
        hex[position] = hex[position] == '0' ? '1' : '0';
        return hex;
    };
};

TEST_F(EventCodecTest, Canonicalize_SerializesCommitmentArray_WithoutWhitespace)
{
    data::Event event = getTextNoteTestEvent();
    event.id = "ignored";
    event.sig = "ignored";

    ASSERT_EQ(
        EventCodec::canonicalize(event),
        "[0,\"" + publicKey + "\",1700000000,1,[[\"p\",\"7e7e9c42a91bfef19fa929e5fda1b72e0ebc1a4c1141673e2794234d86addf4e\"]],\"Hello, World!\"]");
};

TEST_F(EventCodecTest, Canonicalize_EscapesContent_AndKeepsUnicode)
{
    data::Event event = getTextNoteTestEvent();
    event.tags.clear();
    event.content = "line \"one\"\nline two \xC3\xA9";

    ASSERT_EQ(
        EventCodec::canonicalize(event),
        "[0,\"" + publicKey + "\",1700000000,1,[],\"line \\\"one\\\"\\nline two \xC3\xA9\"]");
};

TEST_F(EventCodecTest, ComputeId_HashesCanonicalForm)
{
    data::Event event = getTextNoteTestEvent();

    ASSERT_EQ(EventCodec::computeId(event), "51722c5a625e0839d3739183008114108e3f47a4fee1f042637a75c1c6d0ee7a");
};

TEST_F(EventCodecTest, ComputeId_IgnoresIdAndSignature)
{
    data::Event event = getTextNoteTestEvent();
    event.tags.clear();
    event.content = "hello";
    string id = EventCodec::computeId(event);

    event.id = "something";
    event.sig = "else";

    ASSERT_EQ(EventCodec::computeId(event), id);
    ASSERT_EQ(id, "a9d53fee641fe563de947fa330a3b4902e52e249894660aaa521cd039e896128");
};

TEST_F(EventCodecTest, Sign_MatchesSchnorrTestVector)
{
    ASSERT_EQ(EventCodec::sign(zeroDigest, secretKey), zeroDigestSignature);
};

TEST_F(EventCodecTest, Sign_IsDeterministic)
{
    string id = EventCodec::computeId(getTextNoteTestEvent());

    ASSERT_EQ(EventCodec::sign(id, secretKey), EventCodec::sign(id, secretKey));
};

TEST_F(EventCodecTest, Verify_AcceptsValidSignature)
{
    string id = EventCodec::computeId(getTextNoteTestEvent());
    string sig = EventCodec::sign(id, secretKey);

    ASSERT_TRUE(EventCodec::verify(sig, id, KeyCodec::derivePublicKey(secretKey)));
    ASSERT_TRUE(EventCodec::verify(zeroDigestSignature, zeroDigest, publicKey));
};

TEST_F(EventCodecTest, Verify_RejectsAlteredInputs)
{
    string id = EventCodec::computeId(getTextNoteTestEvent());
    string sig = EventCodec::sign(id, secretKey);

    ASSERT_FALSE(EventCodec::verify(alterHexCharacter(sig, 10), id, publicKey));
    ASSERT_FALSE(EventCodec::verify(sig, alterHexCharacter(id, 10), publicKey));
    ASSERT_FALSE(EventCodec::verify(sig, id, alterHexCharacter(publicKey, 10)));
};

TEST_F(EventCodecTest, Verify_ReturnsFalse_OnMalformedInput)
{
    string id = EventCodec::computeId(getTextNoteTestEvent());

    ASSERT_FALSE(EventCodec::verify("not a signature", id, publicKey));
    ASSERT_FALSE(EventCodec::verify(zeroDigestSignature, "abc", publicKey));
    ASSERT_FALSE(EventCodec::verify(zeroDigestSignature, zeroDigest, ""));
};

TEST_F(EventCodecTest, SignEvent_FillsPubkeyIdAndSignature)
{
    data::Event event;
    event.kind = 1;
    event.content = "Hello, World!";

    EventCodec::signEvent(event, KeyPair::fromPrivateKey(secretKey));

    ASSERT_EQ(event.pubkey, publicKey);
    ASSERT_GT(event.createdAt, 0);
    ASSERT_EQ(event.id, EventCodec::computeId(event));
    ASSERT_EQ(event.sig.length(), 128);
    ASSERT_TRUE(EventCodec::isValid(event));
};

TEST_F(EventCodecTest, IsValid_RejectsTamperedContent)
{
    data::Event event = getTextNoteTestEvent();
    EventCodec::signEvent(event, KeyPair::fromPrivateKey(secretKey));

    event.content = "Goodbye, World!";

    ASSERT_FALSE(EventCodec::isValid(event));
};

TEST_F(EventCodecTest, IsValid_RejectsSignatureFromAnotherKey)
{
    data::Event event = getTextNoteTestEvent();
    EventCodec::signEvent(event, KeyPair::fromPrivateKey(secretKey));

    data::Event forged = event;
    forged.pubkey = "7e7e9c42a91bfef19fa929e5fda1b72e0ebc1a4c1141673e2794234d86addf4e";
    forged.id = EventCodec::computeId(forged);

    ASSERT_FALSE(EventCodec::isValid(forged));
};
} // namespace relaycast_test
