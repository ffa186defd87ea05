#pragma once

#include "relaycast/client/web_socket_client.hpp"
#include "relaycast/client/websocketpp_client.hpp"
#include "relaycast/config.hpp"
#include "relaycast/cryptography/event_codec.hpp"
#include "relaycast/cryptography/key_codec.hpp"
#include "relaycast/cryptography/nip19.hpp"
#include "relaycast/data/data.hpp"
#include "relaycast/errors.hpp"
#include "relaycast/relay/relay_observer.hpp"
#include "relaycast/relay/relay_session.hpp"
#include "relaycast/service/nostr_client.hpp"
#include "relaycast/service/subscription_multiplexer.hpp"
