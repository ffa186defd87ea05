#pragma once

#include <stdexcept>
#include <string>

namespace relaycast
{
/**
 * @brief Thrown when a bech32 string, hex string or secret key cannot be decoded.
 */
class DecodeError : public std::invalid_argument
{
public:
    explicit DecodeError(const std::string& message) : std::invalid_argument(message) {};
};

/**
 * @brief Thrown when the transport to a relay cannot be opened.
 */
class ConnectionError : public std::runtime_error
{
public:
    ConnectionError(const std::string& relay, const std::string& message)
    : std::runtime_error(message), _relay(relay) {};

    const std::string& relay() const { return this->_relay; };

private:
    std::string _relay;
};

/**
 * @brief Thrown when a relay does not accept a published event.
 * @remark A negative acknowledgment, a failed send, and a missing acknowledgment are all reported
 * with this exception.  The message holds the relay's reason, if it gave one.
 */
class PublishRejected : public std::runtime_error
{
public:
    PublishRejected(const std::string& relay, const std::string& eventId, const std::string& message)
    : std::runtime_error(message), _relay(relay), _eventId(eventId) {};

    const std::string& relay() const { return this->_relay; };

    const std::string& eventId() const { return this->_eventId; };

private:
    std::string _relay;
    std::string _eventId;
};

/**
 * @brief Thrown when a thread is requested with fewer than two posts.
 */
class ThreadTooShortError : public std::invalid_argument
{
public:
    explicit ThreadTooShortError(const std::string& message) : std::invalid_argument(message) {};
};

/**
 * @brief Thrown when an operation needs a key the client has not been given.
 */
class IdentityNotSetError : public std::logic_error
{
public:
    explicit IdentityNotSetError(const std::string& message) : std::logic_error(message) {};
};

/**
 * @brief Raised while assembling a profile when an event's content is not the expected JSON.
 * @remark This is never propagated out of the client; the affected fields are left empty.
 */
class ProfileParseSkipped : public std::runtime_error
{
public:
    explicit ProfileParseSkipped(const std::string& message) : std::runtime_error(message) {};
};
} // namespace relaycast
