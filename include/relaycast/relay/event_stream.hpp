#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "relaycast/data/data.hpp"

namespace relaycast
{
namespace relay
{
/**
 * @brief A source of events that are read one at a time.
 */
class IEventSource
{
public:
    virtual ~IEventSource() = default;

    /**
     * @brief Waits for the next event.
     * @returns The next event, or an empty optional once the source is exhausted.
     */
    virtual std::optional<std::shared_ptr<data::Event>> next() = 0;

    /**
     * @brief Stops the source.
     * @remark Any call to `next` blocked on this source returns promptly.  Calling `close` more
     * than once has no further effect.
     */
    virtual void close() = 0;

    /**
     * @brief A short description of the source for log messages.
     */
    virtual std::string name() const = 0;
};

/**
 * @brief A thread-safe queue of events with an end marker.
 * @remark Producers call `push` until they call `finish`.  Consumers block in `next` until an
 * event is available or the stream is finished and drained.
 */
class EventStream
{
public:
    void push(std::shared_ptr<data::Event> event);

    void finish();

    bool finished() const;

    /**
     * @returns The next event, or an empty optional once the stream is finished and drained.
     */
    std::optional<std::shared_ptr<data::Event>> next();

    /**
     * @returns The next event, or an empty optional once the stream is finished and drained or
     * the deadline passes.
     */
    std::optional<std::shared_ptr<data::Event>> next(std::chrono::steady_clock::time_point deadline);

private:
    mutable std::mutex _mutex;
    std::condition_variable _available;
    std::deque<std::shared_ptr<data::Event>> _events;
    bool _finished = false;

    std::optional<std::shared_ptr<data::Event>> _pop();
};
} // namespace relay
} // namespace relaycast
