#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>
#include <vector>

#include "relaycast/data/data.hpp"
#include "relaycast/relay/event_stream.hpp"

namespace relaycast
{
namespace service
{
/**
 * @brief Merges the events of several sources into one sequence, in order of arrival.
 * @remark Each source is read by its own worker, which has at most one `next` call outstanding
 * at a time.  Completed reads are queued in the order they finish, so a source that never
 * produces does not hold up the others.  A source that reports exhaustion is closed and removed;
 * the merged sequence ends when no sources remain.
 *
 * When `unique` is set, events whose ID has already been returned are dropped.  The first
 * arrival of each ID wins.
 *
 * Destroying the multiplexer before the sequence ends closes every remaining source and joins
 * its worker.
 */
class SubscriptionMultiplexer
{
public:
    SubscriptionMultiplexer(std::vector<std::shared_ptr<relay::IEventSource>> sources, bool unique = true);

    ~SubscriptionMultiplexer();

    SubscriptionMultiplexer(const SubscriptionMultiplexer&) = delete;
    SubscriptionMultiplexer& operator=(const SubscriptionMultiplexer&) = delete;

    /**
     * @brief Waits for the next event from any source.
     * @returns The next event, or an empty optional once every source is exhausted.
     */
    std::optional<std::shared_ptr<data::Event>> next();

    /**
     * @brief Reads the sequence to its end.
     */
    std::vector<std::shared_ptr<data::Event>> collect();

    /**
     * @brief Invokes the handler on every event until the sequence ends.
     */
    void each(std::function<void(const std::shared_ptr<data::Event>&)> handler);

    /**
     * @brief Reads at most `count` events.
     * @remark Stops early if the sequence ends.  The remaining sources stay open until the
     * multiplexer is destroyed.
     */
    std::vector<std::shared_ptr<data::Event>> take(size_t count);

    /**
     * @returns The number of sources that have not yet been exhausted.
     */
    size_t activeSources() const;

private:
    struct Slot
    {
        std::shared_ptr<relay::IEventSource> source;
        std::thread worker;
        bool armed = false; ///< True while the worker may start its next read.
    };

    struct Completion
    {
        size_t slot;
        std::optional<std::shared_ptr<data::Event>> item;
    };

    bool _unique;

    mutable std::mutex _mutex;

    ///< Wakes workers that have been re-armed, or that must stop.
    std::condition_variable _armedCondition;

    ///< Wakes the consumer when a read completes.
    std::condition_variable _completedCondition;

    ///< Active sources, keyed by a slot number that never changes while the source is active.
    std::map<size_t, Slot> _slots;

    std::deque<Completion> _completions;

    std::unordered_set<std::string> _yieldedIds;

    bool _stopping = false;

    void _run(size_t slot, std::shared_ptr<relay::IEventSource> source);
};
} // namespace service
} // namespace relaycast
