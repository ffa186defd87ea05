#include <plog/Log.h>

#include "relaycast/service/subscription_multiplexer.hpp"

using namespace std;

namespace relaycast
{
namespace service
{
SubscriptionMultiplexer::SubscriptionMultiplexer(vector<shared_ptr<relay::IEventSource>> sources, bool unique)
: _unique(unique)
{
    size_t nextSlot = 0;
    for (auto& source : sources)
    {
        if (!source)
        {
            continue;
        }

        Slot& entry = this->_slots[nextSlot++];
        entry.source = move(source);
        entry.armed = true;
    }

    // Every slot exists before any worker starts, so the map is never resized under a worker.
    for (auto& [slot, entry] : this->_slots)
    {
        entry.worker = thread(&SubscriptionMultiplexer::_run, this, slot, entry.source);
    }

    PLOG_VERBOSE << "Merging events from " << this->_slots.size() << " sources.";
};

SubscriptionMultiplexer::~SubscriptionMultiplexer()
{
    {
        lock_guard<mutex> lock(this->_mutex);
        this->_stopping = true;
    }
    this->_armedCondition.notify_all();

    // Closing a source releases a worker blocked in its `next` call.
    for (auto& [slot, entry] : this->_slots)
    {
        entry.source->close();
    }

    for (auto& [slot, entry] : this->_slots)
    {
        if (entry.worker.joinable())
        {
            entry.worker.join();
        }
    }
};

optional<shared_ptr<data::Event>> SubscriptionMultiplexer::next()
{
    while (true)
    {
        unique_lock<mutex> lock(this->_mutex);

        // Each active slot has exactly one read outstanding or one completion queued.
        if (this->_slots.empty())
        {
            return nullopt;
        }

        this->_completedCondition.wait(lock, [this]() { return !this->_completions.empty(); });

        Completion completion = move(this->_completions.front());
        this->_completions.pop_front();

        if (!completion.item)
        {
            auto node = this->_slots.extract(completion.slot);
            lock.unlock();

            node.mapped().worker.join();
            node.mapped().source->close();
            PLOG_VERBOSE << "Source " << node.mapped().source->name() << " is exhausted.";
            continue;
        }

        shared_ptr<data::Event> event = move(*completion.item);
        bool isDuplicate = this->_unique && event && !this->_yieldedIds.insert(event->id).second;

        this->_slots.at(completion.slot).armed = true;
        lock.unlock();
        this->_armedCondition.notify_all();

        if (!event || isDuplicate)
        {
            continue;
        }

        return event;
    }
};

vector<shared_ptr<data::Event>> SubscriptionMultiplexer::collect()
{
    vector<shared_ptr<data::Event>> events;
    while (auto event = this->next())
    {
        events.push_back(*event);
    }

    return events;
};

void SubscriptionMultiplexer::each(function<void(const shared_ptr<data::Event>&)> handler)
{
    while (auto event = this->next())
    {
        handler(*event);
    }
};

vector<shared_ptr<data::Event>> SubscriptionMultiplexer::take(size_t count)
{
    vector<shared_ptr<data::Event>> events;
    while (events.size() < count)
    {
        auto event = this->next();
        if (!event)
        {
            break;
        }
        events.push_back(*event);
    }

    return events;
};

size_t SubscriptionMultiplexer::activeSources() const
{
    lock_guard<mutex> lock(this->_mutex);
    return this->_slots.size();
};

void SubscriptionMultiplexer::_run(size_t slot, shared_ptr<relay::IEventSource> source)
{
    while (true)
    {
        {
            unique_lock<mutex> lock(this->_mutex);
            this->_armedCondition.wait(lock, [this, slot]() {
                return this->_stopping || this->_slots.at(slot).armed;
            });

            if (this->_stopping)
            {
                return;
            }

            this->_slots.at(slot).armed = false;
        }

        optional<shared_ptr<data::Event>> item;
        try
        {
            item = source->next();
        }
        catch (const exception& e)
        {
            PLOG_WARNING << "Source " << source->name() << " failed and will be dropped: " << e.what();
            item = nullopt;
        }

        bool exhausted = !item;
        {
            lock_guard<mutex> lock(this->_mutex);
            this->_completions.push_back(Completion{ slot, move(item) });
        }
        this->_completedCondition.notify_one();

        if (exhausted)
        {
            return;
        }
    }
};
} // namespace service
} // namespace relaycast
