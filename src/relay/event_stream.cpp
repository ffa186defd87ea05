#include "relaycast/relay/event_stream.hpp"

using namespace std;

namespace relaycast
{
namespace relay
{
void EventStream::push(shared_ptr<data::Event> event)
{
    {
        lock_guard<mutex> lock(this->_mutex);
        if (this->_finished)
        {
            return;
        }
        this->_events.push_back(move(event));
    }
    this->_available.notify_one();
};

void EventStream::finish()
{
    {
        lock_guard<mutex> lock(this->_mutex);
        this->_finished = true;
    }
    this->_available.notify_all();
};

bool EventStream::finished() const
{
    lock_guard<mutex> lock(this->_mutex);
    return this->_finished;
};

optional<shared_ptr<data::Event>> EventStream::next()
{
    unique_lock<mutex> lock(this->_mutex);
    this->_available.wait(lock, [this]() { return !this->_events.empty() || this->_finished; });

    return this->_pop();
};

optional<shared_ptr<data::Event>> EventStream::next(chrono::steady_clock::time_point deadline)
{
    unique_lock<mutex> lock(this->_mutex);
    this->_available.wait_until(lock, deadline, [this]() { return !this->_events.empty() || this->_finished; });

    return this->_pop();
};

// Expects the stream mutex to be held.
optional<shared_ptr<data::Event>> EventStream::_pop()
{
    if (this->_events.empty())
    {
        return nullopt;
    }

    auto event = move(this->_events.front());
    this->_events.pop_front();
    return event;
};
} // namespace relay
} // namespace relaycast
