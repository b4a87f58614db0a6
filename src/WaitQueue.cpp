#include "WaitQueue.hpp"

#include <algorithm>
#include <utility>

namespace autopark
{
    void WaitQueue::enqueue(Vehicle vehicle)
    {
        waiting.push_back(std::move(vehicle));
    }

    const Vehicle *WaitQueue::peek() const
    {
        return waiting.empty() ? nullptr : &waiting.front();
    }

    std::optional<Vehicle> WaitQueue::dequeue()
    {
        if (waiting.empty())
        {
            return std::nullopt;
        }

        Vehicle head = std::move(waiting.front());
        waiting.pop_front();
        head_misses = 0;
        return head;
    }

    std::optional<Vehicle> WaitQueue::takeFirstMatching(const Predicate &pred)
    {
        auto it = std::find_if(waiting.begin(), waiting.end(), pred);
        if (it == waiting.end())
        {
            return std::nullopt;
        }

        if (it == waiting.begin())
        {
            head_misses = 0;
        }
        Vehicle match = std::move(*it);
        waiting.erase(it);
        return match;
    }

    bool WaitQueue::contains(const std::string &vehicle_id) const
    {
        return std::any_of(waiting.begin(), waiting.end(),
                           [&](const Vehicle &vehicle)
                           { return vehicle.id == vehicle_id; });
    }

    void WaitQueue::clear()
    {
        waiting.clear();
        head_misses = 0;
    }

    std::vector<Vehicle> WaitQueue::snapshot() const
    {
        return std::vector<Vehicle>(waiting.begin(), waiting.end());
    }
} // namespace autopark
