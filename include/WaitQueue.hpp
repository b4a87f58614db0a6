#pragma once

#include "Vehicle.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace autopark
{
    // FIFO of vehicles that arrived while no compatible space was free.
    // Not synchronized: ParkingEngine owns it and mutates it under its own lock.
    class WaitQueue
    {
    public:
        using Predicate = std::function<bool(const Vehicle &)>;

        void enqueue(Vehicle vehicle);

        // Head of the queue, or nullptr when empty
        const Vehicle *peek() const;

        std::optional<Vehicle> dequeue();

        // Removes and returns the first vehicle (from the head) satisfying pred
        std::optional<Vehicle> takeFirstMatching(const Predicate &pred);

        bool contains(const std::string &vehicle_id) const;

        std::size_t len() const { return waiting.size(); }
        bool empty() const { return waiting.empty(); }
        void clear();

        std::vector<Vehicle> snapshot() const;

        // Consecutive free events on which the current head could not be placed
        uint32_t recordHeadMiss() { return ++head_misses; }
        uint32_t headMisses() const { return head_misses; }

    private:
        std::deque<Vehicle> waiting;
        uint32_t head_misses = 0;
    };

} // namespace autopark
