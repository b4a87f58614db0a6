#pragma once

#include "ParkingEvents.hpp"
#include "Vehicle.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace autopark
{
    // Where the engine sends everything it wants remembered. Implementations
    // must tolerate calls from the engine's tick thread and admin threads.
    class IRecordStore
    {
    public:
        virtual ~IRecordStore() = default;
        virtual bool append(const ParkingEvent &event, std::string *error = nullptr) = 0;
        virtual bool recordVehicle(const Vehicle &vehicle, std::string *error = nullptr) = 0;
        virtual bool recordTransaction(const PaymentTransaction &transaction, std::string *error = nullptr) = 0;
    };

    class NullRecordStore : public IRecordStore
    {
    public:
        bool append(const ParkingEvent &, std::string *) override { return true; }
        bool recordVehicle(const Vehicle &, std::string *) override { return true; }
        bool recordTransaction(const PaymentTransaction &, std::string *) override { return true; }
    };

    class MemoryRecordStore : public IRecordStore
    {
    public:
        bool append(const ParkingEvent &event, std::string *) override
        {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
            return true;
        }

        // Keeps the latest record per vehicle id
        bool recordVehicle(const Vehicle &vehicle, std::string *) override
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto &existing : vehicles)
            {
                if (existing.id == vehicle.id)
                {
                    existing = vehicle;
                    return true;
                }
            }
            vehicles.push_back(vehicle);
            return true;
        }

        bool recordTransaction(const PaymentTransaction &transaction, std::string *) override
        {
            std::lock_guard<std::mutex> lock(mutex);
            transactions.push_back(transaction);
            return true;
        }

        std::vector<ParkingEvent> getEvents() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return events;
        }

        std::vector<ParkingEvent> getEvents(EventType type) const
        {
            std::lock_guard<std::mutex> lock(mutex);
            std::vector<ParkingEvent> matching;
            for (const auto &event : events)
            {
                if (event.type == type)
                {
                    matching.push_back(event);
                }
            }
            return matching;
        }

        std::vector<Vehicle> getVehicles() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return vehicles;
        }

        std::vector<PaymentTransaction> getTransactions() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return transactions;
        }

    private:
        mutable std::mutex mutex;
        std::vector<ParkingEvent> events;
        std::vector<Vehicle> vehicles;
        std::vector<PaymentTransaction> transactions;
    };

} // namespace autopark
