#pragma once

#include "ParkingTypes.hpp"

#include <initializer_list>
#include <optional>
#include <string>

namespace autopark
{
    enum class EventType : uint8_t
    {
        SimulationStart,
        SimulationStop,
        VehicleEntry,
        VehicleQueued,
        VehicleFromQueue,
        VehicleExit,
        PaymentFailed,
        QueueStarvation,
        SpaceReleased
    };

    enum class EventSeverity : uint8_t
    {
        Info,
        Warning,
        Error
    };

    struct ParkingEvent
    {
        EventType type = EventType::VehicleEntry;
        TimePoint timestamp{};
        std::string vehicle_plate;
        std::optional<SpaceId> space_id;
        std::optional<double> amount;
        EventSeverity severity = EventSeverity::Info;
        std::string description;
    };

    enum class TransactionStatus : uint8_t
    {
        Completed,
        Failed
    };

    struct PaymentTransaction
    {
        std::string transaction_id;
        std::string vehicle_id;
        double amount = 0.0;
        PaymentMethod payment_method = PaymentMethod::None;
        TimePoint timestamp{};
        TransactionStatus status = TransactionStatus::Completed;
    };

    inline const char *toString(EventType type)
    {
        switch (type)
        {
        case EventType::SimulationStart:
            return "simulation_start";
        case EventType::SimulationStop:
            return "simulation_stop";
        case EventType::VehicleEntry:
            return "vehicle_entry";
        case EventType::VehicleQueued:
            return "vehicle_queued";
        case EventType::VehicleFromQueue:
            return "vehicle_from_queue";
        case EventType::VehicleExit:
            return "vehicle_exit";
        case EventType::PaymentFailed:
            return "payment_failed";
        case EventType::QueueStarvation:
            return "queue_starvation";
        case EventType::SpaceReleased:
            return "space_released";
        }
        return "unknown";
    }

    inline bool eventTypeFromString(const std::string &value, EventType &type)
    {
        for (EventType candidate : {EventType::SimulationStart, EventType::SimulationStop, EventType::VehicleEntry,
                                    EventType::VehicleQueued, EventType::VehicleFromQueue, EventType::VehicleExit,
                                    EventType::PaymentFailed, EventType::QueueStarvation, EventType::SpaceReleased})
        {
            if (value == toString(candidate))
            {
                type = candidate;
                return true;
            }
        }
        return false;
    }

    inline const char *toString(EventSeverity severity)
    {
        switch (severity)
        {
        case EventSeverity::Info:
            return "info";
        case EventSeverity::Warning:
            return "warning";
        case EventSeverity::Error:
            return "error";
        }
        return "info";
    }

    inline EventSeverity severityFromString(const std::string &value)
    {
        if (value == "warning")
            return EventSeverity::Warning;
        if (value == "error")
            return EventSeverity::Error;
        return EventSeverity::Info;
    }

    inline const char *toString(TransactionStatus status)
    {
        return status == TransactionStatus::Completed ? "completed" : "failed";
    }

} // namespace autopark
