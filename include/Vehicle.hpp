#pragma once

#include "ParkingTypes.hpp"

#include <optional>
#include <string>

namespace autopark
{
    struct Vehicle
    {
        std::string id;
        std::string plate_number;
        VehicleClass vehicle_class = VehicleClass::Car;
        double length = 0.0; // meters
        double width = 0.0;
        double height = 0.0;
        std::string owner_name;
        std::string phone_number;
        TimePoint entry_time{};
        std::optional<TimePoint> exit_time;
        std::optional<SpaceId> space_id;
        double payment_amount = 0.0;
        PaymentMethod payment_method = PaymentMethod::None;

        bool isParked() const { return space_id.has_value() && !exit_time.has_value(); }

        // Hours between entry and exit, -1 while the vehicle has not exited
        double stayHours() const
        {
            if (!exit_time)
                return -1.0;
            return secondsBetween(entry_time, *exit_time) / 3600.0;
        }
    };

} // namespace autopark
