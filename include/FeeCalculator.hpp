#pragma once

#include "ParkingTypes.hpp"

#include <map>

namespace autopark
{
    // Stateless after construction; safe to call from any thread.
    class FeeCalculator
    {
    public:
        static constexpr double MINIMUM_BILLED_HOURS = 1.0;
        static constexpr double FALLBACK_RATE = 3.0; // per hour, for classes missing from the table

        explicit FeeCalculator(std::map<VehicleClass, double> hourly_rates);

        // rate * max(1h, elapsed hours), rounded to cents
        double calculate(VehicleClass vehicle_class, TimePoint entry_time, TimePoint exit_time) const;

        double billedHours(TimePoint entry_time, TimePoint exit_time) const;
        double rateFor(VehicleClass vehicle_class) const;

    private:
        std::map<VehicleClass, double> hourly_rates;
    };

} // namespace autopark
