#include "FeeCalculator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace autopark
{
    FeeCalculator::FeeCalculator(std::map<VehicleClass, double> hourly_rates)
        : hourly_rates(std::move(hourly_rates))
    {
    }

    double FeeCalculator::calculate(VehicleClass vehicle_class, TimePoint entry_time, TimePoint exit_time) const
    {
        const double amount = rateFor(vehicle_class) * billedHours(entry_time, exit_time);
        return std::round(amount * 100.0) / 100.0;
    }

    double FeeCalculator::billedHours(TimePoint entry_time, TimePoint exit_time) const
    {
        const double elapsed_hours = std::max(0.0, secondsBetween(entry_time, exit_time)) / 3600.0;
        return std::max(MINIMUM_BILLED_HOURS, elapsed_hours);
    }

    double FeeCalculator::rateFor(VehicleClass vehicle_class) const
    {
        auto it = hourly_rates.find(vehicle_class);
        return it == hourly_rates.end() ? FALLBACK_RATE : it->second;
    }
} // namespace autopark
