#pragma once

#include "ParkingConfig.hpp"
#include "ParkingTypes.hpp"

#include <vector>

namespace autopark
{
    class RateModel
    {
    public:
        explicit RateModel(const SimulationConfig &config);
        RateModel(double entry_rate, double exit_rate, double peak_multiplier, std::vector<PeakWindow> peak_hours);

        bool isPeakHour(int hour_of_day) const;
        bool isPeakHour(TimePoint now) const; // local time

        // vehicles per hour
        double effectiveEntryRate(TimePoint now) const;
        double effectiveExitRate(TimePoint now) const;

        // Bernoulli probability of one event within a tick of tick_seconds
        double entryProbability(TimePoint now, double tick_seconds = 1.0) const;
        double exitProbability(TimePoint now, double tick_seconds = 1.0) const;

        static int localHourOf(TimePoint now);

    private:
        double applyPeak(double base_rate, TimePoint now) const;

        double entry_rate;
        double exit_rate;
        double peak_multiplier;
        std::vector<PeakWindow> peak_hours;
    };

} // namespace autopark
