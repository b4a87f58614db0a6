#include "RateModel.hpp"

#include <ctime>
#include <utility>

namespace autopark
{
    RateModel::RateModel(const SimulationConfig &config)
        : RateModel(config.entry_rate, config.exit_rate, config.peak_multiplier, config.peak_hours)
    {
    }

    RateModel::RateModel(double entry_rate, double exit_rate, double peak_multiplier, std::vector<PeakWindow> peak_hours)
        : entry_rate(entry_rate),
          exit_rate(exit_rate),
          peak_multiplier(peak_multiplier),
          peak_hours(std::move(peak_hours))
    {
    }

    bool RateModel::isPeakHour(int hour_of_day) const
    {
        for (const auto &window : peak_hours)
        {
            if (window.start_hour <= hour_of_day && hour_of_day <= window.end_hour)
            {
                return true;
            }
        }
        return false;
    }

    bool RateModel::isPeakHour(TimePoint now) const
    {
        return isPeakHour(localHourOf(now));
    }

    double RateModel::effectiveEntryRate(TimePoint now) const
    {
        return applyPeak(entry_rate, now);
    }

    double RateModel::effectiveExitRate(TimePoint now) const
    {
        return applyPeak(exit_rate, now);
    }

    double RateModel::entryProbability(TimePoint now, double tick_seconds) const
    {
        return effectiveEntryRate(now) * tick_seconds / 3600.0;
    }

    double RateModel::exitProbability(TimePoint now, double tick_seconds) const
    {
        return effectiveExitRate(now) * tick_seconds / 3600.0;
    }

    int RateModel::localHourOf(TimePoint now)
    {
        std::time_t t = Clock::to_time_t(now);
        std::tm local{};
        localtime_r(&t, &local);
        return local.tm_hour;
    }

    double RateModel::applyPeak(double base_rate, TimePoint now) const
    {
        return isPeakHour(now) ? base_rate * peak_multiplier : base_rate;
    }
} // namespace autopark
