#include "ParkingConfig.hpp"

#include <sstream>

namespace autopark
{
    namespace
    {
        constexpr std::array<VehicleClass, 4> kAllVehicleClasses = {
            VehicleClass::Car,
            VehicleClass::Suv,
            VehicleClass::Truck,
            VehicleClass::Motorcycle};

        void validateGrid(const GridConfig &grid, std::vector<std::string> &errors)
        {
            if (grid.levels <= 0 || grid.spaces_per_level <= 0)
            {
                errors.push_back("grid dimensions must be positive");
                return;
            }

            const SpaceClassRules &rules = grid.class_rules;
            if (rules.motorcycle_positions < 0 || rules.truck_positions < 0)
            {
                errors.push_back("space class position counts must not be negative");
            }
            else if (rules.motorcycle_positions + rules.truck_positions > grid.spaces_per_level)
            {
                errors.push_back("motorcycle and truck positions exceed spaces_per_level");
            }
        }

        void validateRates(const std::map<VehicleClass, double> &rates, std::vector<std::string> &errors)
        {
            if (rates.empty())
            {
                errors.push_back("hourly rate table is empty");
                return;
            }

            for (VehicleClass vehicle_class : kAllVehicleClasses)
            {
                auto it = rates.find(vehicle_class);
                if (it == rates.end())
                {
                    errors.push_back(std::string("missing hourly rate for ") + toString(vehicle_class));
                    continue;
                }
                if (it->second < 0.0)
                {
                    errors.push_back(std::string("negative hourly rate for ") + toString(vehicle_class));
                }
            }
        }

        void validateSimulation(const SimulationConfig &sim, std::vector<std::string> &errors)
        {
            if (sim.entry_rate < 0.0 || sim.exit_rate < 0.0)
            {
                errors.push_back("entry and exit rates must not be negative");
            }
            if (sim.peak_multiplier < 0.0)
            {
                errors.push_back("peak multiplier must not be negative");
            }

            for (const auto &window : sim.peak_hours)
            {
                if (window.start_hour < 0 || window.start_hour > 23 ||
                    window.end_hour < 0 || window.end_hour > 23 ||
                    window.start_hour > window.end_hour)
                {
                    std::ostringstream msg;
                    msg << "malformed peak window [" << window.start_hour << ", " << window.end_hour << "]";
                    errors.push_back(msg.str());
                }
            }

            if (sim.tick_interval_ms <= 0)
            {
                errors.push_back("tick interval must be positive");
            }
            if (sim.payment_success_probability < 0.0 || sim.payment_success_probability > 1.0)
            {
                errors.push_back("payment success probability must be within [0, 1]");
            }
        }
    }

    std::vector<std::string> validateParkingConfig(const ParkingConfig &config)
    {
        std::vector<std::string> errors;
        validateGrid(config.grid, errors);
        validateRates(config.hourly_rates, errors);
        validateSimulation(config.simulation, errors);
        return errors;
    }

    void requireValidConfig(const ParkingConfig &config)
    {
        const std::vector<std::string> errors = validateParkingConfig(config);
        if (errors.empty())
        {
            return;
        }

        std::ostringstream msg;
        msg << "invalid parking configuration: ";
        for (std::size_t i = 0; i < errors.size(); ++i)
        {
            if (i > 0)
            {
                msg << "; ";
            }
            msg << errors[i];
        }
        throw ConfigError(msg.str());
    }

    const char *toString(QueueDrainPolicy policy)
    {
        switch (policy)
        {
        case QueueDrainPolicy::HeadOnly:
            return "head_only";
        case QueueDrainPolicy::FirstCompatible:
            return "first_compatible";
        }
        return "head_only";
    }

    const char *toString(ExitSelectionPolicy policy)
    {
        switch (policy)
        {
        case ExitSelectionPolicy::Random:
            return "random";
        case ExitSelectionPolicy::OldestFirst:
            return "oldest_first";
        }
        return "random";
    }
} // namespace autopark
