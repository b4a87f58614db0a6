#pragma once

#include "ParkingSpace.hpp"
#include "ParkingTypes.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace autopark
{
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &message)
            : std::runtime_error(message)
        {
        }
    };

    enum class QueueDrainPolicy : uint8_t
    {
        HeadOnly = 0,       // only the queue head is considered on each free event
        FirstCompatible = 1 // first waiting vehicle that fits a free space
    };

    enum class ExitSelectionPolicy : uint8_t
    {
        Random = 0,
        OldestFirst = 1
    };

    // Inclusive on both ends: {7, 9} covers 07:00 through 09:59
    struct PeakWindow
    {
        int start_hour = 0;
        int end_hour = 0;
    };

    struct GridConfig
    {
        int levels = 15;
        int spaces_per_level = 20;
        SpaceClassRules class_rules{};
    };

    struct SimulationConfig
    {
        double entry_rate = 5.0; // vehicles per hour
        double exit_rate = 3.0;  // vehicles per hour
        double peak_multiplier = 3.0;
        std::vector<PeakWindow> peak_hours{{7, 9}, {17, 19}};
        int64_t tick_interval_ms = 1000;
        std::optional<uint32_t> random_seed;
        double payment_success_probability = 0.95;
        QueueDrainPolicy queue_drain_policy = QueueDrainPolicy::HeadOnly;
        ExitSelectionPolicy exit_selection = ExitSelectionPolicy::Random;
        uint32_t starvation_threshold = 10;
        std::size_t recent_event_capacity = 100;
        std::size_t completed_vehicle_capacity = 500;
        bool log_vehicle_events = false;
    };

    struct ParkingConfig
    {
        GridConfig grid;
        std::map<VehicleClass, double> hourly_rates;
        SimulationConfig simulation;
        std::string database_path = "parking_system.db";
        int http_port = 8080;
        bool http_enabled = true;
    };

    inline std::map<VehicleClass, double> makeDefaultRateTable()
    {
        return {
            {VehicleClass::Car, 3.0},
            {VehicleClass::Suv, 4.0},
            {VehicleClass::Truck, 6.0},
            {VehicleClass::Motorcycle, 2.0}};
    }

    inline ParkingConfig makeDefaultParkingConfig()
    {
        ParkingConfig config;
        config.hourly_rates = makeDefaultRateTable();
        return config;
    }

    // Empty when the config is usable
    std::vector<std::string> validateParkingConfig(const ParkingConfig &config);

    // Throws ConfigError listing every problem found
    void requireValidConfig(const ParkingConfig &config);

    const char *toString(QueueDrainPolicy policy);
    const char *toString(ExitSelectionPolicy policy);

} // namespace autopark
