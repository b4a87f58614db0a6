#pragma once

#include "Vehicle.hpp"

#include <cstdint>
#include <random>
#include <string>

namespace autopark
{
    struct VehicleClassProfile
    {
        double min_length, max_length; // meters
        double min_width, max_width;
        double min_height, max_height;
        double weight; // relative share of arrivals
    };

    class VehicleFactory
    {
    public:
        VehicleFactory();

        // Draws class, dimensions, plate and owner from rng
        Vehicle generate(std::mt19937 &rng, TimePoint entry_time);

        // Same as generate() but with a fixed vehicle class
        Vehicle generate(std::mt19937 &rng, TimePoint entry_time, VehicleClass vehicle_class);

        static const VehicleClassProfile &profileFor(VehicleClass vehicle_class);

        // Next sequential id ("V000001", ...); generate() draws its id from here
        std::string nextVehicleId();

        uint32_t getTotalGenerated() const { return next_vehicle_number - 1; }

        void reset();

    private:
        VehicleClass drawVehicleClass(std::mt19937 &rng);
        static std::string drawPlateNumber(std::mt19937 &rng);
        static std::string drawPhoneNumber(std::mt19937 &rng);

        std::discrete_distribution<int> class_distribution;
        uint32_t next_vehicle_number;
    };

} // namespace autopark
