#include "VehicleFactory.hpp"

#include <array>
#include <cstdio>

namespace autopark
{
    namespace
    {
        // Indexed by VehicleClass
        const std::array<VehicleClassProfile, 4> kProfiles = {{
            {4.2, 4.8, 1.7, 1.9, 1.4, 1.6, 0.70}, // car
            {4.6, 5.2, 1.8, 2.0, 1.6, 1.9, 0.20}, // suv
            {5.0, 6.5, 1.9, 2.2, 1.8, 2.2, 0.08}, // truck
            {2.0, 2.5, 0.7, 0.9, 1.0, 1.3, 0.02}, // motorcycle
        }};

        const std::array<const char *, 10> kOwnerNames = {
            "John Smith", "Sarah Johnson", "Michael Brown", "Emily Davis", "David Wilson",
            "Jessica Garcia", "Robert Miller", "Ashley Martinez", "Christopher Anderson", "Amanda Taylor"};

        constexpr const char *kLetters = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

        double drawUniform(std::mt19937 &rng, double lo, double hi)
        {
            std::uniform_real_distribution<double> dist(lo, hi);
            return dist(rng);
        }

        int drawInt(std::mt19937 &rng, int lo, int hi)
        {
            std::uniform_int_distribution<int> dist(lo, hi);
            return dist(rng);
        }

        char drawLetter(std::mt19937 &rng)
        {
            return kLetters[drawInt(rng, 0, 25)];
        }
    }

    VehicleFactory::VehicleFactory()
        : class_distribution({kProfiles[0].weight, kProfiles[1].weight, kProfiles[2].weight, kProfiles[3].weight}),
          next_vehicle_number(1)
    {
    }

    const VehicleClassProfile &VehicleFactory::profileFor(VehicleClass vehicle_class)
    {
        return kProfiles[static_cast<std::size_t>(vehicle_class)];
    }

    Vehicle VehicleFactory::generate(std::mt19937 &rng, TimePoint entry_time)
    {
        return generate(rng, entry_time, drawVehicleClass(rng));
    }

    Vehicle VehicleFactory::generate(std::mt19937 &rng, TimePoint entry_time, VehicleClass vehicle_class)
    {
        const VehicleClassProfile &profile = profileFor(vehicle_class);

        Vehicle vehicle;
        vehicle.vehicle_class = vehicle_class;
        vehicle.length = drawUniform(rng, profile.min_length, profile.max_length);
        vehicle.width = drawUniform(rng, profile.min_width, profile.max_width);
        vehicle.height = drawUniform(rng, profile.min_height, profile.max_height);
        vehicle.id = nextVehicleId();
        vehicle.plate_number = drawPlateNumber(rng);
        vehicle.owner_name = kOwnerNames[static_cast<std::size_t>(drawInt(rng, 0, static_cast<int>(kOwnerNames.size()) - 1))];
        vehicle.phone_number = drawPhoneNumber(rng);
        vehicle.entry_time = entry_time;
        return vehicle;
    }

    void VehicleFactory::reset()
    {
        next_vehicle_number = 1;
        class_distribution.reset();
    }

    VehicleClass VehicleFactory::drawVehicleClass(std::mt19937 &rng)
    {
        return static_cast<VehicleClass>(class_distribution(rng));
    }

    std::string VehicleFactory::nextVehicleId()
    {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "V%06u", next_vehicle_number);
        next_vehicle_number++;
        return buffer;
    }

    // Format: letter, 3 digits, 2 letters, 2 digits (e.g. K482QZ17)
    std::string VehicleFactory::drawPlateNumber(std::mt19937 &rng)
    {
        std::string plate;
        plate.reserve(8);
        plate += drawLetter(rng);
        plate += std::to_string(drawInt(rng, 100, 999));
        plate += drawLetter(rng);
        plate += drawLetter(rng);
        plate += std::to_string(drawInt(rng, 10, 99));
        return plate;
    }

    std::string VehicleFactory::drawPhoneNumber(std::mt19937 &rng)
    {
        return "555-" + std::to_string(drawInt(rng, 100, 999)) + "-" + std::to_string(drawInt(rng, 1000, 9999));
    }
} // namespace autopark
