#pragma once

#include "ParkingTypes.hpp"

#include <string>

namespace autopark
{
    struct ParkingSpace
    {
        SpaceId id = 0;
        uint16_t level = 0;    // 1-based
        uint16_t position = 0; // 1-based within the level
        SpaceClass space_class = SpaceClass::Standard;
        bool occupied = false;
        std::string vehicle_id; // empty iff !occupied
        bool maintenance = false;
        bool reserved = false;

        bool isAllocatable() const { return !occupied && !maintenance && !reserved; }
    };

    // Positions per level given to motorcycles (from the front) and trucks (from the back)
    struct SpaceClassRules
    {
        int motorcycle_positions = 2;
        int truck_positions = 2;
    };

    inline SpaceId spaceIdFor(int level, int position, int spaces_per_level)
    {
        return static_cast<SpaceId>((level - 1) * spaces_per_level + position);
    }

} // namespace autopark
