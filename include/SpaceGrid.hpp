#pragma once

#include "ParkingSpace.hpp"
#include "ParkingTypes.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autopark
{
    // Owns every ParkingSpace. Each public operation is atomic with respect to
    // the others; spaces are created once by initialize() and never destroyed.
    class SpaceGrid
    {
    public:
        SpaceGrid() = default;
        SpaceGrid(int levels, int spaces_per_level, const SpaceClassRules &rules);

        // Throws ConfigError on non-positive dimensions or rules that do not fit a level
        void initialize(int levels, int spaces_per_level, const SpaceClassRules &rules);

        // Lowest (level, position) free space accepting vehicle_class; read-only
        std::optional<SpaceId> findCompatible(VehicleClass vehicle_class) const;

        // False if the space is unknown, taken, under maintenance or reserved
        bool allocate(SpaceId space_id, const std::string &vehicle_id);

        // False if the space is unknown or already free
        bool release(SpaceId space_id);

        bool setMaintenance(SpaceId space_id, bool maintenance);
        bool setReserved(SpaceId space_id, bool reserved);

        // Clears every binding; maintenance and reserved flags are kept
        void releaseAll();

        std::vector<ParkingSpace> snapshot() const;
        std::optional<ParkingSpace> getSpace(SpaceId space_id) const;

        std::size_t totalSpaces() const;
        std::size_t occupiedCount() const;
        std::size_t availableCount() const;

    private:
        static SpaceClass classForPosition(int position, int spaces_per_level, const SpaceClassRules &rules);
        ParkingSpace *findLocked(SpaceId space_id);
        const ParkingSpace *findLocked(SpaceId space_id) const;

        mutable std::mutex mutex;
        std::vector<ParkingSpace> spaces; // ordered by level, then position
        std::size_t occupied_count = 0;
    };

} // namespace autopark
