#include "SpaceGrid.hpp"

#include "ParkingConfig.hpp"

#include <utility>

namespace autopark
{
    SpaceGrid::SpaceGrid(int levels, int spaces_per_level, const SpaceClassRules &rules)
    {
        initialize(levels, spaces_per_level, rules);
    }

    void SpaceGrid::initialize(int levels, int spaces_per_level, const SpaceClassRules &rules)
    {
        if (levels <= 0 || spaces_per_level <= 0)
        {
            throw ConfigError("grid dimensions must be positive");
        }
        if (rules.motorcycle_positions < 0 || rules.truck_positions < 0 ||
            rules.motorcycle_positions + rules.truck_positions > spaces_per_level)
        {
            throw ConfigError("space class rules do not fit in a level");
        }

        std::vector<ParkingSpace> built;
        built.reserve(static_cast<std::size_t>(levels) * static_cast<std::size_t>(spaces_per_level));
        for (int level = 1; level <= levels; ++level)
        {
            for (int position = 1; position <= spaces_per_level; ++position)
            {
                ParkingSpace space;
                space.id = spaceIdFor(level, position, spaces_per_level);
                space.level = static_cast<uint16_t>(level);
                space.position = static_cast<uint16_t>(position);
                space.space_class = classForPosition(position, spaces_per_level, rules);
                built.push_back(space);
            }
        }

        std::lock_guard<std::mutex> lock(mutex);
        spaces = std::move(built);
        occupied_count = 0;
    }

    std::optional<SpaceId> SpaceGrid::findCompatible(VehicleClass vehicle_class) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto &space : spaces)
        {
            if (space.isAllocatable() && spaceAccepts(space.space_class, vehicle_class))
            {
                return space.id;
            }
        }
        return std::nullopt;
    }

    bool SpaceGrid::allocate(SpaceId space_id, const std::string &vehicle_id)
    {
        std::lock_guard<std::mutex> lock(mutex);
        ParkingSpace *space = findLocked(space_id);
        if (!space || !space->isAllocatable() || vehicle_id.empty())
        {
            return false;
        }

        space->occupied = true;
        space->vehicle_id = vehicle_id;
        occupied_count++;
        return true;
    }

    bool SpaceGrid::release(SpaceId space_id)
    {
        std::lock_guard<std::mutex> lock(mutex);
        ParkingSpace *space = findLocked(space_id);
        if (!space || !space->occupied)
        {
            return false;
        }

        space->occupied = false;
        space->vehicle_id.clear();
        occupied_count--;
        return true;
    }

    bool SpaceGrid::setMaintenance(SpaceId space_id, bool maintenance)
    {
        std::lock_guard<std::mutex> lock(mutex);
        ParkingSpace *space = findLocked(space_id);
        if (!space)
        {
            return false;
        }
        space->maintenance = maintenance;
        return true;
    }

    bool SpaceGrid::setReserved(SpaceId space_id, bool reserved)
    {
        std::lock_guard<std::mutex> lock(mutex);
        ParkingSpace *space = findLocked(space_id);
        if (!space)
        {
            return false;
        }
        space->reserved = reserved;
        return true;
    }

    void SpaceGrid::releaseAll()
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto &space : spaces)
        {
            space.occupied = false;
            space.vehicle_id.clear();
        }
        occupied_count = 0;
    }

    std::vector<ParkingSpace> SpaceGrid::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return spaces;
    }

    std::optional<ParkingSpace> SpaceGrid::getSpace(SpaceId space_id) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        const ParkingSpace *space = findLocked(space_id);
        if (!space)
        {
            return std::nullopt;
        }
        return *space;
    }

    std::size_t SpaceGrid::totalSpaces() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return spaces.size();
    }

    std::size_t SpaceGrid::occupiedCount() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return occupied_count;
    }

    std::size_t SpaceGrid::availableCount() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return spaces.size() - occupied_count;
    }

    SpaceClass SpaceGrid::classForPosition(int position, int spaces_per_level, const SpaceClassRules &rules)
    {
        if (position <= rules.motorcycle_positions)
        {
            return SpaceClass::Motorcycle;
        }
        if (position > spaces_per_level - rules.truck_positions)
        {
            return SpaceClass::Truck;
        }
        return SpaceClass::Standard;
    }

    // Ids are dense and 1-based, so the id doubles as an index
    ParkingSpace *SpaceGrid::findLocked(SpaceId space_id)
    {
        if (space_id == 0 || space_id > spaces.size())
        {
            return nullptr;
        }
        return &spaces[space_id - 1];
    }

    const ParkingSpace *SpaceGrid::findLocked(SpaceId space_id) const
    {
        if (space_id == 0 || space_id > spaces.size())
        {
            return nullptr;
        }
        return &spaces[space_id - 1];
    }
} // namespace autopark
