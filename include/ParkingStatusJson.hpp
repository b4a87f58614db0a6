#pragma once

#include "ParkingEngine.hpp"

#include <string>
#include <vector>

namespace autopark
{
    std::string formatIsoTimestamp(TimePoint tp);

    std::string systemStatusToJson(const SystemStatus &status);
    std::string parkingGridToJson(const std::vector<GridCell> &grid);
    std::string parkingEventsToJson(const std::vector<ParkingEvent> &events);
} // namespace autopark
