#include "ParkingStatusJson.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <ctime>

namespace autopark
{
    namespace
    {
        using nlohmann::json;
    }

    // Local time, millisecond precision: 2024-05-01T17:04:09.120
    std::string formatIsoTimestamp(TimePoint tp)
    {
        const std::time_t seconds = Clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&seconds, &local);

        const long long millis = static_cast<long long>(toUnixMillis(tp) % 1000);
        char buffer[40];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03lld",
                      local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
                      local.tm_hour, local.tm_min, local.tm_sec, millis < 0 ? 0 : millis);
        return buffer;
    }

    std::string systemStatusToJson(const SystemStatus &status)
    {
        json root;
        root["timestamp"] = formatIsoTimestamp(status.timestamp);
        root["total_spaces"] = status.total_spaces;
        root["occupied_spaces"] = status.occupied_spaces;
        root["available_spaces"] = status.available_spaces;
        root["queue_length"] = status.queue_length;
        root["statistics"] = {
            {"total_entries", status.statistics.total_entries},
            {"total_exits", status.statistics.total_exits},
            {"total_revenue", status.statistics.total_revenue},
            {"average_stay_hours", status.statistics.average_stay_hours},
            {"occupancy_rate", status.statistics.occupancy_rate},
            {"payment_failures", status.statistics.payment_failures},
            {"total_queued", status.statistics.total_queued}};
        root["is_peak_hour"] = status.is_peak_hour;
        root["entry_rate"] = status.entry_rate;
        root["exit_rate"] = status.exit_rate;
        root["running"] = status.running;
        root["paused"] = status.paused;
        return root.dump();
    }

    std::string parkingGridToJson(const std::vector<GridCell> &grid)
    {
        json root = json::array();
        for (const auto &cell : grid)
        {
            json cell_json;
            cell_json["space_id"] = cell.space_id;
            cell_json["level"] = cell.level;
            cell_json["position"] = cell.position;
            cell_json["space_type"] = toString(cell.space_class);
            cell_json["occupied"] = cell.occupied;
            cell_json["maintenance"] = cell.maintenance;
            cell_json["reserved"] = cell.reserved;
            if (cell.vehicle)
            {
                cell_json["vehicle"] = {
                    {"id", cell.vehicle->id},
                    {"plate_number", cell.vehicle->plate_number},
                    {"vehicle_type", toString(cell.vehicle->vehicle_class)},
                    {"entry_time", formatIsoTimestamp(cell.vehicle->entry_time)}};
            }
            else
            {
                cell_json["vehicle"] = nullptr;
            }
            root.push_back(cell_json);
        }
        return root.dump();
    }

    std::string parkingEventsToJson(const std::vector<ParkingEvent> &events)
    {
        json root = json::array();
        for (const auto &event : events)
        {
            json event_json;
            event_json["type"] = toString(event.type);
            event_json["timestamp"] = formatIsoTimestamp(event.timestamp);
            event_json["vehicle_plate"] = event.vehicle_plate;
            event_json["severity"] = toString(event.severity);
            event_json["description"] = event.description;
            if (event.space_id)
                event_json["space_id"] = *event.space_id;
            if (event.amount)
                event_json["amount"] = *event.amount;
            root.push_back(event_json);
        }
        return root.dump();
    }
} // namespace autopark
