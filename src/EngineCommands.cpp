#include "EngineCommands.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <limits>

namespace autopark
{
    namespace
    {
        using nlohmann::json;
        using Reply = StatusHttpServer::Reply;
        using QueryParams = StatusHttpServer::QueryParams;

        Reply okReply(json body = json::object())
        {
            body["ok"] = true;
            return {200, body.dump(), "application/json"};
        }

        Reply failReply(int status_code, const std::string &message)
        {
            json body;
            body["ok"] = false;
            body["error"] = message;
            return {status_code, body.dump(), "application/json"};
        }

        std::string paramOr(const QueryParams &params, const std::string &key, const std::string &fallback)
        {
            const auto it = params.find(key);
            return it == params.end() ? fallback : it->second;
        }

        bool parseSpaceId(const QueryParams &params, SpaceId &space_id)
        {
            const std::string raw = paramOr(params, "space", "");
            if (raw.empty())
                return false;
            char *end = nullptr;
            const unsigned long parsed = std::strtoul(raw.c_str(), &end, 10);
            if (*end != '\0' || parsed == 0 || parsed > std::numeric_limits<SpaceId>::max())
                return false;
            space_id = static_cast<SpaceId>(parsed);
            return true;
        }

        bool parseFlag(const QueryParams &params, bool &flag)
        {
            const std::string raw = paramOr(params, "on", "1");
            if (raw == "1" || raw == "true")
            {
                flag = true;
                return true;
            }
            if (raw == "0" || raw == "false")
            {
                flag = false;
                return true;
            }
            return false;
        }

        const char *admissionName(ParkingEngine::Admission admission)
        {
            switch (admission)
            {
            case ParkingEngine::Admission::Parked:
                return "parked";
            case ParkingEngine::Admission::Queued:
                return "queued";
            case ParkingEngine::Admission::Rejected:
                return "rejected";
            }
            return "rejected";
        }
    } // namespace

    Reply dispatchEngineCommand(ParkingEngine &engine, const QueryParams &params)
    {
        const std::string cmd = paramOr(params, "cmd", "");

        if (cmd == "start")
        {
            engine.handleCommand(ParkingEngine::EngineCommand::Start);
            return okReply();
        }
        if (cmd == "stop")
        {
            engine.handleCommand(ParkingEngine::EngineCommand::Stop);
            return okReply();
        }
        if (cmd == "pause")
        {
            engine.handleCommand(ParkingEngine::EngineCommand::Pause);
            return okReply();
        }
        if (cmd == "resume")
        {
            engine.handleCommand(ParkingEngine::EngineCommand::Resume);
            return okReply();
        }
        if (cmd == "step")
        {
            engine.handleCommand(ParkingEngine::EngineCommand::Step);
            return okReply();
        }
        if (cmd == "reset")
        {
            if (!engine.handleCommand(ParkingEngine::EngineCommand::Reset))
            {
                return failReply(409, "stop the simulation before reset");
            }
            return okReply();
        }

        if (cmd == "inject")
        {
            VehicleClass vehicle_class = VehicleClass::Car;
            if (!vehicleClassFromString(paramOr(params, "type", "car"), vehicle_class))
            {
                return failReply(400, "type must be car, suv, truck or motorcycle");
            }
            const ParkingEngine::Admission admission = engine.injectVehicle(vehicle_class);
            if (admission == ParkingEngine::Admission::Rejected)
            {
                return failReply(409, "vehicle rejected");
            }
            return okReply({{"admission", admissionName(admission)}});
        }

        if (cmd == "exit")
        {
            const std::string vehicle_id = paramOr(params, "vehicle", "");
            if (vehicle_id.empty())
            {
                return failReply(400, "missing vehicle");
            }
            switch (engine.exitVehicle(vehicle_id))
            {
            case ParkingEngine::Departure::Departed:
                return okReply();
            case ParkingEngine::Departure::NotParked:
                return failReply(404, "vehicle " + vehicle_id + " is not parked");
            case ParkingEngine::Departure::PaymentFailed:
                return failReply(409, "payment failed");
            }
            return failReply(500, "unexpected exit result");
        }

        if (cmd == "release" || cmd == "maintenance" || cmd == "reserve")
        {
            SpaceId space_id = 0;
            if (!parseSpaceId(params, space_id))
            {
                return failReply(400, "space must be a positive integer");
            }

            bool applied = false;
            if (cmd == "release")
            {
                applied = engine.forceRelease(space_id);
            }
            else
            {
                bool on = true;
                if (!parseFlag(params, on))
                {
                    return failReply(400, "on must be 0 or 1");
                }
                applied = cmd == "maintenance" ? engine.setSpaceMaintenance(space_id, on)
                                               : engine.setSpaceReserved(space_id, on);
            }

            if (!applied)
            {
                return failReply(404, "space " + std::to_string(space_id) + " unchanged");
            }
            return okReply({{"space_id", space_id}});
        }

        return failReply(400, cmd.empty() ? "missing cmd" : "unknown cmd: " + cmd);
    }
} // namespace autopark
