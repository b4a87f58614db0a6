#pragma once

#include "ParkingEngine.hpp"
#include "StatusHttpServer.hpp"

namespace autopark
{
    // Maps a /command query (cmd=start|stop|pause|resume|step|reset|inject|exit|release|maintenance|reserve
    // plus its arguments) onto the engine. 400 for malformed input, 404 for unknown spaces or
    // vehicles, 409 when the engine refuses in its current state.
    StatusHttpServer::Reply dispatchEngineCommand(ParkingEngine &engine, const StatusHttpServer::QueryParams &params);
} // namespace autopark
