#include <iostream>
#include <atomic>
#include <csignal>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>
#include "ParkingEngine.hpp"
#include "ParkingConfigJson.hpp"
#include "ParkingStatusJson.hpp"
#include "EngineCommands.hpp"
#include "StatusHttpServer.hpp"
#include "db/SqliteRecordStore.hpp"

namespace
{
    std::atomic<bool> g_keep_running{true};

    void handleSignal(int)
    {
        g_keep_running = false;
    }

    bool readTextFile(const std::string &path, std::string &contents)
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
        {
            return false;
        }
        std::ostringstream out;
        out << in.rdbuf();
        contents = out.str();
        return true;
    }

    void printErrors(const std::vector<std::string> &errors)
    {
        for (const auto &error : errors)
        {
            std::cerr << "  - " << error << std::endl;
        }
    }

    void printStatus(const autopark::SystemStatus &status)
    {
        std::cout << "[status] occupied " << status.occupied_spaces << "/" << status.total_spaces
                  << " | available " << status.available_spaces
                  << " | queue " << status.queue_length
                  << " | entries " << status.statistics.total_entries
                  << " | exits " << status.statistics.total_exits
                  << " | revenue $" << std::fixed << std::setprecision(2) << status.statistics.total_revenue
                  << " | occupancy " << std::setprecision(1) << status.statistics.occupancy_rate * 100.0 << "%"
                  << (status.is_peak_hour ? " | PEAK" : "")
                  << (status.paused ? " | paused" : "") << std::endl;
    }
}

int main(int argc, char **argv)
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "=== Autopark Multi-Level Parking Simulator ===" << std::endl;
    std::cout << std::endl;

    autopark::ParkingConfig config = autopark::makeDefaultParkingConfig();
    bool config_from_file = false;

    if (argc > 1)
    {
        std::string text;
        if (!readTextFile(argv[1], text))
        {
            std::cerr << "Failed to read config file " << argv[1] << std::endl;
            return 1;
        }
        autopark::ConfigParseResult parsed = autopark::parkingConfigFromJson(text);
        if (!parsed.ok)
        {
            std::cerr << "Invalid config file " << argv[1] << ":" << std::endl;
            printErrors(parsed.errors);
            return 1;
        }
        config = parsed.config;
        config_from_file = true;
    }

    auto database = std::make_shared<autopark::db::SqliteRecordStore>(config.database_path);
    std::string db_error;
    if (!database->initialize(&db_error))
    {
        std::cerr << "Warning: failed to initialize database " << config.database_path << ": " << db_error << std::endl;
    }

    if (config_from_file)
    {
        db_error.clear();
        if (!database->saveActiveConfigJson(autopark::parkingConfigToJson(config), &db_error))
        {
            std::cerr << "Warning: failed to store config: " << db_error << std::endl;
        }
    }
    else if (auto stored = database->loadActiveConfigJson(&db_error); stored.has_value())
    {
        autopark::ConfigParseResult parsed = autopark::parkingConfigFromJson(*stored);
        if (parsed.ok)
        {
            config = parsed.config;
        }
        else
        {
            std::cerr << "Warning: stored config is invalid, using defaults" << std::endl;
            printErrors(parsed.errors);
        }
    }
    else if (!db_error.empty())
    {
        std::cerr << "Warning: failed to load config from database: " << db_error << std::endl;
    }
    else if (!database->saveActiveConfigJson(autopark::parkingConfigToJson(config), &db_error))
    {
        std::cerr << "Warning: failed to store default config: " << db_error << std::endl;
    }

    std::unique_ptr<autopark::ParkingEngine> engine;
    try
    {
        engine = std::make_unique<autopark::ParkingEngine>(config, database);
    }
    catch (const autopark::ConfigError &e)
    {
        std::cerr << "Configuration rejected: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Grid: " << config.grid.levels << " levels x " << config.grid.spaces_per_level
              << " spaces, tick " << config.simulation.tick_interval_ms << " ms" << std::endl;

    std::unique_ptr<autopark::StatusHttpServer> server;
    if (config.http_enabled)
    {
        server = std::make_unique<autopark::StatusHttpServer>(
            config.http_port,
            [&]()
            { return autopark::systemStatusToJson(engine->getSystemStatus()); },
            [&]()
            { return autopark::parkingGridToJson(engine->getParkingGrid()); },
            [&](std::size_t limit)
            {
                std::vector<autopark::ParkingEvent> events = engine->getRecentEvents();
                if (events.size() > limit)
                {
                    events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(limit));
                }
                return autopark::parkingEventsToJson(events);
            },
            [&]()
            { return autopark::parkingConfigToJson(engine->getConfig()); },
            [&](const autopark::StatusHttpServer::QueryParams &params)
            { return autopark::dispatchEngineCommand(*engine, params); });

        if (!server->start())
        {
            std::cerr << "Failed to start status server on port " << config.http_port << std::endl;
            return 1;
        }
        std::cout << "Status at: http://localhost:" << config.http_port << "/status" << std::endl;
    }

    engine->start();
    std::cout << "Press Ctrl+C to stop..." << std::endl;

    constexpr auto kStatusInterval = std::chrono::seconds(10);
    auto next_status = std::chrono::steady_clock::now() + kStatusInterval;
    while (g_keep_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() >= next_status)
        {
            printStatus(engine->getSystemStatus());
            next_status += kStatusInterval;
        }
    }

    if (server)
    {
        server->stop();
    }
    engine->stop();

    printStatus(engine->getSystemStatus());
    std::cout << "Simulation stopped." << std::endl;
    return 0;
}
