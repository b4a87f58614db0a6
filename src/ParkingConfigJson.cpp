#include "ParkingConfigJson.hpp"

#include <nlohmann/json.hpp>

#include <exception>

namespace autopark
{
    namespace
    {
        using nlohmann::json;

        bool drainPolicyFromString(const std::string &value, QueueDrainPolicy &policy)
        {
            if (value == "head_only")
            {
                policy = QueueDrainPolicy::HeadOnly;
                return true;
            }
            if (value == "first_compatible")
            {
                policy = QueueDrainPolicy::FirstCompatible;
                return true;
            }
            return false;
        }

        bool exitSelectionFromString(const std::string &value, ExitSelectionPolicy &policy)
        {
            if (value == "random")
            {
                policy = ExitSelectionPolicy::Random;
                return true;
            }
            if (value == "oldest_first")
            {
                policy = ExitSelectionPolicy::OldestFirst;
                return true;
            }
            return false;
        }

        // Copies object[key] into out when present; records an error when it has the wrong type
        void readInt(const json &object, const char *key, const std::string &scope, int &out, std::vector<std::string> &errors)
        {
            if (!object.contains(key))
            {
                return;
            }
            if (!object[key].is_number_integer())
            {
                errors.push_back(scope + "." + key + " must be an integer");
                return;
            }
            out = object[key].get<int>();
        }

        void readNumber(const json &object, const char *key, const std::string &scope, double &out, std::vector<std::string> &errors)
        {
            if (!object.contains(key))
            {
                return;
            }
            if (!object[key].is_number())
            {
                errors.push_back(scope + "." + key + " must be a number");
                return;
            }
            out = object[key].get<double>();
        }

        void readBool(const json &object, const char *key, const std::string &scope, bool &out, std::vector<std::string> &errors)
        {
            if (!object.contains(key))
            {
                return;
            }
            if (!object[key].is_boolean())
            {
                errors.push_back(scope + "." + key + " must be a boolean");
                return;
            }
            out = object[key].get<bool>();
        }

        void parseGrid(const json &grid_json, GridConfig &grid, std::vector<std::string> &errors)
        {
            if (!grid_json.is_object())
            {
                errors.push_back("grid must be an object");
                return;
            }
            readInt(grid_json, "levels", "grid", grid.levels, errors);
            readInt(grid_json, "spaces_per_level", "grid", grid.spaces_per_level, errors);
            readInt(grid_json, "motorcycle_positions", "grid", grid.class_rules.motorcycle_positions, errors);
            readInt(grid_json, "truck_positions", "grid", grid.class_rules.truck_positions, errors);
        }

        void parseRates(const json &rates_json, std::map<VehicleClass, double> &rates, std::vector<std::string> &errors)
        {
            if (!rates_json.is_object())
            {
                errors.push_back("rates must be an object");
                return;
            }

            std::map<VehicleClass, double> parsed;
            for (auto it = rates_json.begin(); it != rates_json.end(); ++it)
            {
                VehicleClass vehicle_class{};
                if (!vehicleClassFromString(it.key(), vehicle_class))
                {
                    errors.push_back("unknown vehicle class in rates: " + it.key());
                    continue;
                }
                if (!it.value().is_number())
                {
                    errors.push_back("rate for " + it.key() + " must be a number");
                    continue;
                }
                parsed[vehicle_class] = it.value().get<double>();
            }
            rates = parsed;
        }

        void parsePeakHours(const json &peaks_json, std::vector<PeakWindow> &peaks, std::vector<std::string> &errors)
        {
            if (!peaks_json.is_array())
            {
                errors.push_back("simulation.peak_hours must be an array");
                return;
            }

            std::vector<PeakWindow> parsed;
            for (const auto &window_json : peaks_json)
            {
                if (!window_json.is_array() || window_json.size() != 2 ||
                    !window_json[0].is_number_integer() || !window_json[1].is_number_integer())
                {
                    errors.push_back("peak window must be a [start_hour, end_hour] pair of integers");
                    continue;
                }
                parsed.push_back({window_json[0].get<int>(), window_json[1].get<int>()});
            }
            peaks = parsed;
        }

        void parseSimulation(const json &sim_json, SimulationConfig &sim, std::vector<std::string> &errors)
        {
            if (!sim_json.is_object())
            {
                errors.push_back("simulation must be an object");
                return;
            }

            const std::string scope = "simulation";
            readNumber(sim_json, "entry_rate", scope, sim.entry_rate, errors);
            readNumber(sim_json, "exit_rate", scope, sim.exit_rate, errors);
            readNumber(sim_json, "peak_multiplier", scope, sim.peak_multiplier, errors);
            readNumber(sim_json, "payment_success_probability", scope, sim.payment_success_probability, errors);
            readBool(sim_json, "log_vehicle_events", scope, sim.log_vehicle_events, errors);

            if (sim_json.contains("peak_hours"))
            {
                parsePeakHours(sim_json["peak_hours"], sim.peak_hours, errors);
            }

            if (sim_json.contains("tick_interval_ms"))
            {
                if (sim_json["tick_interval_ms"].is_number_integer())
                    sim.tick_interval_ms = sim_json["tick_interval_ms"].get<int64_t>();
                else
                    errors.push_back("simulation.tick_interval_ms must be an integer");
            }

            if (sim_json.contains("random_seed"))
            {
                if (sim_json["random_seed"].is_null())
                    sim.random_seed.reset();
                else if (sim_json["random_seed"].is_number_unsigned())
                    sim.random_seed = sim_json["random_seed"].get<uint32_t>();
                else
                    errors.push_back("simulation.random_seed must be an unsigned number or null");
            }

            if (sim_json.contains("starvation_threshold"))
            {
                if (sim_json["starvation_threshold"].is_number_unsigned())
                    sim.starvation_threshold = sim_json["starvation_threshold"].get<uint32_t>();
                else
                    errors.push_back("simulation.starvation_threshold must be an unsigned number");
            }

            if (sim_json.contains("recent_event_capacity"))
            {
                if (sim_json["recent_event_capacity"].is_number_unsigned())
                    sim.recent_event_capacity = sim_json["recent_event_capacity"].get<std::size_t>();
                else
                    errors.push_back("simulation.recent_event_capacity must be an unsigned number");
            }

            if (sim_json.contains("completed_vehicle_capacity"))
            {
                if (sim_json["completed_vehicle_capacity"].is_number_unsigned())
                    sim.completed_vehicle_capacity = sim_json["completed_vehicle_capacity"].get<std::size_t>();
                else
                    errors.push_back("simulation.completed_vehicle_capacity must be an unsigned number");
            }

            if (sim_json.contains("queue_drain_policy"))
            {
                const json &value = sim_json["queue_drain_policy"];
                if (!value.is_string() || !drainPolicyFromString(value.get<std::string>(), sim.queue_drain_policy))
                {
                    errors.push_back("simulation.queue_drain_policy must be \"head_only\" or \"first_compatible\"");
                }
            }

            if (sim_json.contains("exit_selection"))
            {
                const json &value = sim_json["exit_selection"];
                if (!value.is_string() || !exitSelectionFromString(value.get<std::string>(), sim.exit_selection))
                {
                    errors.push_back("simulation.exit_selection must be \"random\" or \"oldest_first\"");
                }
            }
        }
    }

    std::string parkingConfigToJson(const ParkingConfig &config)
    {
        json root;

        root["grid"] = {
            {"levels", config.grid.levels},
            {"spaces_per_level", config.grid.spaces_per_level},
            {"motorcycle_positions", config.grid.class_rules.motorcycle_positions},
            {"truck_positions", config.grid.class_rules.truck_positions}};

        root["rates"] = json::object();
        for (const auto &entry : config.hourly_rates)
        {
            root["rates"][toString(entry.first)] = entry.second;
        }

        const SimulationConfig &sim = config.simulation;
        json sim_json;
        sim_json["entry_rate"] = sim.entry_rate;
        sim_json["exit_rate"] = sim.exit_rate;
        sim_json["peak_multiplier"] = sim.peak_multiplier;
        sim_json["peak_hours"] = json::array();
        for (const auto &window : sim.peak_hours)
        {
            sim_json["peak_hours"].push_back(json::array({window.start_hour, window.end_hour}));
        }
        sim_json["tick_interval_ms"] = sim.tick_interval_ms;
        if (sim.random_seed.has_value())
            sim_json["random_seed"] = *sim.random_seed;
        else
            sim_json["random_seed"] = nullptr;
        sim_json["payment_success_probability"] = sim.payment_success_probability;
        sim_json["queue_drain_policy"] = toString(sim.queue_drain_policy);
        sim_json["exit_selection"] = toString(sim.exit_selection);
        sim_json["starvation_threshold"] = sim.starvation_threshold;
        sim_json["recent_event_capacity"] = sim.recent_event_capacity;
        sim_json["completed_vehicle_capacity"] = sim.completed_vehicle_capacity;
        sim_json["log_vehicle_events"] = sim.log_vehicle_events;
        root["simulation"] = sim_json;

        root["database"] = {{"path", config.database_path}};
        root["http"] = {{"port", config.http_port}, {"enabled", config.http_enabled}};

        return root.dump(2);
    }

    ConfigParseResult parkingConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;
        result.config = makeDefaultParkingConfig();

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        if (root.contains("grid"))
        {
            parseGrid(root["grid"], result.config.grid, result.errors);
        }
        if (root.contains("rates"))
        {
            parseRates(root["rates"], result.config.hourly_rates, result.errors);
        }
        if (root.contains("simulation"))
        {
            parseSimulation(root["simulation"], result.config.simulation, result.errors);
        }

        if (root.contains("database"))
        {
            const json &db_json = root["database"];
            if (db_json.is_object() && db_json.contains("path") && db_json["path"].is_string())
            {
                result.config.database_path = db_json["path"].get<std::string>();
            }
            else if (!db_json.is_object() || db_json.contains("path"))
            {
                result.errors.push_back("database.path must be a string");
            }
        }

        if (root.contains("http"))
        {
            const json &http_json = root["http"];
            if (!http_json.is_object())
            {
                result.errors.push_back("http must be an object");
            }
            else
            {
                readInt(http_json, "port", "http", result.config.http_port, result.errors);
                readBool(http_json, "enabled", "http", result.config.http_enabled, result.errors);
                if (result.config.http_port <= 0 || result.config.http_port > 65535)
                {
                    result.errors.push_back("http.port must be within 1..65535");
                }
            }
        }

        for (const auto &error : validateParkingConfig(result.config))
        {
            result.errors.push_back(error);
        }

        result.ok = result.errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        nlohmann::json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }
} // namespace autopark
