#include <catch2/catch_all.hpp>
#include <chrono>
#include <ctime>
#include <map>
#include <memory>
#include <set>
#include <thread>
#include <vector>
#include "ParkingEngine.hpp"
#include "RecordStore.hpp"

using namespace autopark;

namespace
{
    // Test-controlled wall clock shared with the engine
    struct ManualClock
    {
        TimePoint current;

        explicit ManualClock(int hour = 12)
        {
            std::tm local{};
            local.tm_year = 2024 - 1900;
            local.tm_mon = 4;
            local.tm_mday = 15;
            local.tm_hour = hour;
            local.tm_isdst = -1;
            current = Clock::from_time_t(std::mktime(&local));
        }

        void advance(std::chrono::minutes minutes) { current += minutes; }

        ParkingEngine::TimeSource source()
        {
            return [this]()
            { return current; };
        }
    };

    ParkingConfig smallConfig(int levels, int spaces_per_level, SpaceClassRules rules = {0, 0})
    {
        ParkingConfig config = makeDefaultParkingConfig();
        config.grid.levels = levels;
        config.grid.spaces_per_level = spaces_per_level;
        config.grid.class_rules = rules;
        config.simulation.random_seed = 42;
        config.simulation.payment_success_probability = 1.0;
        config.http_enabled = false;
        return config;
    }

    std::vector<std::string> ids(const std::vector<Vehicle> &vehicles)
    {
        std::vector<std::string> out;
        for (const auto &v : vehicles)
            out.push_back(v.id);
        return out;
    }

    void requireGridConsistent(const ParkingEngine &engine)
    {
        const std::vector<GridCell> grid = engine.getParkingGrid();
        const std::vector<Vehicle> parked = engine.getParkedVehicles();
        const SystemStatus status = engine.getSystemStatus();

        std::set<std::string> seen;
        std::size_t occupied = 0;
        for (const auto &cell : grid)
        {
            if (!cell.occupied)
            {
                REQUIRE_FALSE(cell.vehicle.has_value());
                continue;
            }
            occupied++;
            REQUIRE(cell.vehicle.has_value());
            REQUIRE(seen.insert(cell.vehicle->id).second);
            REQUIRE(spaceAccepts(cell.space_class, cell.vehicle->vehicle_class));
        }

        REQUIRE(occupied == parked.size());
        REQUIRE(occupied <= status.total_spaces);
        REQUIRE(status.occupied_spaces == occupied);
        REQUIRE(status.available_spaces == status.total_spaces - occupied);

        for (const auto &queued : engine.getQueuedVehicles())
        {
            REQUIRE(seen.count(queued.id) == 0);
        }
    }
}

TEST_CASE("Engine rejects an invalid config", "[engine]")
{
    ParkingConfig config = smallConfig(0, 4);
    REQUIRE_THROWS_AS(ParkingEngine(config), ConfigError);

    ParkingConfig bad_rates = smallConfig(1, 4);
    bad_rates.hourly_rates.clear();
    REQUIRE_THROWS_AS(ParkingEngine(bad_rates), ConfigError);
}

TEST_CASE("Small lot fills in space order then queues", "[engine][scenario]")
{
    ManualClock clock;
    ParkingEngine engine(smallConfig(2, 2), nullptr, clock.source());

    for (int i = 0; i < 4; ++i)
    {
        REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked);
    }

    std::map<std::string, SpaceId> placement;
    for (const auto &v : engine.getParkedVehicles())
        placement[v.id] = *v.space_id;
    REQUIRE(placement.at("V000001") == 1);
    REQUIRE(placement.at("V000002") == 2);
    REQUIRE(placement.at("V000003") == 3);
    REQUIRE(placement.at("V000004") == 4);

    REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Queued);
    SystemStatus status = engine.getSystemStatus();
    REQUIRE(status.queue_length == 1);
    REQUIRE(status.available_spaces == 0);
    REQUIRE(status.statistics.occupancy_rate == Catch::Approx(1.0));
    REQUIRE(status.statistics.total_entries == 4);
    REQUIRE(status.statistics.total_queued == 1);
}

TEST_CASE("Exit bills the stay and frees the space", "[engine][scenario]")
{
    ManualClock clock;
    auto store = std::make_shared<MemoryRecordStore>();
    ParkingEngine engine(smallConfig(1, 4), store, clock.source());

    REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked);
    clock.advance(std::chrono::minutes(150));
    REQUIRE(engine.exitVehicle("V000001") == ParkingEngine::Departure::Departed);

    std::vector<Vehicle> completed = engine.getCompletedVehicles();
    REQUIRE(completed.size() == 1);
    REQUIRE(completed[0].payment_amount == Catch::Approx(7.50));
    REQUIRE(completed[0].exit_time.has_value());
    REQUIRE(completed[0].stayHours() == Catch::Approx(2.5));
    REQUIRE(completed[0].payment_method != PaymentMethod::None);

    SystemStatistics stats = engine.getStatistics();
    REQUIRE(stats.total_exits == 1);
    REQUIRE(stats.total_revenue == Catch::Approx(7.50));
    REQUIRE(stats.average_stay_hours == Catch::Approx(2.5));
    REQUIRE(stats.occupancy_rate == Catch::Approx(0.0));

    std::vector<ParkingEvent> exits = store->getEvents(EventType::VehicleExit);
    REQUIRE(exits.size() == 1);
    REQUIRE(exits[0].space_id == SpaceId{1});
    REQUIRE(*exits[0].amount == Catch::Approx(7.50));

    std::vector<PaymentTransaction> transactions = store->getTransactions();
    REQUIRE(transactions.size() == 1);
    REQUIRE(transactions[0].status == TransactionStatus::Completed);
    REQUIRE(transactions[0].vehicle_id == "V000001");

    REQUIRE(engine.exitVehicle("V000001") == ParkingEngine::Departure::NotParked);
    REQUIRE(engine.exitVehicle("nobody") == ParkingEngine::Departure::NotParked);
}

TEST_CASE("Short stays pay the one hour minimum", "[engine][fee]")
{
    ManualClock clock;
    ParkingEngine engine(smallConfig(1, 2), nullptr, clock.source());

    engine.injectVehicle(VehicleClass::Car);
    clock.advance(std::chrono::minutes(10));
    REQUIRE(engine.exitVehicle("V000001") == ParkingEngine::Departure::Departed);
    REQUIRE(engine.getStatistics().total_revenue == Catch::Approx(3.00));
}

TEST_CASE("Motorcycle waits when only a truck space is free", "[engine][scenario]")
{
    ManualClock clock;
    ParkingEngine engine(smallConfig(1, 3, {1, 1}), nullptr, clock.source());

    REQUIRE(engine.injectVehicle(VehicleClass::Motorcycle) == ParkingEngine::Admission::Parked);
    REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked);
    REQUIRE(engine.injectVehicle(VehicleClass::Motorcycle) == ParkingEngine::Admission::Queued);

    SystemStatus status = engine.getSystemStatus();
    REQUIRE(status.available_spaces == 1);
    REQUIRE(status.queue_length == 1);

    REQUIRE(engine.injectVehicle(VehicleClass::Truck) == ParkingEngine::Admission::Parked);
    requireGridConsistent(engine);
}

TEST_CASE("A free space goes to the queue head", "[engine][queue]")
{
    ManualClock clock;
    auto store = std::make_shared<MemoryRecordStore>();
    ParkingEngine engine(smallConfig(1, 1), store, clock.source());
    const TimePoint arrival = clock.current;

    engine.injectVehicle(VehicleClass::Car);
    engine.injectVehicle(VehicleClass::Car);
    engine.injectVehicle(VehicleClass::Car);
    engine.injectVehicle(VehicleClass::Car);
    REQUIRE(ids(engine.getQueuedVehicles()) == std::vector<std::string>{"V000002", "V000003", "V000004"});

    clock.advance(std::chrono::minutes(30));
    REQUIRE(engine.exitVehicle("V000001") == ParkingEngine::Departure::Departed);

    REQUIRE(ids(engine.getQueuedVehicles()) == std::vector<std::string>{"V000003", "V000004"});
    std::vector<Vehicle> parked = engine.getParkedVehicles();
    REQUIRE(parked.size() == 1);
    REQUIRE(parked[0].id == "V000002");
    REQUIRE(parked[0].space_id == SpaceId{1});
    REQUIRE(parked[0].entry_time == arrival);

    std::vector<ParkingEvent> moved = store->getEvents(EventType::VehicleFromQueue);
    REQUIRE(moved.size() == 1);
    REQUIRE(moved[0].space_id == SpaceId{1});
    REQUIRE(engine.getStatistics().total_entries == 2);
}

TEST_CASE("Queued vehicles pay from their arrival", "[engine][queue]")
{
    ManualClock clock;
    auto store = std::make_shared<MemoryRecordStore>();
    ParkingEngine engine(smallConfig(1, 2), store, clock.source());
    const TimePoint arrival = clock.current;

    engine.injectVehicle(VehicleClass::Car);
    engine.injectVehicle(VehicleClass::Car);
    REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Queued); // V000003

    clock.advance(std::chrono::minutes(120));
    REQUIRE(engine.exitVehicle("V000001") == ParkingEngine::Departure::Departed);
    REQUIRE(engine.getQueuedVehicles().empty());

    clock.advance(std::chrono::minutes(30));
    REQUIRE(engine.exitVehicle("V000003") == ParkingEngine::Departure::Departed);

    std::vector<Vehicle> completed = engine.getCompletedVehicles();
    REQUIRE(ids(completed) == std::vector<std::string>{"V000001", "V000003"});
    REQUIRE(completed[0].payment_amount == Catch::Approx(6.00));
    REQUIRE(completed[1].entry_time == arrival);
    REQUIRE(completed[1].stayHours() == Catch::Approx(2.5));
    REQUIRE(completed[1].payment_amount == Catch::Approx(7.50));

    SystemStatistics stats = engine.getStatistics();
    REQUIRE(stats.total_entries == 3);
    REQUIRE(stats.total_queued == 1);
    REQUIRE(stats.total_revenue == Catch::Approx(13.50));
    REQUIRE(stats.average_stay_hours == Catch::Approx(2.25));

    std::vector<PaymentTransaction> transactions = store->getTransactions();
    REQUIRE(transactions.size() == 2);
    REQUIRE(transactions[1].vehicle_id == "V000003");
    REQUIRE(transactions[1].amount == Catch::Approx(7.50));
    requireGridConsistent(engine);
}

TEST_CASE("Head-only drain keeps an unplaceable head in front", "[engine][queue]")
{
    ManualClock clock;
    ParkingConfig config = smallConfig(1, 2, {1, 0});
    config.simulation.queue_drain_policy = QueueDrainPolicy::HeadOnly;
    ParkingEngine engine(config, nullptr, clock.source());

    engine.injectVehicle(VehicleClass::Car);        // V000001 -> space 2
    engine.injectVehicle(VehicleClass::Motorcycle); // V000002 -> space 1
    engine.injectVehicle(VehicleClass::Car);        // V000003 queued
    engine.injectVehicle(VehicleClass::Motorcycle); // V000004 queued

    REQUIRE(engine.exitVehicle("V000002") == ParkingEngine::Departure::Departed);
    REQUIRE(ids(engine.getQueuedVehicles()) == std::vector<std::string>{"V000003", "V000004"});
    REQUIRE(engine.getSystemStatus().available_spaces == 1);
}

TEST_CASE("First-compatible drain places a vehicle behind the head", "[engine][queue]")
{
    ManualClock clock;
    ParkingConfig config = smallConfig(1, 2, {1, 0});
    config.simulation.queue_drain_policy = QueueDrainPolicy::FirstCompatible;
    ParkingEngine engine(config, nullptr, clock.source());

    engine.injectVehicle(VehicleClass::Car);
    engine.injectVehicle(VehicleClass::Motorcycle);
    engine.injectVehicle(VehicleClass::Car);
    engine.injectVehicle(VehicleClass::Motorcycle);

    REQUIRE(engine.exitVehicle("V000002") == ParkingEngine::Departure::Departed);
    REQUIRE(ids(engine.getQueuedVehicles()) == std::vector<std::string>{"V000003"});
    REQUIRE(engine.getSystemStatus().available_spaces == 0);
    requireGridConsistent(engine);
}

TEST_CASE("A starving queue head raises an event", "[engine][queue]")
{
    ManualClock clock;
    auto store = std::make_shared<MemoryRecordStore>();
    ParkingConfig config = smallConfig(1, 2, {1, 0});
    config.simulation.starvation_threshold = 2;
    ParkingEngine engine(config, store, clock.source());

    engine.injectVehicle(VehicleClass::Car);        // space 2
    engine.injectVehicle(VehicleClass::Motorcycle); // V000002, space 1
    engine.injectVehicle(VehicleClass::Car);        // V000003 queued head

    REQUIRE(engine.exitVehicle("V000002") == ParkingEngine::Departure::Departed);
    REQUIRE(store->getEvents(EventType::QueueStarvation).empty());

    REQUIRE(engine.injectVehicle(VehicleClass::Motorcycle) == ParkingEngine::Admission::Parked); // V000004
    REQUIRE(engine.exitVehicle("V000004") == ParkingEngine::Departure::Departed);

    std::vector<ParkingEvent> starving = store->getEvents(EventType::QueueStarvation);
    REQUIRE(starving.size() == 1);
    REQUIRE(starving[0].severity == EventSeverity::Warning);
    REQUIRE(engine.getQueuedVehicles().size() == 1);
}

TEST_CASE("Failed payment leaves the vehicle parked", "[engine][payment]")
{
    ManualClock clock;
    auto store = std::make_shared<MemoryRecordStore>();
    ParkingConfig config = smallConfig(1, 2);
    config.simulation.payment_success_probability = 0.0;
    ParkingEngine engine(config, store, clock.source());

    engine.injectVehicle(VehicleClass::Truck);
    clock.advance(std::chrono::minutes(90));
    REQUIRE(engine.exitVehicle("V000001") == ParkingEngine::Departure::PaymentFailed);

    std::vector<Vehicle> parked = engine.getParkedVehicles();
    REQUIRE(parked.size() == 1);
    REQUIRE_FALSE(parked[0].exit_time.has_value());
    REQUIRE(parked[0].payment_amount == Catch::Approx(0.0));
    REQUIRE(parked[0].space_id == SpaceId{1});

    SystemStatistics stats = engine.getStatistics();
    REQUIRE(stats.payment_failures == 1);
    REQUIRE(stats.total_exits == 0);
    REQUIRE(stats.total_revenue == Catch::Approx(0.0));

    std::vector<PaymentTransaction> transactions = store->getTransactions();
    REQUIRE(transactions.size() == 1);
    REQUIRE(transactions[0].status == TransactionStatus::Failed);
    REQUIRE(transactions[0].amount == Catch::Approx(9.00));

    std::vector<ParkingEvent> failures = store->getEvents(EventType::PaymentFailed);
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].severity == EventSeverity::Error);
}

TEST_CASE("Force release frees a space without billing", "[engine][admin]")
{
    ManualClock clock;
    auto store = std::make_shared<MemoryRecordStore>();
    ParkingEngine engine(smallConfig(1, 1), store, clock.source());

    engine.injectVehicle(VehicleClass::Car);
    engine.injectVehicle(VehicleClass::Suv);

    REQUIRE(engine.forceRelease(1));
    REQUIRE_FALSE(engine.forceRelease(99));

    std::vector<Vehicle> parked = engine.getParkedVehicles();
    REQUIRE(parked.size() == 1);
    REQUIRE(parked[0].id == "V000002");
    REQUIRE(engine.getQueuedVehicles().empty());
    REQUIRE(engine.getCompletedVehicles().empty());
    REQUIRE(engine.getStatistics().total_revenue == Catch::Approx(0.0));
    REQUIRE(store->getEvents(EventType::SpaceReleased).size() == 1);
    REQUIRE(store->getTransactions().empty());
}

TEST_CASE("Maintenance takes a space out of rotation", "[engine][admin]")
{
    ManualClock clock;
    ParkingEngine engine(smallConfig(1, 2), nullptr, clock.source());

    REQUIRE(engine.setSpaceMaintenance(1, true));
    REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked);
    REQUIRE(engine.getParkedVehicles()[0].space_id == SpaceId{2});
    REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Queued);

    REQUIRE(engine.setSpaceMaintenance(1, false));
    REQUIRE(engine.getQueuedVehicles().empty());
    REQUIRE(engine.getSystemStatus().occupied_spaces == 2);

    REQUIRE_FALSE(engine.setSpaceMaintenance(5, true));
    REQUIRE(engine.setSpaceReserved(2, true));
    REQUIRE(engine.getParkingGrid()[1].reserved);
}

TEST_CASE("Injected vehicles need a fresh id", "[engine][admin]")
{
    ManualClock clock;
    ParkingEngine engine(smallConfig(1, 2), nullptr, clock.source());

    Vehicle vehicle;
    vehicle.id = "CUSTOM-1";
    vehicle.plate_number = "AB123CD";
    vehicle.vehicle_class = VehicleClass::Suv;
    REQUIRE(engine.injectVehicle(vehicle) == ParkingEngine::Admission::Parked);
    REQUIRE(engine.injectVehicle(vehicle) == ParkingEngine::Admission::Rejected);

    Vehicle anonymous;
    REQUIRE(engine.injectVehicle(anonymous) == ParkingEngine::Admission::Rejected);
    REQUIRE(engine.getParkedVehicles().size() == 1);
    REQUIRE(engine.getParkedVehicles()[0].entry_time == clock.current);
}

TEST_CASE("Generated ids skip ids held by injected vehicles", "[engine][admin]")
{
    ManualClock clock;

    SECTION("parked")
    {
        ParkingEngine engine(smallConfig(1, 2), nullptr, clock.source());

        Vehicle early;
        early.id = "V000002";
        early.plate_number = "QQ000002";
        REQUIRE(engine.injectVehicle(early) == ParkingEngine::Admission::Parked);
        REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked); // V000001

        clock.advance(std::chrono::minutes(60));
        REQUIRE(engine.exitVehicle("V000001") == ParkingEngine::Departure::Departed);
        REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked);

        REQUIRE(ids(engine.getParkedVehicles()) == std::vector<std::string>{"V000002", "V000003"});
        REQUIRE(engine.getSystemStatus().occupied_spaces == 2);
        REQUIRE(engine.getStatistics().total_entries == 3);
        requireGridConsistent(engine);

        REQUIRE(engine.exitVehicle("V000003") == ParkingEngine::Departure::Departed);
        REQUIRE(engine.exitVehicle("V000002") == ParkingEngine::Departure::Departed);
        REQUIRE(engine.getSystemStatus().occupied_spaces == 0);
        requireGridConsistent(engine);
    }

    SECTION("queued")
    {
        ParkingEngine engine(smallConfig(1, 1), nullptr, clock.source());

        REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked); // V000001
        Vehicle waiting;
        waiting.id = "V000002";
        REQUIRE(engine.injectVehicle(waiting) == ParkingEngine::Admission::Queued);
        REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Queued);

        REQUIRE(ids(engine.getQueuedVehicles()) == std::vector<std::string>{"V000002", "V000003"});
        REQUIRE(engine.injectVehicle(waiting) == ParkingEngine::Admission::Rejected);
        requireGridConsistent(engine);
    }
}

TEST_CASE("An id is free again once its vehicle has left", "[engine][admin]")
{
    ManualClock clock;
    ParkingEngine engine(smallConfig(1, 2), nullptr, clock.source());

    Vehicle visitor;
    visitor.id = "GUEST";
    visitor.vehicle_class = VehicleClass::Truck;
    REQUIRE(engine.injectVehicle(visitor) == ParkingEngine::Admission::Parked);
    clock.advance(std::chrono::minutes(90));
    REQUIRE(engine.exitVehicle("GUEST") == ParkingEngine::Departure::Departed);

    clock.advance(std::chrono::minutes(30));
    REQUIRE(engine.injectVehicle(visitor) == ParkingEngine::Admission::Parked);
    std::vector<Vehicle> parked = engine.getParkedVehicles();
    REQUIRE(parked.size() == 1);
    REQUIRE(parked[0].entry_time == clock.current);
    REQUIRE_FALSE(parked[0].exit_time.has_value());

    std::vector<Vehicle> completed = engine.getCompletedVehicles();
    REQUIRE(completed.size() == 1);
    REQUIRE(completed[0].payment_amount == Catch::Approx(9.00));
    requireGridConsistent(engine);
}

TEST_CASE("Oldest-first exit picks the longest stay", "[engine]")
{
    ManualClock clock;
    ParkingConfig config = smallConfig(1, 4);
    config.simulation.exit_selection = ExitSelectionPolicy::OldestFirst;
    ParkingEngine engine(config, nullptr, clock.source());

    engine.injectVehicle(VehicleClass::Car);
    clock.advance(std::chrono::minutes(5));
    engine.injectVehicle(VehicleClass::Car);
    clock.advance(std::chrono::minutes(5));
    engine.injectVehicle(VehicleClass::Car);

    REQUIRE(engine.vehicleExit());
    REQUIRE(engine.getCompletedVehicles()[0].id == "V000001");
    REQUIRE(engine.vehicleExit());
    REQUIRE(engine.getCompletedVehicles()[1].id == "V000002");
}

TEST_CASE("vehicleExit on an empty lot does nothing", "[engine]")
{
    ManualClock clock;
    ParkingEngine engine(smallConfig(1, 2), nullptr, clock.source());
    REQUIRE_FALSE(engine.vehicleExit());
    REQUIRE(engine.getStatistics().total_exits == 0);
}

TEST_CASE("Random ticks never break grid invariants", "[engine][invariant]")
{
    ManualClock clock;
    ParkingConfig config = smallConfig(2, 5, {1, 1});
    config.simulation.entry_rate = 2400.0; // p = 0.67 per 1 s tick
    config.simulation.exit_rate = 1200.0;
    config.simulation.payment_success_probability = 0.9;
    ParkingEngine engine(config, nullptr, clock.source());

    for (int i = 0; i < 400; ++i)
    {
        engine.tick();
        clock.advance(std::chrono::minutes(1));
        if (i % 20 == 0)
        {
            requireGridConsistent(engine);
        }
    }
    requireGridConsistent(engine);

    SystemStatistics stats = engine.getStatistics();
    REQUIRE(stats.total_entries > 0);
    REQUIRE(stats.total_exits > 0);
    REQUIRE(stats.total_exits <= stats.total_entries);
    REQUIRE(stats.total_revenue >= 3.0 * static_cast<double>(stats.total_exits) * 0.66);
}

TEST_CASE("Same seed and clock give the same event history", "[engine][determinism]")
{
    auto run = []()
    {
        ManualClock clock(8);
        auto store = std::make_shared<MemoryRecordStore>();
        ParkingConfig config = smallConfig(2, 4, {1, 1});
        config.simulation.entry_rate = 1800.0;
        config.simulation.exit_rate = 1200.0;
        config.simulation.random_seed = 2024;
        ParkingEngine engine(config, store, clock.source());
        for (int i = 0; i < 200; ++i)
        {
            engine.tick();
            clock.advance(std::chrono::minutes(2));
        }
        return store->getEvents();
    };

    std::vector<ParkingEvent> first = run();
    std::vector<ParkingEvent> second = run();

    REQUIRE_FALSE(first.empty());
    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        REQUIRE(first[i].type == second[i].type);
        REQUIRE(first[i].vehicle_plate == second[i].vehicle_plate);
        REQUIRE(first[i].space_id == second[i].space_id);
        REQUIRE(first[i].timestamp == second[i].timestamp);
    }
}

TEST_CASE("Recent events are bounded", "[engine]")
{
    ManualClock clock;
    ParkingConfig config = smallConfig(1, 1);
    config.simulation.recent_event_capacity = 5;
    ParkingEngine engine(config, nullptr, clock.source());

    for (int i = 0; i < 12; ++i)
        engine.injectVehicle(VehicleClass::Car);

    std::vector<ParkingEvent> recent = engine.getRecentEvents();
    REQUIRE(recent.size() == 5);
    REQUIRE(recent.back().type == EventType::VehicleQueued);
}

TEST_CASE("Completed vehicle history is bounded", "[engine]")
{
    ManualClock clock;
    ParkingConfig config = smallConfig(1, 1);
    config.simulation.completed_vehicle_capacity = 3;
    ParkingEngine engine(config, nullptr, clock.source());

    for (const char *id : {"V000001", "V000002", "V000003", "V000004", "V000005"})
    {
        REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked);
        clock.advance(std::chrono::minutes(60));
        REQUIRE(engine.exitVehicle(id) == ParkingEngine::Departure::Departed);
    }

    REQUIRE(ids(engine.getCompletedVehicles()) == std::vector<std::string>{"V000003", "V000004", "V000005"});
    SystemStatistics stats = engine.getStatistics();
    REQUIRE(stats.total_exits == 5);
    REQUIRE(stats.total_revenue == Catch::Approx(15.00));
    REQUIRE(stats.average_stay_hours == Catch::Approx(1.0));
}

TEST_CASE("Stop is prompt and idempotent", "[engine][lifecycle]")
{
    auto store = std::make_shared<MemoryRecordStore>();
    ParkingConfig config = smallConfig(1, 4);
    config.simulation.tick_interval_ms = 60000;
    ParkingEngine engine(config, store);

    engine.start();
    REQUIRE(engine.isRunning());
    REQUIRE(engine.getState() == ParkingEngine::State::Running);
    engine.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto before = std::chrono::steady_clock::now();
    engine.stop();
    const auto waited = std::chrono::steady_clock::now() - before;
    REQUIRE(waited < std::chrono::seconds(2));
    REQUIRE_FALSE(engine.isRunning());

    engine.stop();
    REQUIRE(store->getEvents(EventType::SimulationStart).size() == 1);
    REQUIRE(store->getEvents(EventType::SimulationStop).size() == 1);

    const std::size_t events_after_stop = store->getEvents().size();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(store->getEvents().size() == events_after_stop);
}

TEST_CASE("Reset is refused while running and clears state when stopped", "[engine][lifecycle]")
{
    ManualClock clock;
    ParkingConfig config = smallConfig(1, 1);
    config.simulation.tick_interval_ms = 60000;
    ParkingEngine engine(config, nullptr, clock.source());

    engine.injectVehicle(VehicleClass::Car);
    engine.injectVehicle(VehicleClass::Car);

    REQUIRE(engine.handleCommand(ParkingEngine::EngineCommand::Start));
    REQUIRE_FALSE(engine.handleCommand(ParkingEngine::EngineCommand::Reset));
    REQUIRE(engine.handleCommand(ParkingEngine::EngineCommand::Stop));

    REQUIRE(engine.handleCommand(ParkingEngine::EngineCommand::Reset));
    SystemStatus status = engine.getSystemStatus();
    REQUIRE(status.occupied_spaces == 0);
    REQUIRE(status.queue_length == 0);
    REQUIRE(status.statistics.total_entries == 0);
    REQUIRE(engine.getRecentEvents().empty());

    REQUIRE(engine.injectVehicle(VehicleClass::Car) == ParkingEngine::Admission::Parked);
    REQUIRE(engine.getParkedVehicles()[0].id == "V000001");
}

TEST_CASE("Paused engine keeps its state", "[engine][lifecycle]")
{
    ManualClock clock;
    ParkingConfig config = smallConfig(1, 4);
    config.simulation.entry_rate = 3600000.0;
    config.simulation.tick_interval_ms = 5;
    ParkingEngine engine(config, nullptr, clock.source());

    engine.pause();
    engine.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(engine.getSystemStatus().paused);
    REQUIRE(engine.getStatistics().total_entries == 0);

    engine.resume();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    engine.stop();
    REQUIRE(engine.getStatistics().total_entries > 0);
}
