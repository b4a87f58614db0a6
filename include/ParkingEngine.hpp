#pragma once

#include "FeeCalculator.hpp"
#include "ParkingConfig.hpp"
#include "ParkingEvents.hpp"
#include "RateModel.hpp"
#include "RecordStore.hpp"
#include "SpaceGrid.hpp"
#include "VehicleFactory.hpp"
#include "WaitQueue.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace autopark
{
    struct SystemStatistics
    {
        std::size_t total_entries = 0;
        std::size_t total_exits = 0;
        double total_revenue = 0.0;
        double average_stay_hours = 0.0;
        double occupancy_rate = 0.0; // occupied / total, 0..1
        std::size_t payment_failures = 0;
        std::size_t total_queued = 0;
    };

    struct SystemStatus
    {
        TimePoint timestamp{};
        std::size_t total_spaces = 0;
        std::size_t occupied_spaces = 0;
        std::size_t available_spaces = 0;
        std::size_t queue_length = 0;
        SystemStatistics statistics;
        bool is_peak_hour = false;
        double entry_rate = 0.0;
        double exit_rate = 0.0;
        bool running = false;
        bool paused = false;
    };

    struct GridVehicle
    {
        std::string id;
        std::string plate_number;
        VehicleClass vehicle_class = VehicleClass::Car;
        TimePoint entry_time{};
    };

    struct GridCell
    {
        SpaceId space_id = 0;
        uint16_t level = 0;
        uint16_t position = 0;
        SpaceClass space_class = SpaceClass::Standard;
        bool occupied = false;
        bool maintenance = false;
        bool reserved = false;
        std::optional<GridVehicle> vehicle;
    };

    class ParkingEngine
    {
    public:
        enum class State
        {
            Stopped,
            Running
        };

        enum class Admission
        {
            Parked,
            Queued,
            Rejected // empty or duplicate vehicle id
        };

        enum class Departure
        {
            Departed,
            NotParked,
            PaymentFailed // vehicle stays parked
        };

        enum class EngineCommand
        {
            Start,
            Stop,
            Pause,
            Resume,
            Step,
            Reset
        };

        using TimeSource = std::function<TimePoint()>;

        // Throws ConfigError when config is invalid. A null store discards records,
        // a null time source reads the system clock.
        explicit ParkingEngine(const ParkingConfig &config,
                               std::shared_ptr<IRecordStore> record_store = nullptr,
                               TimeSource time_source = nullptr);
        ~ParkingEngine();

        ParkingEngine(const ParkingEngine &) = delete;
        ParkingEngine &operator=(const ParkingEngine &) = delete;

        // STOPPED -> RUNNING; spawns the tick loop
        void start();
        // RUNNING -> STOPPED; joins the loop. Idempotent. No mutation happens after it returns.
        void stop();
        State getState() const;
        bool isRunning() const;

        void pause();
        void resume();
        bool isPaused() const;

        // One simulation step at the current time
        void tick();
        // False for Reset while running
        bool handleCommand(EngineCommand command);
        // Clears occupancy, queue, vehicles and statistics. Only while stopped.
        bool reset();

        bool vehicleEntry();
        bool vehicleExit();

        // vehicle.id must be non-empty and not already parked or queued
        Admission injectVehicle(Vehicle vehicle);
        Admission injectVehicle(VehicleClass vehicle_class);
        Departure exitVehicle(const std::string &vehicle_id);
        bool forceRelease(SpaceId space_id);
        bool setSpaceMaintenance(SpaceId space_id, bool maintenance);
        bool setSpaceReserved(SpaceId space_id, bool reserved);

        SystemStatus getSystemStatus() const;
        SystemStatistics getStatistics() const;
        std::vector<GridCell> getParkingGrid() const;
        std::vector<ParkingEvent> getRecentEvents() const;
        std::vector<Vehicle> getParkedVehicles() const;
        std::vector<Vehicle> getQueuedVehicles() const;
        std::vector<Vehicle> getCompletedVehicles() const;
        const ParkingConfig &getConfig() const;

    private:
        // The *Locked helpers expect state_mutex to be held by the caller
        void tickLocked(TimePoint now);
        // Factory vehicle whose id is not held by a parked or queued vehicle
        Vehicle generateVehicleLocked(TimePoint now, std::optional<VehicleClass> vehicle_class = std::nullopt);
        Admission admitLocked(Vehicle vehicle, TimePoint now);
        std::optional<SpaceId> claimSpaceLocked(const Vehicle &vehicle);
        const Vehicle *selectExitCandidateLocked();
        Departure departLocked(const std::string &vehicle_id, TimePoint now);
        bool settlePaymentLocked(Vehicle &vehicle, TimePoint now);
        void drainQueueLocked(TimePoint now);
        void placeFromQueueLocked(Vehicle vehicle, SpaceId space_id, TimePoint now);
        void reportStarvationLocked(uint32_t misses, TimePoint now);
        void emitLocked(EventType type, EventSeverity severity, const Vehicle *vehicle,
                        std::optional<SpaceId> space_id, std::optional<double> amount,
                        std::string description, TimePoint now);
        void storeVehicleLocked(const Vehicle &vehicle);
        void updateStatisticsLocked();
        std::string nextTransactionIdLocked();
        bool isKnownVehicleLocked(const std::string &vehicle_id) const;

        void runLoop();
        TimePoint now() const;

        ParkingConfig config;
        std::shared_ptr<IRecordStore> record_store;
        TimeSource time_source;

        SpaceGrid grid;
        WaitQueue queue;
        FeeCalculator fees;
        RateModel rates;
        VehicleFactory factory;
        std::mt19937 rng;

        std::map<std::string, Vehicle> parked; // keyed by vehicle id
        std::deque<Vehicle> completed;         // most recent paid exits
        std::deque<ParkingEvent> recent_events;
        SystemStatistics statistics;
        double total_stay_hours = 0.0;
        uint64_t next_transaction_number = 1;

        mutable std::mutex state_mutex;

        std::mutex lifecycle_mutex;
        std::mutex loop_mutex;
        std::condition_variable loop_cv;
        bool stop_requested = false; // guarded by loop_mutex
        std::atomic<bool> running{false};
        std::atomic<bool> paused{false};
        std::thread loop_thread;
    };

} // namespace autopark
