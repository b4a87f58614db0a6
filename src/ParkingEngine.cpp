#include "ParkingEngine.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <utility>

namespace autopark
{
    namespace
    {
        constexpr std::array<PaymentMethod, 5> kPaymentMethods = {
            PaymentMethod::Cash,
            PaymentMethod::CreditCard,
            PaymentMethod::DebitCard,
            PaymentMethod::MobilePay,
            PaymentMethod::RfidCard};

        uint32_t seedFor(const SimulationConfig &sim)
        {
            if (sim.random_seed.has_value())
            {
                return *sim.random_seed;
            }
            std::random_device device;
            return device();
        }

        std::string formatAmount(double amount)
        {
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%.2f", amount);
            return buffer;
        }
    }

    ParkingEngine::ParkingEngine(const ParkingConfig &config,
                                 std::shared_ptr<IRecordStore> record_store,
                                 TimeSource time_source)
        : config(config),
          record_store(std::move(record_store)),
          time_source(std::move(time_source)),
          fees(config.hourly_rates),
          rates(config.simulation)
    {
        requireValidConfig(this->config);
        grid.initialize(this->config.grid.levels, this->config.grid.spaces_per_level, this->config.grid.class_rules);
        rng.seed(seedFor(this->config.simulation));

        if (!this->record_store)
        {
            this->record_store = std::make_shared<NullRecordStore>();
        }
        updateStatisticsLocked();
    }

    ParkingEngine::~ParkingEngine()
    {
        stop();
    }

    void ParkingEngine::start()
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
        if (running)
        {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(loop_mutex);
            stop_requested = false;
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            emitLocked(EventType::SimulationStart, EventSeverity::Info, nullptr, std::nullopt, std::nullopt,
                       "Parking simulation started", now());
        }

        running = true;
        loop_thread = std::thread(&ParkingEngine::runLoop, this);
    }

    void ParkingEngine::stop()
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
        if (!running)
        {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(loop_mutex);
            stop_requested = true;
        }
        loop_cv.notify_all();

        if (loop_thread.joinable())
        {
            loop_thread.join();
        }
        running = false;

        std::lock_guard<std::mutex> lock(state_mutex);
        emitLocked(EventType::SimulationStop, EventSeverity::Info, nullptr, std::nullopt, std::nullopt,
                   "Parking simulation stopped", now());
    }

    ParkingEngine::State ParkingEngine::getState() const
    {
        return running ? State::Running : State::Stopped;
    }

    bool ParkingEngine::isRunning() const
    {
        return running;
    }

    void ParkingEngine::pause()
    {
        paused = true;
    }

    void ParkingEngine::resume()
    {
        paused = false;
    }

    bool ParkingEngine::isPaused() const
    {
        return paused;
    }

    void ParkingEngine::runLoop()
    {
        const auto interval = std::chrono::milliseconds(config.simulation.tick_interval_ms);

        std::unique_lock<std::mutex> lock(loop_mutex);
        while (!stop_requested)
        {
            lock.unlock();
            if (!paused)
            {
                tick();
            }
            lock.lock();

            loop_cv.wait_for(lock, interval, [this]()
                             { return stop_requested; });
        }
    }

    void ParkingEngine::tick()
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        tickLocked(now());
    }

    void ParkingEngine::tickLocked(TimePoint now)
    {
        const double tick_seconds = static_cast<double>(config.simulation.tick_interval_ms) / 1000.0;
        std::uniform_real_distribution<double> unit(0.0, 1.0);

        // Entry is always evaluated before exit within one tick
        const double entry_draw = unit(rng);
        if (entry_draw < rates.entryProbability(now, tick_seconds))
        {
            admitLocked(generateVehicleLocked(now), now);
        }

        const double exit_draw = unit(rng);
        if (exit_draw < rates.exitProbability(now, tick_seconds))
        {
            if (const Vehicle *candidate = selectExitCandidateLocked())
            {
                const std::string vehicle_id = candidate->id;
                departLocked(vehicle_id, now);
            }
        }

        updateStatisticsLocked();
    }

    bool ParkingEngine::handleCommand(EngineCommand command)
    {
        switch (command)
        {
        case EngineCommand::Start:
            start();
            return true;
        case EngineCommand::Stop:
            stop();
            return true;
        case EngineCommand::Pause:
            pause();
            return true;
        case EngineCommand::Resume:
            resume();
            return true;
        case EngineCommand::Step:
            tick();
            return true;
        case EngineCommand::Reset:
            return reset();
        }
        return false;
    }

    bool ParkingEngine::reset()
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
        if (running)
        {
            return false;
        }

        std::lock_guard<std::mutex> lock(state_mutex);
        grid.releaseAll();
        queue.clear();
        parked.clear();
        completed.clear();
        recent_events.clear();
        statistics = SystemStatistics{};
        total_stay_hours = 0.0;
        next_transaction_number = 1;
        factory.reset();
        rng.seed(seedFor(config.simulation));
        paused = false;
        updateStatisticsLocked();
        return true;
    }

    bool ParkingEngine::vehicleEntry()
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        const TimePoint current = now();
        const Admission admission = admitLocked(generateVehicleLocked(current), current);
        updateStatisticsLocked();
        return admission == Admission::Parked;
    }

    bool ParkingEngine::vehicleExit()
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        const Vehicle *candidate = selectExitCandidateLocked();
        if (!candidate)
        {
            return false;
        }

        const std::string vehicle_id = candidate->id;
        const Departure departure = departLocked(vehicle_id, now());
        updateStatisticsLocked();
        return departure == Departure::Departed;
    }

    ParkingEngine::Admission ParkingEngine::injectVehicle(Vehicle vehicle)
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (vehicle.id.empty())
        {
            return Admission::Rejected;
        }

        const TimePoint current = now();
        vehicle.entry_time = current;
        vehicle.exit_time.reset();
        vehicle.space_id.reset();
        const Admission admission = admitLocked(std::move(vehicle), current);
        updateStatisticsLocked();
        return admission;
    }

    ParkingEngine::Admission ParkingEngine::injectVehicle(VehicleClass vehicle_class)
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        const TimePoint current = now();
        const Admission admission = admitLocked(generateVehicleLocked(current, vehicle_class), current);
        updateStatisticsLocked();
        return admission;
    }

    ParkingEngine::Departure ParkingEngine::exitVehicle(const std::string &vehicle_id)
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        const Departure departure = departLocked(vehicle_id, now());
        updateStatisticsLocked();
        return departure;
    }

    bool ParkingEngine::forceRelease(SpaceId space_id)
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        const std::optional<ParkingSpace> space = grid.getSpace(space_id);
        if (!space || !space->occupied)
        {
            return false;
        }

        const TimePoint current = now();
        if (!grid.release(space_id))
        {
            return false;
        }

        auto it = parked.find(space->vehicle_id);
        if (it != parked.end())
        {
            Vehicle released = std::move(it->second);
            parked.erase(it);
            released.exit_time = current;
            released.payment_amount = 0.0;
            released.payment_method = PaymentMethod::None;
            storeVehicleLocked(released);
            emitLocked(EventType::SpaceReleased, EventSeverity::Warning, &released, space_id, std::nullopt,
                       "Space " + std::to_string(space_id) + " force-released, vehicle " + released.plate_number + " removed",
                       current);
        }
        else
        {
            std::cerr << "parking engine: space " << space_id << " was bound to unknown vehicle "
                      << space->vehicle_id << "\n";
            emitLocked(EventType::SpaceReleased, EventSeverity::Warning, nullptr, space_id, std::nullopt,
                       "Space " + std::to_string(space_id) + " force-released", current);
        }

        drainQueueLocked(current);
        updateStatisticsLocked();
        return true;
    }

    bool ParkingEngine::setSpaceMaintenance(SpaceId space_id, bool maintenance)
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!grid.setMaintenance(space_id, maintenance))
        {
            return false;
        }
        if (!maintenance)
        {
            drainQueueLocked(now());
        }
        updateStatisticsLocked();
        return true;
    }

    bool ParkingEngine::setSpaceReserved(SpaceId space_id, bool reserved)
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!grid.setReserved(space_id, reserved))
        {
            return false;
        }
        if (!reserved)
        {
            drainQueueLocked(now());
        }
        updateStatisticsLocked();
        return true;
    }

    Vehicle ParkingEngine::generateVehicleLocked(TimePoint now, std::optional<VehicleClass> vehicle_class)
    {
        Vehicle vehicle = vehicle_class ? factory.generate(rng, now, *vehicle_class) : factory.generate(rng, now);
        while (isKnownVehicleLocked(vehicle.id))
        {
            vehicle.id = factory.nextVehicleId();
        }
        return vehicle;
    }

    ParkingEngine::Admission ParkingEngine::admitLocked(Vehicle vehicle, TimePoint now)
    {
        if (isKnownVehicleLocked(vehicle.id))
        {
            return Admission::Rejected;
        }

        if (grid.occupiedCount() < grid.totalSpaces())
        {
            if (std::optional<SpaceId> space_id = claimSpaceLocked(vehicle))
            {
                vehicle.space_id = *space_id;
                const std::string id = vehicle.id;
                auto inserted = parked.emplace(id, std::move(vehicle));
                if (!inserted.second)
                {
                    const bool released = grid.release(*space_id);
                    std::cerr << "parking engine: vehicle " << id << " is already parked, space "
                              << *space_id << (released ? " released\n" : " was already free\n");
                    return Admission::Rejected;
                }

                const Vehicle &entered = inserted.first->second;
                statistics.total_entries++;
                storeVehicleLocked(entered);
                emitLocked(EventType::VehicleEntry, EventSeverity::Info, &entered, *space_id, std::nullopt,
                           "Vehicle " + entered.plate_number + " entered - Space " + std::to_string(*space_id),
                           now);
                if (config.simulation.log_vehicle_events)
                {
                    std::cout << "Vehicle entry: " << entered.plate_number << " -> Space " << *space_id << std::endl;
                }
                return Admission::Parked;
            }
        }

        statistics.total_queued++;
        emitLocked(EventType::VehicleQueued, EventSeverity::Warning, &vehicle, std::nullopt, std::nullopt,
                   "Vehicle " + vehicle.plate_number + " added to waiting queue", now);
        if (config.simulation.log_vehicle_events)
        {
            std::cout << "Vehicle queued: " << vehicle.plate_number << " (" << toString(vehicle.vehicle_class) << ")" << std::endl;
        }
        queue.enqueue(std::move(vehicle));
        return Admission::Queued;
    }

    // A space found by the scan can still be lost to a concurrent writer before
    // allocate() runs; one fresh scan is attempted before giving up.
    std::optional<SpaceId> ParkingEngine::claimSpaceLocked(const Vehicle &vehicle)
    {
        for (int attempt = 0; attempt < 2; ++attempt)
        {
            std::optional<SpaceId> candidate = grid.findCompatible(vehicle.vehicle_class);
            if (!candidate)
            {
                return std::nullopt;
            }
            if (grid.allocate(*candidate, vehicle.id))
            {
                return candidate;
            }
        }
        return std::nullopt;
    }

    const Vehicle *ParkingEngine::selectExitCandidateLocked()
    {
        if (parked.empty())
        {
            return nullptr;
        }

        if (config.simulation.exit_selection == ExitSelectionPolicy::OldestFirst)
        {
            auto oldest = std::min_element(parked.begin(), parked.end(),
                                           [](const auto &a, const auto &b)
                                           { return a.second.entry_time < b.second.entry_time; });
            return &oldest->second;
        }

        std::uniform_int_distribution<std::size_t> pick(0, parked.size() - 1);
        auto it = parked.begin();
        std::advance(it, static_cast<std::ptrdiff_t>(pick(rng)));
        return &it->second;
    }

    ParkingEngine::Departure ParkingEngine::departLocked(const std::string &vehicle_id, TimePoint now)
    {
        auto it = parked.find(vehicle_id);
        if (it == parked.end())
        {
            return Departure::NotParked;
        }

        Vehicle &vehicle = it->second;
        if (!settlePaymentLocked(vehicle, now))
        {
            return Departure::PaymentFailed;
        }

        const SpaceId space_id = *vehicle.space_id;
        if (!grid.release(space_id))
        {
            std::cerr << "parking engine: space " << space_id << " was already free when "
                      << vehicle.plate_number << " left\n";
        }

        statistics.total_exits++;
        statistics.total_revenue += vehicle.payment_amount;
        total_stay_hours += vehicle.stayHours();

        Vehicle departed = std::move(vehicle);
        parked.erase(it);

        storeVehicleLocked(departed);
        emitLocked(EventType::VehicleExit, EventSeverity::Info, &departed, space_id, departed.payment_amount,
                   "Vehicle " + departed.plate_number + " exited - Payment: $" + formatAmount(departed.payment_amount),
                   now);
        if (config.simulation.log_vehicle_events)
        {
            std::cout << "Vehicle exit: " << departed.plate_number << " - Payment: $"
                      << formatAmount(departed.payment_amount) << std::endl;
        }
        completed.push_back(std::move(departed));
        while (completed.size() > config.simulation.completed_vehicle_capacity)
        {
            completed.pop_front();
        }

        drainQueueLocked(now);
        return Departure::Departed;
    }

    // On failure the vehicle is left exactly as it was: parked, no exit time, no fee.
    bool ParkingEngine::settlePaymentLocked(Vehicle &vehicle, TimePoint now)
    {
        const TimePoint exit_time = std::max(now, vehicle.entry_time);
        const double amount = fees.calculate(vehicle.vehicle_class, vehicle.entry_time, exit_time);

        std::uniform_int_distribution<std::size_t> method_pick(0, kPaymentMethods.size() - 1);
        const PaymentMethod method = kPaymentMethods[method_pick(rng)];

        std::uniform_real_distribution<double> unit(0.0, 1.0);
        const bool paid = unit(rng) < config.simulation.payment_success_probability;

        PaymentTransaction transaction;
        transaction.transaction_id = nextTransactionIdLocked();
        transaction.vehicle_id = vehicle.id;
        transaction.amount = amount;
        transaction.payment_method = method;
        transaction.timestamp = now;
        transaction.status = paid ? TransactionStatus::Completed : TransactionStatus::Failed;

        std::string error;
        if (!record_store->recordTransaction(transaction, &error))
        {
            std::cerr << "parking engine: failed to record transaction " << transaction.transaction_id
                      << ": " << error << "\n";
        }

        if (!paid)
        {
            statistics.payment_failures++;
            emitLocked(EventType::PaymentFailed, EventSeverity::Error, &vehicle, vehicle.space_id, amount,
                       "Payment failed for vehicle " + vehicle.plate_number, now);
            return false;
        }

        vehicle.exit_time = exit_time;
        vehicle.payment_amount = amount;
        vehicle.payment_method = method;
        return true;
    }

    void ParkingEngine::drainQueueLocked(TimePoint now)
    {
        if (queue.empty())
        {
            return;
        }

        std::optional<SpaceId> claimed;
        std::optional<Vehicle> next;

        if (config.simulation.queue_drain_policy == QueueDrainPolicy::HeadOnly)
        {
            claimed = claimSpaceLocked(*queue.peek());
            if (claimed)
            {
                next = queue.dequeue();
            }
        }
        else
        {
            const std::string head_id = queue.peek()->id;
            next = queue.takeFirstMatching([&](const Vehicle &candidate)
                                           {
                                               claimed = claimSpaceLocked(candidate);
                                               return claimed.has_value(); });
            if (next && next->id != head_id)
            {
                reportStarvationLocked(queue.recordHeadMiss(), now);
            }
        }

        if (!next || !claimed)
        {
            reportStarvationLocked(queue.recordHeadMiss(), now);
            return;
        }

        placeFromQueueLocked(std::move(*next), *claimed, now);
    }

    // entry_time stays at the arrival time; the fee covers the wait in the queue
    void ParkingEngine::placeFromQueueLocked(Vehicle vehicle, SpaceId space_id, TimePoint now)
    {
        vehicle.space_id = space_id;
        const std::string id = vehicle.id;
        auto inserted = parked.emplace(id, std::move(vehicle));
        if (!inserted.second)
        {
            const bool released = grid.release(space_id);
            std::cerr << "parking engine: queued vehicle " << id << " is already parked, space "
                      << space_id << (released ? " released\n" : " was already free\n");
            return;
        }

        const Vehicle &placed = inserted.first->second;
        statistics.total_entries++;
        storeVehicleLocked(placed);
        emitLocked(EventType::VehicleFromQueue, EventSeverity::Info, &placed, space_id, std::nullopt,
                   "Vehicle " + placed.plate_number + " moved from queue to space " + std::to_string(space_id),
                   now);
        if (config.simulation.log_vehicle_events)
        {
            std::cout << "Vehicle from queue: " << placed.plate_number << " -> Space " << space_id << std::endl;
        }
    }

    void ParkingEngine::reportStarvationLocked(uint32_t misses, TimePoint now)
    {
        const uint32_t threshold = config.simulation.starvation_threshold;
        if (threshold == 0 || misses == 0 || misses % threshold != 0)
        {
            return;
        }

        const Vehicle *head = queue.peek();
        if (!head)
        {
            return;
        }

        std::cerr << "parking engine: queue head " << head->plate_number << " (" << toString(head->vehicle_class)
                  << ") unplaced after " << misses << " free events\n";
        emitLocked(EventType::QueueStarvation, EventSeverity::Warning, head, std::nullopt, std::nullopt,
                   "Queue head " + head->plate_number + " could not be placed after " + std::to_string(misses) + " free events",
                   now);
    }

    void ParkingEngine::emitLocked(EventType type, EventSeverity severity, const Vehicle *vehicle,
                                   std::optional<SpaceId> space_id, std::optional<double> amount,
                                   std::string description, TimePoint now)
    {
        ParkingEvent event;
        event.type = type;
        event.timestamp = now;
        event.vehicle_plate = vehicle ? vehicle->plate_number : "";
        event.space_id = space_id;
        event.amount = amount;
        event.severity = severity;
        event.description = std::move(description);

        std::string error;
        if (!record_store->append(event, &error))
        {
            std::cerr << "parking engine: failed to record " << toString(type) << " event: " << error << "\n";
        }

        recent_events.push_back(std::move(event));
        while (recent_events.size() > config.simulation.recent_event_capacity)
        {
            recent_events.pop_front();
        }
    }

    void ParkingEngine::storeVehicleLocked(const Vehicle &vehicle)
    {
        std::string error;
        if (!record_store->recordVehicle(vehicle, &error))
        {
            std::cerr << "parking engine: failed to record vehicle " << vehicle.id << ": " << error << "\n";
        }
    }

    void ParkingEngine::updateStatisticsLocked()
    {
        const std::size_t total = grid.totalSpaces();
        statistics.occupancy_rate = total == 0 ? 0.0 : static_cast<double>(grid.occupiedCount()) / static_cast<double>(total);
        statistics.average_stay_hours = statistics.total_exits == 0
                                            ? 0.0
                                            : total_stay_hours / static_cast<double>(statistics.total_exits);
    }

    std::string ParkingEngine::nextTransactionIdLocked()
    {
        char buffer[24];
        std::snprintf(buffer, sizeof(buffer), "T%08llu", static_cast<unsigned long long>(next_transaction_number));
        next_transaction_number++;
        return buffer;
    }

    bool ParkingEngine::isKnownVehicleLocked(const std::string &vehicle_id) const
    {
        return parked.count(vehicle_id) > 0 || queue.contains(vehicle_id);
    }

    SystemStatus ParkingEngine::getSystemStatus() const
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        const TimePoint current = now();

        SystemStatus status;
        status.timestamp = current;
        status.total_spaces = grid.totalSpaces();
        status.occupied_spaces = grid.occupiedCount();
        status.available_spaces = status.total_spaces - status.occupied_spaces;
        status.queue_length = queue.len();
        status.statistics = statistics;
        status.is_peak_hour = rates.isPeakHour(current);
        status.entry_rate = rates.effectiveEntryRate(current);
        status.exit_rate = rates.effectiveExitRate(current);
        status.running = running;
        status.paused = paused;
        return status;
    }

    SystemStatistics ParkingEngine::getStatistics() const
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        return statistics;
    }

    std::vector<GridCell> ParkingEngine::getParkingGrid() const
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        std::vector<ParkingSpace> spaces = grid.snapshot();

        std::vector<GridCell> cells;
        cells.reserve(spaces.size());
        for (const auto &space : spaces)
        {
            GridCell cell;
            cell.space_id = space.id;
            cell.level = space.level;
            cell.position = space.position;
            cell.space_class = space.space_class;
            cell.occupied = space.occupied;
            cell.maintenance = space.maintenance;
            cell.reserved = space.reserved;

            if (space.occupied)
            {
                auto it = parked.find(space.vehicle_id);
                if (it != parked.end())
                {
                    const Vehicle &vehicle = it->second;
                    cell.vehicle = GridVehicle{vehicle.id, vehicle.plate_number, vehicle.vehicle_class, vehicle.entry_time};
                }
            }
            cells.push_back(std::move(cell));
        }
        return cells;
    }

    std::vector<ParkingEvent> ParkingEngine::getRecentEvents() const
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        return std::vector<ParkingEvent>(recent_events.begin(), recent_events.end());
    }

    std::vector<Vehicle> ParkingEngine::getParkedVehicles() const
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        std::vector<Vehicle> vehicles;
        vehicles.reserve(parked.size());
        for (const auto &entry : parked)
        {
            vehicles.push_back(entry.second);
        }
        return vehicles;
    }

    std::vector<Vehicle> ParkingEngine::getQueuedVehicles() const
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        return queue.snapshot();
    }

    std::vector<Vehicle> ParkingEngine::getCompletedVehicles() const
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        return std::vector<Vehicle>(completed.begin(), completed.end());
    }

    const ParkingConfig &ParkingEngine::getConfig() const
    {
        return config;
    }

    TimePoint ParkingEngine::now() const
    {
        return time_source ? time_source() : Clock::now();
    }
} // namespace autopark
