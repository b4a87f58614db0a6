#pragma once

#include "RecordStore.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autopark::db
{

    class SqliteRecordStore : public IRecordStore
    {
    public:
        explicit SqliteRecordStore(std::string file_path);

        bool initialize(std::string *error = nullptr) const;

        bool append(const ParkingEvent &event, std::string *error = nullptr) override;
        bool recordVehicle(const Vehicle &vehicle, std::string *error = nullptr) override;
        bool recordTransaction(const PaymentTransaction &transaction, std::string *error = nullptr) override;

        // Newest first; an empty event_type matches every type
        std::vector<ParkingEvent> loadRecentEvents(std::size_t limit, const std::string &event_type = "", std::string *error = nullptr) const;
        std::optional<Vehicle> loadVehicle(const std::string &vehicle_id, std::string *error = nullptr) const;
        std::vector<PaymentTransaction> loadTransactions(const std::string &vehicle_id, std::string *error = nullptr) const;

        bool saveActiveConfigJson(const std::string &config_json, std::string *error = nullptr) const;
        std::optional<std::string> loadActiveConfigJson(std::string *error = nullptr) const;

    private:
        std::string file_path;
        mutable std::mutex mutex;
    };

} // namespace autopark::db
