#include "SqliteRecordStore.hpp"

#include <sqlite3.h>

#include <utility>

namespace autopark::db
{
    namespace
    {
        sqlite3 *openHandle(const std::string &file_path, std::string *error)
        {
            sqlite3 *handle = nullptr;
            if (sqlite3_open(file_path.c_str(), &handle) != SQLITE_OK)
            {
                if (error)
                {
                    *error = handle ? sqlite3_errmsg(handle) : "failed to open database";
                }
                sqlite3_close(handle);
                return nullptr;
            }
            sqlite3_busy_timeout(handle, 2000);
            return handle;
        }

        sqlite3_stmt *prepare(sqlite3 *handle, const char *sql, std::string *error)
        {
            sqlite3_stmt *stmt = nullptr;
            if (sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr) != SQLITE_OK)
            {
                if (error)
                {
                    *error = sqlite3_errmsg(handle);
                }
                sqlite3_finalize(stmt);
                return nullptr;
            }
            return stmt;
        }

        void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
        {
            sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        }

        std::string columnText(sqlite3_stmt *stmt, int index)
        {
            const unsigned char *text = sqlite3_column_text(stmt, index);
            return text ? reinterpret_cast<const char *>(text) : "";
        }

        // Steps a write statement to completion, finalizes it and closes the handle
        bool finishWrite(sqlite3 *handle, sqlite3_stmt *stmt, std::string *error)
        {
            const int step_rc = sqlite3_step(stmt);
            sqlite3_finalize(stmt);
            if (step_rc != SQLITE_DONE)
            {
                if (error)
                {
                    *error = sqlite3_errmsg(handle);
                }
                sqlite3_close(handle);
                return false;
            }
            sqlite3_close(handle);
            return true;
        }

        TransactionStatus transactionStatusFromString(const std::string &value)
        {
            return value == "failed" ? TransactionStatus::Failed : TransactionStatus::Completed;
        }
    } // namespace

    SqliteRecordStore::SqliteRecordStore(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    bool SqliteRecordStore::initialize(std::string *error) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return false;

        const char *create_sql =
            "CREATE TABLE IF NOT EXISTS vehicles ("
            "id TEXT PRIMARY KEY,"
            "plate_number TEXT NOT NULL,"
            "vehicle_type TEXT NOT NULL,"
            "length REAL,"
            "width REAL,"
            "height REAL,"
            "owner_name TEXT,"
            "phone_number TEXT,"
            "entry_time_ms INTEGER NOT NULL,"
            "exit_time_ms INTEGER,"
            "parking_space INTEGER,"
            "payment_amount REAL DEFAULT 0.0,"
            "payment_method TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS transactions ("
            "transaction_id TEXT PRIMARY KEY,"
            "vehicle_id TEXT NOT NULL,"
            "amount REAL NOT NULL,"
            "payment_method TEXT,"
            "timestamp_ms INTEGER NOT NULL,"
            "status TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS system_events ("
            "event_id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "timestamp_ms INTEGER NOT NULL,"
            "event_type TEXT NOT NULL,"
            "vehicle_plate TEXT,"
            "space_id INTEGER,"
            "amount REAL,"
            "severity TEXT NOT NULL,"
            "description TEXT"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_transactions_vehicle ON transactions(vehicle_id);"
            "CREATE INDEX IF NOT EXISTS idx_events_type ON system_events(event_type);"
            "CREATE TABLE IF NOT EXISTS app_config ("
            "key TEXT PRIMARY KEY,"
            "value TEXT NOT NULL"
            ");";

        char *errmsg = nullptr;
        const int exec_rc = sqlite3_exec(handle, create_sql, nullptr, nullptr, &errmsg);
        if (exec_rc != SQLITE_OK)
        {
            if (error)
            {
                *error = errmsg ? errmsg : "failed to initialize schema";
            }
            sqlite3_free(errmsg);
            sqlite3_close(handle);
            return false;
        }

        sqlite3_close(handle);
        return true;
    }

    bool SqliteRecordStore::append(const ParkingEvent &event, std::string *error)
    {
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return false;

        const char *insert_sql =
            "INSERT INTO system_events(timestamp_ms, event_type, vehicle_plate, space_id, amount, severity, description) "
            "VALUES(?, ?, ?, ?, ?, ?, ?);";

        sqlite3_stmt *stmt = prepare(handle, insert_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return false;
        }

        sqlite3_bind_int64(stmt, 1, toUnixMillis(event.timestamp));
        bindText(stmt, 2, toString(event.type));
        bindText(stmt, 3, event.vehicle_plate);
        if (event.space_id)
            sqlite3_bind_int64(stmt, 4, *event.space_id);
        else
            sqlite3_bind_null(stmt, 4);
        if (event.amount)
            sqlite3_bind_double(stmt, 5, *event.amount);
        else
            sqlite3_bind_null(stmt, 5);
        bindText(stmt, 6, toString(event.severity));
        bindText(stmt, 7, event.description);

        return finishWrite(handle, stmt, error);
    }

    bool SqliteRecordStore::recordVehicle(const Vehicle &vehicle, std::string *error)
    {
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return false;

        const char *upsert_sql =
            "INSERT INTO vehicles(id, plate_number, vehicle_type, length, width, height, owner_name, phone_number, "
            "entry_time_ms, exit_time_ms, parking_space, payment_amount, payment_method) "
            "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET "
            "plate_number = excluded.plate_number, vehicle_type = excluded.vehicle_type, "
            "length = excluded.length, width = excluded.width, height = excluded.height, "
            "owner_name = excluded.owner_name, phone_number = excluded.phone_number, "
            "entry_time_ms = excluded.entry_time_ms, exit_time_ms = excluded.exit_time_ms, "
            "parking_space = excluded.parking_space, payment_amount = excluded.payment_amount, "
            "payment_method = excluded.payment_method;";

        sqlite3_stmt *stmt = prepare(handle, upsert_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return false;
        }

        bindText(stmt, 1, vehicle.id);
        bindText(stmt, 2, vehicle.plate_number);
        bindText(stmt, 3, toString(vehicle.vehicle_class));
        sqlite3_bind_double(stmt, 4, vehicle.length);
        sqlite3_bind_double(stmt, 5, vehicle.width);
        sqlite3_bind_double(stmt, 6, vehicle.height);
        bindText(stmt, 7, vehicle.owner_name);
        bindText(stmt, 8, vehicle.phone_number);
        sqlite3_bind_int64(stmt, 9, toUnixMillis(vehicle.entry_time));
        if (vehicle.exit_time)
            sqlite3_bind_int64(stmt, 10, toUnixMillis(*vehicle.exit_time));
        else
            sqlite3_bind_null(stmt, 10);
        if (vehicle.space_id)
            sqlite3_bind_int64(stmt, 11, *vehicle.space_id);
        else
            sqlite3_bind_null(stmt, 11);
        sqlite3_bind_double(stmt, 12, vehicle.payment_amount);
        bindText(stmt, 13, toString(vehicle.payment_method));

        return finishWrite(handle, stmt, error);
    }

    bool SqliteRecordStore::recordTransaction(const PaymentTransaction &transaction, std::string *error)
    {
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return false;

        const char *insert_sql =
            "INSERT OR REPLACE INTO transactions(transaction_id, vehicle_id, amount, payment_method, timestamp_ms, status) "
            "VALUES(?, ?, ?, ?, ?, ?);";

        sqlite3_stmt *stmt = prepare(handle, insert_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return false;
        }

        bindText(stmt, 1, transaction.transaction_id);
        bindText(stmt, 2, transaction.vehicle_id);
        sqlite3_bind_double(stmt, 3, transaction.amount);
        bindText(stmt, 4, toString(transaction.payment_method));
        sqlite3_bind_int64(stmt, 5, toUnixMillis(transaction.timestamp));
        bindText(stmt, 6, toString(transaction.status));

        return finishWrite(handle, stmt, error);
    }

    std::vector<ParkingEvent> SqliteRecordStore::loadRecentEvents(std::size_t limit, const std::string &event_type, std::string *error) const
    {
        std::vector<ParkingEvent> events;
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return events;

        const char *select_sql =
            "SELECT timestamp_ms, event_type, vehicle_plate, space_id, amount, severity, description "
            "FROM system_events WHERE (?1 = '' OR event_type = ?1) "
            "ORDER BY timestamp_ms DESC, event_id DESC LIMIT ?2;";

        sqlite3_stmt *stmt = prepare(handle, select_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return events;
        }

        bindText(stmt, 1, event_type);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));

        int step_rc = SQLITE_ROW;
        while ((step_rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            ParkingEvent event;
            event.timestamp = fromUnixMillis(sqlite3_column_int64(stmt, 0));
            if (!eventTypeFromString(columnText(stmt, 1), event.type))
            {
                continue;
            }
            event.vehicle_plate = columnText(stmt, 2);
            if (sqlite3_column_type(stmt, 3) != SQLITE_NULL)
                event.space_id = static_cast<SpaceId>(sqlite3_column_int64(stmt, 3));
            if (sqlite3_column_type(stmt, 4) != SQLITE_NULL)
                event.amount = sqlite3_column_double(stmt, 4);
            event.severity = severityFromString(columnText(stmt, 5));
            event.description = columnText(stmt, 6);
            events.push_back(std::move(event));
        }

        if (step_rc != SQLITE_DONE && error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return events;
    }

    std::optional<Vehicle> SqliteRecordStore::loadVehicle(const std::string &vehicle_id, std::string *error) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return std::nullopt;

        const char *select_sql =
            "SELECT id, plate_number, vehicle_type, length, width, height, owner_name, phone_number, "
            "entry_time_ms, exit_time_ms, parking_space, payment_amount, payment_method "
            "FROM vehicles WHERE id = ? LIMIT 1;";

        sqlite3_stmt *stmt = prepare(handle, select_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return std::nullopt;
        }

        bindText(stmt, 1, vehicle_id);

        std::optional<Vehicle> result;
        const int step_rc = sqlite3_step(stmt);
        if (step_rc == SQLITE_ROW)
        {
            Vehicle vehicle;
            vehicle.id = columnText(stmt, 0);
            vehicle.plate_number = columnText(stmt, 1);
            if (!vehicleClassFromString(columnText(stmt, 2), vehicle.vehicle_class))
            {
                vehicle.vehicle_class = VehicleClass::Car;
            }
            vehicle.length = sqlite3_column_double(stmt, 3);
            vehicle.width = sqlite3_column_double(stmt, 4);
            vehicle.height = sqlite3_column_double(stmt, 5);
            vehicle.owner_name = columnText(stmt, 6);
            vehicle.phone_number = columnText(stmt, 7);
            vehicle.entry_time = fromUnixMillis(sqlite3_column_int64(stmt, 8));
            if (sqlite3_column_type(stmt, 9) != SQLITE_NULL)
                vehicle.exit_time = fromUnixMillis(sqlite3_column_int64(stmt, 9));
            if (sqlite3_column_type(stmt, 10) != SQLITE_NULL)
                vehicle.space_id = static_cast<SpaceId>(sqlite3_column_int64(stmt, 10));
            vehicle.payment_amount = sqlite3_column_double(stmt, 11);
            vehicle.payment_method = paymentMethodFromString(columnText(stmt, 12));
            result = std::move(vehicle);
        }
        else if (step_rc != SQLITE_DONE && error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return result;
    }

    std::vector<PaymentTransaction> SqliteRecordStore::loadTransactions(const std::string &vehicle_id, std::string *error) const
    {
        std::vector<PaymentTransaction> transactions;
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return transactions;

        const char *select_sql =
            "SELECT transaction_id, vehicle_id, amount, payment_method, timestamp_ms, status "
            "FROM transactions WHERE vehicle_id = ? ORDER BY timestamp_ms ASC, transaction_id ASC;";

        sqlite3_stmt *stmt = prepare(handle, select_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return transactions;
        }

        bindText(stmt, 1, vehicle_id);

        int step_rc = SQLITE_ROW;
        while ((step_rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            PaymentTransaction transaction;
            transaction.transaction_id = columnText(stmt, 0);
            transaction.vehicle_id = columnText(stmt, 1);
            transaction.amount = sqlite3_column_double(stmt, 2);
            transaction.payment_method = paymentMethodFromString(columnText(stmt, 3));
            transaction.timestamp = fromUnixMillis(sqlite3_column_int64(stmt, 4));
            transaction.status = transactionStatusFromString(columnText(stmt, 5));
            transactions.push_back(std::move(transaction));
        }

        if (step_rc != SQLITE_DONE && error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return transactions;
    }

    bool SqliteRecordStore::saveActiveConfigJson(const std::string &config_json, std::string *error) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return false;

        const char *upsert_sql =
            "INSERT INTO app_config(key, value) VALUES('active_parking_config', ?) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value;";

        sqlite3_stmt *stmt = prepare(handle, upsert_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return false;
        }

        bindText(stmt, 1, config_json);
        return finishWrite(handle, stmt, error);
    }

    std::optional<std::string> SqliteRecordStore::loadActiveConfigJson(std::string *error) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        sqlite3 *handle = openHandle(file_path, error);
        if (!handle)
            return std::nullopt;

        const char *select_sql = "SELECT value FROM app_config WHERE key = 'active_parking_config' LIMIT 1;";

        sqlite3_stmt *stmt = prepare(handle, select_sql, error);
        if (!stmt)
        {
            sqlite3_close(handle);
            return std::nullopt;
        }

        std::optional<std::string> result;
        const int step_rc = sqlite3_step(stmt);
        if (step_rc == SQLITE_ROW)
        {
            result = columnText(stmt, 0);
        }
        else if (step_rc != SQLITE_DONE && error)
        {
            *error = sqlite3_errmsg(handle);
        }

        sqlite3_finalize(stmt);
        sqlite3_close(handle);
        return result;
    }

} // namespace autopark::db
