#include "pv_database.h"
#include "pv_logger.h"

namespace {
    using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    // Helper function to prepare a statement owned by a smart pointer
    std::optional<StatementPtr> prepareStatement(const Database& db, const std::string& sql, std::ofstream& logFile) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            logMessage("ERROR - failed to prepare statement: " + std::string(sqlite3_errmsg(db)), logFile);
            return std::nullopt;
        }
        return StatementPtr(stmt, sqlite3_finalize);
    }

    // Helper function to roll back after a failed write and report failure
    bool rollback(const Database& db, std::ofstream& logFile) {
        executeSql(db, "ROLLBACK;", logFile);
        return false;
    }
}

Database::Database(const std::string& filename) {
    sqlite3* db_raw = nullptr;
    const int result = sqlite3_open(filename.c_str(), &db_raw);

    if (result != SQLITE_OK) {
        const std::string error_msg = db_raw ? sqlite3_errmsg(db_raw) : "unknown error";
        if (db_raw) sqlite3_close(db_raw);
        throw std::runtime_error("Failed to open database: " + error_msg);
    }

    db_.reset(db_raw);
}

// Function to execute a statement without results
bool executeSql(const Database& db, const std::string& sql, std::ofstream& logFile) {
    char* errorMessage = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errorMessage) != SQLITE_OK) {
        const std::string details = errorMessage ? errorMessage : "unknown error";
        sqlite3_free(errorMessage);
        logMessage("ERROR - SQL execution failed: " + details, logFile);
        return false;
    }
    return true;
}

// Function to create the raw and results tables if missing
bool createSchema(const Database& db, std::ofstream& logFile) {
    return executeSql(db,
        std::string("CREATE TABLE IF NOT EXISTS ") + RAW_TABLE + " ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "pan_number TEXT);", logFile)
        && executeSql(db,
        std::string("CREATE TABLE IF NOT EXISTS ") + RESULTS_TABLE + " ("
        "pan_number TEXT PRIMARY KEY, "
        "status TEXT NOT NULL CHECK (status IN ('Valid', 'Invalid')));", logFile);
}

// Function to delete all rows from both tables
bool clearTables(const Database& db, std::ofstream& logFile) {
    return executeSql(db, std::string("DELETE FROM ") + RAW_TABLE + ";", logFile)
        && executeSql(db, std::string("DELETE FROM ") + RESULTS_TABLE + ";", logFile);
}

// Function to insert raw values (NULL for missing ones) in one transaction
bool insertRawValues(const Database& db, const std::vector<RawRecord>& rawValues, std::ofstream& logFile) {
    if (!executeSql(db, "BEGIN TRANSACTION;", logFile)) {
        return false;
    }

    auto stmt = prepareStatement(db, std::string("INSERT INTO ") + RAW_TABLE + " (pan_number) VALUES (?);", logFile);
    if (!stmt) {
        return rollback(db, logFile);
    }

    for (const auto& raw : rawValues) {
        if (raw) {
            sqlite3_bind_text(stmt->get(), 1, raw->c_str(), static_cast<int>(raw->length()), SQLITE_TRANSIENT);
        }
        else {
            sqlite3_bind_null(stmt->get(), 1);
        }

        if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
            logMessage("ERROR - failed to insert raw value: " + std::string(sqlite3_errmsg(db)), logFile);
            stmt->reset();
            return rollback(db, logFile);
        }

        sqlite3_reset(stmt->get());
        sqlite3_clear_bindings(stmt->get());
    }

    stmt->reset();
    return executeSql(db, "COMMIT;", logFile);
}

// Function to load raw values in insertion order
std::optional<std::vector<RawRecord>> loadRawValues(const Database& db, std::ofstream& logFile) {
    auto stmt = prepareStatement(db, std::string("SELECT pan_number FROM ") + RAW_TABLE + " ORDER BY id;", logFile);
    if (!stmt) {
        return std::nullopt;
    }

    std::vector<RawRecord> rawValues;
    int stepResult = SQLITE_ROW;
    while ((stepResult = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        if (sqlite3_column_type(stmt->get(), 0) == SQLITE_NULL) {
            rawValues.emplace_back(std::nullopt);
            continue;
        }

        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt->get(), 0));
        const int length = sqlite3_column_bytes(stmt->get(), 0);
        rawValues.emplace_back(std::string(text ? text : "", text ? static_cast<size_t>(length) : 0));
    }

    if (stepResult != SQLITE_DONE) {
        logMessage("ERROR - failed to read raw values: " + std::string(sqlite3_errmsg(db)), logFile);
        return std::nullopt;
    }

    return rawValues;
}

// Function to store classification results in one transaction
bool storeResults(const Database& db, const std::vector<ClassificationResult>& results, std::ofstream& logFile) {
    if (!executeSql(db, "BEGIN TRANSACTION;", logFile)) {
        return false;
    }

    auto stmt = prepareStatement(db, std::string("INSERT OR REPLACE INTO ") + RESULTS_TABLE + " (pan_number, status) VALUES (?, ?);", logFile);
    if (!stmt) {
        return rollback(db, logFile);
    }

    for (const auto& result : results) {
        sqlite3_bind_text(stmt->get(), 1, result.panNumber.c_str(), static_cast<int>(result.panNumber.length()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt->get(), 2, panStatusLabel(result.status), -1, SQLITE_STATIC);

        if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
            logMessage("ERROR - failed to store result for " + result.panNumber + ": " + std::string(sqlite3_errmsg(db)), logFile);
            stmt->reset();
            return rollback(db, logFile);
        }

        sqlite3_reset(stmt->get());
    }

    stmt->reset();
    return executeSql(db, "COMMIT;", logFile);
}
