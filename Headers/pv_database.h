#pragma once
#include <sqlite3.h>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "pv_cleaning.h"

class Database {
public:
    // Constructor that opens (or creates) the database
    explicit Database(const std::string& filename);

    // Disable copy semantics
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Enable move semantics
    Database(Database&&) = default;
    Database& operator=(Database&&) = default;

    // Implicit conversion to sqlite3* for compatibility with SQLite C API
    operator sqlite3* () const { return db_.get(); }

    // Explicit getter for the raw sqlite3* pointer
    sqlite3* get() const { return db_.get(); }

    // Check whether the database connection is valid
    bool is_valid() const { return db_ != nullptr; }

private:
    struct Deleter {
        void operator()(sqlite3* db) const {
            if (db) sqlite3_close(db);
        }
    };

    std::unique_ptr<sqlite3, Deleter> db_;
};

// Define table names
constexpr const char* RAW_TABLE = "raw_pan";
constexpr const char* RESULTS_TABLE = "pan_results";

// Function to execute a statement without results
bool executeSql(const Database& db, const std::string& sql, std::ofstream& logFile);

// Function to create the raw and results tables if missing
bool createSchema(const Database& db, std::ofstream& logFile);

// Function to delete all rows from both tables
bool clearTables(const Database& db, std::ofstream& logFile);

// Function to insert raw values (NULL for missing ones) in one transaction
bool insertRawValues(const Database& db, const std::vector<RawRecord>& rawValues, std::ofstream& logFile);

// Function to load raw values in insertion order
std::optional<std::vector<RawRecord>> loadRawValues(const Database& db, std::ofstream& logFile);

// Function to store classification results in one transaction
bool storeResults(const Database& db, const std::vector<ClassificationResult>& results, std::ofstream& logFile);
