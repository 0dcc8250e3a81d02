#include <iomanip>
#include <sstream>

#include "pv_logger.h"
#include "pv_reporter.h"

namespace {
    // Helper function to run a single-value COUNT query
    std::optional<size_t> fetchCount(const Database& db, const std::string& query, const char* status, std::ofstream& logFile) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, query.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            logMessage("ERROR - failed to prepare count query: " + std::string(sqlite3_errmsg(db)), logFile);
            return std::nullopt;
        }

        std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_ptr(stmt, sqlite3_finalize);
        if (status) {
            sqlite3_bind_text(stmt, 1, status, -1, SQLITE_STATIC);
        }

        if (sqlite3_step(stmt) == SQLITE_ROW) {
            return static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        }

        logMessage("ERROR - count query returned no row: " + std::string(sqlite3_errmsg(db)), logFile);
        return std::nullopt;
    }
}

size_t SummaryCounts::missingOrIncomplete() const noexcept {
    const size_t classified = valid + invalid;
    return total > classified ? total - classified : 0;
}

// Function to count raw rows and results by status
std::optional<SummaryCounts> fetchSummaryCounts(const Database& db, std::ofstream& logFile) {
    const std::string statusQuery = std::string("SELECT COUNT(*) FROM ") + RESULTS_TABLE + " WHERE status = ?;";

    auto total = fetchCount(db, std::string("SELECT COUNT(*) FROM ") + RAW_TABLE + ";", nullptr, logFile);
    auto valid = fetchCount(db, statusQuery, panStatusLabel(PanStatus::Valid), logFile);
    auto invalid = fetchCount(db, statusQuery, panStatusLabel(PanStatus::Invalid), logFile);

    if (!total || !valid || !invalid) {
        return std::nullopt;
    }

    return SummaryCounts{ *total, *valid, *invalid };
}

// Function to fetch stored values with the given status, sorted
std::optional<std::vector<std::string>> fetchPansByStatus(const Database& db, PanStatus status, std::ofstream& logFile) {
    const std::string query = std::string("SELECT pan_number FROM ") + RESULTS_TABLE + " WHERE status = ? ORDER BY pan_number;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, query.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        logMessage("ERROR - failed to prepare status query: " + std::string(sqlite3_errmsg(db)), logFile);
        return std::nullopt;
    }

    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_ptr(stmt, sqlite3_finalize);
    sqlite3_bind_text(stmt, 1, panStatusLabel(status), -1, SQLITE_STATIC);

    std::vector<std::string> pans;
    int stepResult = SQLITE_ROW;
    while ((stepResult = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* pan = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (pan) pans.emplace_back(pan);
    }

    if (stepResult != SQLITE_DONE) {
        logMessage("ERROR - failed to read results: " + std::string(sqlite3_errmsg(db)), logFile);
        return std::nullopt;
    }

    return pans;
}

// Function to build the report document
ordered_json buildReportJson(const SummaryCounts& summary, const std::vector<std::string>& validPans,
    const std::vector<std::string>& invalidPans) {

    ordered_json report;
    report["summary"] = {
        { "total", summary.total },
        { "valid", summary.valid },
        { "invalid", summary.invalid },
        { "missing_or_incomplete", summary.missingOrIncomplete() }
    };
    report["valid"] = validPans;
    report["invalid"] = invalidPans;
    return report;
}

// Function to format the summary for the log
std::string formatSummary(const SummaryCounts& summary) {
    std::ostringstream text;
    text << "Total records:         " << summary.total << "\n"
         << "Valid PANs:            " << summary.valid << "\n"
         << "Invalid PANs:          " << summary.invalid << "\n"
         << "Missing or incomplete: " << summary.missingOrIncomplete();
    return text.str();
}

// Function to resolve where the report of an input file goes
std::filesystem::path resolveReportPath(const std::filesystem::path& reportOption, const std::filesystem::path& inputPath) {
    if (std::filesystem::is_directory(reportOption)) {
        return reportOption / (inputPath.stem().string() + "_report.json");
    }
    return reportOption;
}

// Function to create backup of an existing report with automatic numbering
bool createBackup(const std::filesystem::path& filePath, const ProgramOptions& options, std::ofstream& logFile) {
    std::filesystem::path backupPath;
    int counter = 0;
    const int maxBackups = 1000;

    try {
        // First try simple .bac extension
        backupPath = filePath;
        backupPath += ".bac";

        // If simple backup exists, find next available numbered version
        while (std::filesystem::exists(backupPath) && counter < maxBackups) {
            std::ostringstream suffix;
            suffix << "." << std::setw(3) << std::setfill('0') << counter++ << ".bac";
            backupPath = filePath;
            backupPath += suffix.str();
        }

        // Safety check to prevent infinite loops
        if (counter >= maxBackups) {
            logMessage("ERROR - reached maximum backup count (" + std::to_string(maxBackups) +
                       ") for file: " + filePath.string(), logFile);
            return false;
        }

        std::filesystem::rename(filePath, backupPath);
        if (!options.silentMode) {
            logMessage("Previous report backed up as: " + backupPath.string(), logFile);
        }
        return true;
    }
    catch (const std::exception& e) {
        logMessage("ERROR - failed to create backup: " + filePath.string() + ": " + e.what(), logFile);
        return false;
    }
}

// Function to save the report to file
bool saveReportToFile(const std::filesystem::path& reportPath, const ordered_json& report, const ProgramOptions& options, std::ofstream& logFile) {
    if (std::filesystem::exists(reportPath) && !createBackup(reportPath, options, logFile)) {
        return false;
    }

    std::ofstream outputFile(reportPath);
    if (!outputFile) return false;
    outputFile << std::setw(4) << report;
    if (!options.silentMode) {
        logMessage("Report saved as: " + reportPath.string(), logFile);
    }
    return true;
}
