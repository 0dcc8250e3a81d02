#pragma once
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "pv_classifier.h"
#include "pv_database.h"
#include "pv_options.h"

// Define an alias for ordered_json type from the nlohmann library
using ordered_json = nlohmann::ordered_json;

// Aggregate counts over the raw and results tables
struct SummaryCounts {
    size_t total = 0;
    size_t valid = 0;
    size_t invalid = 0;

    // Rows that produced no result of their own: NULL, blank and duplicate values
    size_t missingOrIncomplete() const noexcept;
};

// Function to count raw rows and results by status
std::optional<SummaryCounts> fetchSummaryCounts(const Database& db, std::ofstream& logFile);

// Function to fetch stored values with the given status, sorted
std::optional<std::vector<std::string>> fetchPansByStatus(const Database& db, PanStatus status, std::ofstream& logFile);

// Function to build the report document
ordered_json buildReportJson(const SummaryCounts& summary, const std::vector<std::string>& validPans,
    const std::vector<std::string>& invalidPans);

// Function to format the summary for the log
std::string formatSummary(const SummaryCounts& summary);

// Function to resolve where the report of an input file goes (a directory gets <stem>_report.json)
std::filesystem::path resolveReportPath(const std::filesystem::path& reportOption, const std::filesystem::path& inputPath);

// Function to create backup of an existing report with automatic numbering
bool createBackup(const std::filesystem::path& filePath, const ProgramOptions& options, std::ofstream& logFile);

// Function to save the report to file
bool saveReportToFile(const std::filesystem::path& reportPath, const ordered_json& report, const ProgramOptions& options, std::ofstream& logFile);
