#pragma once
#include <filesystem>
#include <fstream>
#include <optional>

#include "pv_database.h"
#include "pv_options.h"
#include "pv_reporter.h"

// Function to run the whole pipeline for one input file:
// import raw values, clean and classify them, store results, summarize and report
std::optional<SummaryCounts> processInputFile(const Database& db, const std::filesystem::path& inputPath,
    const ProgramOptions& options, std::ofstream& logFile);
