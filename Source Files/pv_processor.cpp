#include "pv_cleaning.h"
#include "pv_importer.h"
#include "pv_logger.h"
#include "pv_processor.h"

// Function to run the whole pipeline for one input file
std::optional<SummaryCounts> processInputFile(const Database& db, const std::filesystem::path& inputPath,
    const ProgramOptions& options, std::ofstream& logFile) {

    // Each file is processed against empty tables
    if (!clearTables(db, logFile)) {
        return std::nullopt;
    }

    if (!importFile(db, inputPath, options, logFile)) {
        return std::nullopt;
    }

    auto rawValues = loadRawValues(db, logFile);
    if (!rawValues) {
        return std::nullopt;
    }

    const CleaningResult cleaning = cleanAndClassify(*rawValues);
    if (!options.silentMode) {
        logMessage("Distinct cleaned values: " + std::to_string(cleaning.results.size()) +
                   " (" + std::to_string(cleaning.excludedCount) + " missing, " +
                   std::to_string(cleaning.duplicateCount) + " duplicates)", logFile);
    }

    if (!storeResults(db, cleaning.results, logFile)) {
        return std::nullopt;
    }

    auto summary = fetchSummaryCounts(db, logFile);
    if (!summary) {
        return std::nullopt;
    }

    logMessage("\n" + formatSummary(*summary), logFile);

    if (options.reportPath) {
        auto validPans = fetchPansByStatus(db, PanStatus::Valid, logFile);
        auto invalidPans = fetchPansByStatus(db, PanStatus::Invalid, logFile);
        if (!validPans || !invalidPans) {
            return std::nullopt;
        }

        const auto reportPath = resolveReportPath(*options.reportPath, inputPath);
        if (!saveReportToFile(reportPath, buildReportJson(*summary, *validPans, *invalidPans), options, logFile)) {
            logMessage("ERROR - failed to save report: " + reportPath.string(), logFile);
            return std::nullopt;
        }
    }

    return summary;
}
