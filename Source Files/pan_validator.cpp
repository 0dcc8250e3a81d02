#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "pv_database.h"
#include "pv_logger.h"
#include "pv_options.h"
#include "pv_processor.h"
#include "pv_user_interaction.h"

namespace {
    std::string formatSeconds(double seconds) {
        std::ostringstream text;
        text << std::fixed << std::setprecision(3) << seconds;
        return text.str();
    }
}

// Main function
int main(int argc, char* argv[]) {
    // Parse command line arguments
    ProgramOptions options;
    try {
        options = parseArguments(argc, argv);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "ERROR - " << e.what() << "\n\n";
        printHelp();
        return EXIT_FAILURE;
    }

    // Diagnostic mode: check a single value and exit
    if (options.checkValue) {
        std::cout << describeValueCheck(*options.checkValue) << std::endl;
        return EXIT_SUCCESS;
    }

    // Display program information
    if (!options.silentMode) {
        std::cout << PROGRAM_NAME << "\n" << PROGRAM_VERSION << "\n"
                  << PROGRAM_AUTHOR << "\n\n" << PROGRAM_DESCRIPTION << "\n\n";
    }

    // Log file initialisation
    std::ofstream logFile(LOG_FILE_NAME, std::ios::app);
    if (!logFile.is_open()) {
        logErrorAndExit("ERROR - failed to open log file!\n", logFile);
    }

    // Clear log file
    logClear();
    if (!options.silentMode) {
        logMessage("Log file cleared...", logFile);
    }

    // Open the database and make sure the tables exist
    std::optional<Database> db;
    try {
        db.emplace(options.databasePath.string());
    }
    catch (const std::exception& e) {
        logErrorAndExit("ERROR - " + std::string(e.what()) + "\n", logFile);
    }

    if (!createSchema(*db, logFile)) {
        logErrorAndExit("ERROR - failed to create tables in database '" + options.databasePath.string() + "'!\n", logFile);
    }

    if (!options.silentMode) {
        logMessage("Database opened successfully: " + options.databasePath.string() + "\n"
                   "Initialisation complete...", logFile);
    }

    // Get the input file path(s)
    auto inputPaths = getInputFilePaths(options, logFile);

    // Time start
    auto programStart = std::chrono::high_resolution_clock::now();
    int failedFiles = 0;

    // Sequential processing of each file
    for (const auto& inputPath : inputPaths) {
        // Time file start
        auto fileStart = std::chrono::high_resolution_clock::now();

        logMessage("Processing file: " + inputPath.string(), logFile);

        try {
            if (!processInputFile(*db, inputPath, options, logFile)) {
                logMessage("ERROR - processing failed for file: " + inputPath.string() + "\n", logFile);
                ++failedFiles;
                continue;
            }

            // Time file total
            auto fileEnd = std::chrono::high_resolution_clock::now();
            auto seconds = std::chrono::duration<double>(fileEnd - fileStart).count();
            if (!options.silentMode) {
                logMessage("\nFile processed in: " + formatSeconds(seconds) + " seconds\n", logFile);
            }
        }
        catch (const std::exception& e) {
            logMessage("ERROR - failed to process file " + inputPath.string() + ": " + e.what() + "\n", logFile);
            ++failedFiles;
            continue;
        }
    }

    // Time total
    auto programEnd = std::chrono::high_resolution_clock::now();
    auto seconds = std::chrono::duration<double>(programEnd - programStart).count();
    if (!options.silentMode) {
        logMessage("\nTotal processing time: " + formatSeconds(seconds) + " seconds", logFile);
    }

    // Offer single-value checks in interactive mode
    if (!options.batchMode && !options.silentMode) {
        runInteractiveChecks(logFile);
    }

    logFile.close();

    return failedFiles == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
