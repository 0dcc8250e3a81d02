#include <iostream>
#include <fstream>
#include <cstdlib>
#include <limits>

#include "pv_logger.h"

// Function to log messages to both a log file and console
void logMessage(const std::string& message, std::ofstream& logFile) {
    std::cout << message << std::endl;
    logFile << message << std::endl;
}

// Function to log a non-fatal problem
void logWarning(const std::string& message, std::ofstream& logFile) {
    logMessage("WARNING - " + message, logFile);
}

// Function to clear log file
void logClear(const std::filesystem::path& logPath) {
    std::ofstream ofs(logPath, std::ofstream::trunc);
}

// Function to log errors, close the log file and terminate the program
[[noreturn]] void logErrorAndExit(const std::string& errorMessage, std::ofstream& logFile) {
    std::cerr << errorMessage;
    if (logFile.is_open()) {
        logFile << errorMessage;
        logFile.close();
    }

#ifndef __linux__
    std::cout << "\nPress Enter to exit...";
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
#endif

    std::exit(EXIT_FAILURE);
}
