#pragma once
#include <filesystem>
#include <fstream>
#include <string>

// Define default log file name
constexpr const char* LOG_FILE_NAME = "pan_validator.log";

// Log messages to both a log file and console
void logMessage(const std::string& message, std::ofstream& logFile);

// Log a non-fatal problem with the "WARNING - " prefix
void logWarning(const std::string& message, std::ofstream& logFile);

// Clear log file
void logClear(const std::filesystem::path& logPath = LOG_FILE_NAME);

// Log errors, close the log file and terminate the program
[[noreturn]] void logErrorAndExit(const std::string& errorMessage, std::ofstream& logFile);
