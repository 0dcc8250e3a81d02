#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Define program metadata constants
constexpr const char* PROGRAM_NAME = "PAN Validator";
constexpr const char* PROGRAM_VERSION = "V 1.0.0";
constexpr const char* PROGRAM_AUTHOR = "by the PAN Validator maintainers";
constexpr const char* PROGRAM_DESCRIPTION = "Bulk validation of Indian Permanent Account Numbers";

// Define default database file
constexpr const char* DEFAULT_DATABASE_FILE = "pan_validator.db";

// Structure for storing program configuration options
struct ProgramOptions {
    bool batchMode = false;
    bool silentMode = false;
    bool skipHeader = false;
    std::filesystem::path databasePath = DEFAULT_DATABASE_FILE;
    std::optional<std::filesystem::path> reportPath;
    std::optional<std::string> checkValue;
    std::vector<std::filesystem::path> inputFiles;
};

// Function to print the help message
void printHelp();

// Function to parse command-line arguments
// (throws std::invalid_argument when an option is missing its value)
ProgramOptions parseArguments(int argc, char* argv[]);
