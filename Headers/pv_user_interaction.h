#pragma once
#include <string>
#include <unordered_set>
#include <vector>
#include <filesystem>
#include <fstream>

#include "pv_options.h"

// Unified function for handling user choices
int getUserChoice(const std::string& prompt, const std::unordered_set<std::string>& validChoices, std::ofstream& logFile);

// Function for handling the "check another value" choice
int getUserCheckChoice(std::ofstream& logFile);

// Function to describe every rule outcome for a single raw value
std::string describeValueCheck(const std::string& rawValue);

// Function for checking single values typed by the user until they choose to exit
void runInteractiveChecks(std::ofstream& logFile);

// Function to expand files and directories (recursively) into supported input files
std::vector<std::filesystem::path> collectInputFiles(const std::vector<std::filesystem::path>& targets,
    const ProgramOptions& options, std::ofstream& logFile);

// Function to split a ';'-separated list of paths, dropping quotes and surrounding whitespace
std::vector<std::filesystem::path> parsePathList(const std::string& input);

// Function for handling input file paths from arguments, or from the user outside batch mode
// (batch mode without arguments returns no paths)
std::vector<std::filesystem::path> getInputFilePaths(const ProgramOptions& options, std::ofstream& logFile);
