#pragma once
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "pv_cleaning.h"
#include "pv_database.h"
#include "pv_options.h"

// Define an alias for ordered_json type from the nlohmann library
using ordered_json = nlohmann::ordered_json;

// Function to check if a path has a supported input extension (.csv, .txt, .json)
bool isSupportedInputFile(const std::filesystem::path& path);

// Function to extract the first field of a delimited line, unquoting it if needed
std::string parseFirstField(const std::string& line);

// Function to read one value per line from a .CSV|TXT file
std::optional<std::vector<RawRecord>> readDelimitedFile(const std::filesystem::path& filePath, bool skipHeader, std::ofstream& logFile);

// Function to convert a parsed .JSON array into raw values
std::optional<std::vector<RawRecord>> rawValuesFromJson(const ordered_json& inputData, std::ofstream& logFile);

// Function to read raw values from a .JSON file
std::optional<std::vector<RawRecord>> readJsonFile(const std::filesystem::path& filePath, std::ofstream& logFile);

// Function to read raw values from any supported input file
std::optional<std::vector<RawRecord>> readInputFile(const std::filesystem::path& filePath, const ProgramOptions& options, std::ofstream& logFile);

// Function to import an input file into the raw table, returning the number of rows imported
std::optional<size_t> importFile(const Database& db, const std::filesystem::path& filePath, const ProgramOptions& options, std::ofstream& logFile);
