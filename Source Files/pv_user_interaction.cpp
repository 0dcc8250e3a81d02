#include <filesystem>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>

#include "pv_cleaning.h"
#include "pv_importer.h"
#include "pv_logger.h"
#include "pv_options.h"
#include "pv_user_interaction.h"

// Unified function for handling user choices
int getUserChoice(const std::string& prompt,
    const std::unordered_set<std::string>& validChoices,
    std::ofstream& logFile)
{
    const std::string errorMessage = "\nInvalid choice: enter ";
    std::string input;
    while (true) {
        std::cout << prompt;
        if (!std::getline(std::cin, input)) {
            logMessage("\nInput closed - no choice made", logFile);
            return -1;
        }

        if (validChoices.count(input)) {
            return std::stoi(input);
        }

        // List of valid options for the error message
        std::string validOptions;
        for (const auto& option : validChoices) {
            if (!validOptions.empty()) validOptions += " or ";
            validOptions += option;
        }
        std::cout << (errorMessage + validOptions) << '\n';
    }
}

// Function for handling the "check another value" choice
int getUserCheckChoice(std::ofstream& logFile) {
    return getUserChoice(
        "\nCheck a single PAN value:\n"
        "1. Check a value\n"
        "2. Exit\n"
        "Choice: ",
        { "1", "2" }, logFile
    );
}

// Function to describe every rule outcome for a single raw value
std::string describeValueCheck(const std::string& rawValue) {
    auto yesNo = [](bool flag) { return flag ? "yes" : "no"; };

    std::ostringstream text;
    const auto cleaned = cleanValue(rawValue);
    if (!cleaned) {
        text << "Value is blank - it would be counted as missing or incomplete";
        return text.str();
    }

    const PanCheck check = explainPan(*cleaned);
    text << "Cleaned value:               " << *cleaned << "\n"
         << "Matches AAAAA9999A format:   " << yesNo(check.formatMatches) << "\n"
         << "Adjacent repeated character: " << yesNo(check.hasAdjacentRepeat) << "\n";

    if (check.formatMatches) {
        text << "Sequential letter block:     " << yesNo(check.letterBlockSequential) << "\n"
             << "Sequential digit block:      " << yesNo(check.digitBlockSequential) << "\n";
    }

    text << "Status:                      " << panStatusLabel(check.status());
    return text.str();
}

// Function for checking single values typed by the user until they choose to exit
void runInteractiveChecks(std::ofstream& logFile) {
    while (getUserCheckChoice(logFile) == 1) {
        std::cout << "\nEnter value: ";
        std::string input;
        if (!std::getline(std::cin, input)) {
            return;
        }
        logMessage("\n" + describeValueCheck(input), logFile);
    }
}

// Function to expand files and directories (recursively) into supported input files
std::vector<std::filesystem::path> collectInputFiles(const std::vector<std::filesystem::path>& targets,
    const ProgramOptions& options, std::ofstream& logFile) {

    std::vector<std::filesystem::path> result;

    for (const auto& path : targets) {
        try {
            if (!std::filesystem::exists(path)) {
                if (!options.silentMode) logWarning("input path not found: " + path.string(), logFile);
                continue;
            }

            if (!std::filesystem::is_directory(path)) {
                if (isSupportedInputFile(path)) result.push_back(path);
                else if (!options.silentMode) logWarning("input file has invalid extension: " + path.string(), logFile);
                continue;
            }

            // Directory order is unspecified, sort each directory's files for a stable run order
            std::vector<std::filesystem::path> directoryFiles;
            for (const auto& entry : std::filesystem::recursive_directory_iterator(path)) {
                if (entry.is_regular_file() && isSupportedInputFile(entry.path())) {
                    directoryFiles.push_back(entry.path());
                }
            }
            std::sort(directoryFiles.begin(), directoryFiles.end());
            result.insert(result.end(), directoryFiles.begin(), directoryFiles.end());
        }
        catch (const std::exception& e) {
            logMessage("ERROR processing path " + path.string() + ": " + e.what(), logFile);
        }
    }

    if (!options.silentMode && !result.empty()) {
        logMessage("Found " + std::to_string(result.size()) + " valid input files:", logFile);
        for (const auto& file : result) {
            logMessage("  " + file.string(), logFile);
        }
    }

    return result;
}

// Function to split a ';'-separated list of paths, dropping quotes and surrounding whitespace
std::vector<std::filesystem::path> parsePathList(const std::string& input) {
    std::vector<std::filesystem::path> paths;
    std::istringstream iss(input);
    std::string pathStr;
    while (std::getline(iss, pathStr, ';')) {
        pathStr.erase(std::remove(pathStr.begin(), pathStr.end(), '\"'), pathStr.end());
        pathStr.erase(pathStr.find_last_not_of(" \t") + 1);
        pathStr.erase(0, pathStr.find_first_not_of(" \t"));
        if (!pathStr.empty()) {
            paths.emplace_back(pathStr);
        }
    }
    return paths;
}

// Function for handling input file paths from arguments, or from the user outside batch mode
std::vector<std::filesystem::path> getInputFilePaths(const ProgramOptions& options, std::ofstream& logFile) {
    if (!options.inputFiles.empty()) {
        logMessage("\nUsing files from command line arguments", logFile);
        return collectInputFiles(options.inputFiles, options, logFile);
    }

    // Batch mode never prompts
    if (options.batchMode) {
        logMessage("ERROR - batch mode requires input files or directories as arguments", logFile);
        return {};
    }

    while (true) {
        std::cout << "\nEnter the path to a .CSV|TXT|JSON file or a data folder (relative to this program or full).\n"
                     "Separate several paths with semicolons ';': ";
        std::string input;
        if (!std::getline(std::cin, input)) {
            return {};
        }

        auto result = collectInputFiles(parsePathList(input), options, logFile);
        if (!result.empty()) {
            return result;
        }

        std::cout << "\nERROR - input files not found: check their directory, names, and extensions!\n";
    }
}
