#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "pv_options.h"

// Function to print the help message
void printHelp() {
    std::cout << "====================\n"
        << "PAN Validator - Help\n"
        << "====================\n\n"
        << "Usage:\n"
        << "  ./pan_validator [OPTIONS] [TARGETS]\n\n"
        << "Options:\n"
        << "  -b, --batch           Process only the targets given as arguments, never prompt\n"
        << "  -s, --silent          Suppress non-critical messages\n"
        << "  -H, --header          Skip the first line of .CSV|TXT input (header row)\n"
        << "  -d, --database PATH   SQLite database file (default: " << DEFAULT_DATABASE_FILE << ")\n"
        << "  -r, --report PATH     Write a .JSON report (a directory gets <input>_report.json)\n"
        << "  -c, --check VALUE     Show the rule breakdown for a single value and exit\n"
        << "  -h, --help            Show this help message\n\n"
        << "Target Formats:\n\n"
        << "  .CSV|TXT  one value per line, first column is used\n"
        << "  .JSON     array of strings, null marks a missing value\n\n"
        << "  Files (as arguments, or at the prompt separated with ';'):\n"
        << "    pan_list.csv\n"
        << "    /data/exports/pan_list.json\n"
        << "    file1.csv;file2.json;file 3.txt\n\n"
        << "  Entire Directory (recursive processing):\n"
        << "    /data/exports/\n"
        << "    ./exports/  (relative path)\n\n";
}

// Function to parse command-line arguments
ProgramOptions parseArguments(int argc, char* argv[]) {
    ProgramOptions options;

    // Helper function to fetch the value following an option
    auto requireValue = [&](int& i, const std::string& option) {
        if (i + 1 >= argc) {
            throw std::invalid_argument("option " + option + " requires a value");
        }
        return std::string(argv[++i]);
        };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Short options are case-sensitive (-h and -H differ), long ones are not
        std::string argLower = arg;
        if (arg.rfind("--", 0) == 0) {
            std::transform(argLower.begin(), argLower.end(), argLower.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
                });
        }

        if (argLower == "--batch" || argLower == "-b") {
            options.batchMode = true;
        }
        else if (argLower == "--silent" || argLower == "-s") {
            options.silentMode = true;
        }
        else if (argLower == "--header" || argLower == "-H") {
            options.skipHeader = true;
        }
        else if (argLower == "--database" || argLower == "-d") {
            options.databasePath = requireValue(i, arg);
        }
        else if (argLower == "--report" || argLower == "-r") {
            options.reportPath = requireValue(i, arg);
        }
        else if (argLower == "--check" || argLower == "-c") {
            options.checkValue = requireValue(i, arg);
        }
        else if (argLower == "--help" || argLower == "-h") {
            printHelp();

            // Wait for user input before exiting (Windows)
        #ifndef __linux__
            std::cout << "\nPress Enter to exit...";
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        #endif

            std::exit(EXIT_SUCCESS);
        }
        else {
            options.inputFiles.emplace_back(arg);
        }
    }

    return options;
}
