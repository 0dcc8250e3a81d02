#include <algorithm>
#include <cctype>

#include "pv_importer.h"
#include "pv_logger.h"

namespace {
    // UTF-8 byte order mark written by spreadsheet "CSV UTF-8" exports
    const std::string UTF8_BOM = "\xEF\xBB\xBF";

    std::string lowerExtension(const std::filesystem::path& path) {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
            });
        return ext;
    }
}

// Function to check if a path has a supported input extension (.csv, .txt, .json)
bool isSupportedInputFile(const std::filesystem::path& path) {
    const std::string ext = lowerExtension(path);
    return ext == ".csv" || ext == ".txt" || ext == ".json";
}

// Function to extract the first field of a delimited line, unquoting it if needed
std::string parseFirstField(const std::string& line) {
    std::string content = line;
    if (!content.empty() && content.back() == '\r') {
        content.pop_back();
    }

    // Quoted field: read up to the closing quote, "" stands for a literal quote
    if (!content.empty() && content.front() == '"') {
        std::string field;
        for (size_t i = 1; i < content.size(); ++i) {
            if (content[i] == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                    continue;
                }
                return field;
            }
            field += content[i];
        }
        // Unterminated quote: keep everything after the opening quote
        return field;
    }

    return content.substr(0, content.find(','));
}

// Function to read one value per line from a .CSV|TXT file
std::optional<std::vector<RawRecord>> readDelimitedFile(const std::filesystem::path& filePath, bool skipHeader, std::ofstream& logFile) {
    std::ifstream inputFile(filePath, std::ios::binary);
    if (!inputFile.is_open()) {
        logMessage("ERROR - failed to open input file: " + filePath.string(), logFile);
        return std::nullopt;
    }

    std::vector<RawRecord> rawValues;
    std::string line;
    bool headerPending = skipHeader;
    bool firstLine = true;

    while (std::getline(inputFile, line)) {
        if (firstLine) {
            firstLine = false;
            if (line.compare(0, UTF8_BOM.size(), UTF8_BOM) == 0) {
                line.erase(0, UTF8_BOM.size());
            }
        }

        if (headerPending) {
            headerPending = false;
            continue;
        }
        rawValues.emplace_back(parseFirstField(line));
    }

    if (inputFile.bad()) {
        logMessage("ERROR - failed to read input file: " + filePath.string(), logFile);
        return std::nullopt;
    }

    return rawValues;
}

// Function to convert a parsed .JSON array into raw values
std::optional<std::vector<RawRecord>> rawValuesFromJson(const ordered_json& inputData, std::ofstream& logFile) {
    // Validate root JSON structure
    if (!inputData.is_array()) {
        logMessage("ERROR - input JSON is not an array, unable to process!", logFile);
        return std::nullopt;
    }

    std::vector<RawRecord> rawValues;
    rawValues.reserve(inputData.size());

    for (size_t i = 0; i < inputData.size(); ++i) {
        const auto& item = inputData[i];

        if (item.is_null()) {
            rawValues.emplace_back(std::nullopt);
        }
        else if (item.is_string()) {
            rawValues.emplace_back(item.get<std::string>());
        }
        else if (item.is_number()) {
            rawValues.emplace_back(item.dump());
        }
        else {
            logWarning("skipped unsupported JSON element at index " + std::to_string(i) + ": " + item.dump(), logFile);
        }
    }

    return rawValues;
}

// Function to read raw values from a .JSON file
std::optional<std::vector<RawRecord>> readJsonFile(const std::filesystem::path& filePath, std::ofstream& logFile) {
    std::ifstream inputFile(filePath, std::ios::binary);
    if (!inputFile.is_open()) {
        logMessage("ERROR - failed to open JSON file: " + filePath.string(), logFile);
        return std::nullopt;
    }

    ordered_json inputData;
    try {
        inputFile >> inputData;
    }
    catch (const std::exception& e) {
        logMessage("ERROR - failed to parse JSON (" + filePath.string() + "): " + e.what(), logFile);
        return std::nullopt;
    }

    return rawValuesFromJson(inputData, logFile);
}

// Function to read raw values from any supported input file
std::optional<std::vector<RawRecord>> readInputFile(const std::filesystem::path& filePath, const ProgramOptions& options, std::ofstream& logFile) {
    const std::string ext = lowerExtension(filePath);

    if (ext == ".json") {
        return readJsonFile(filePath, logFile);
    }
    if (ext == ".csv" || ext == ".txt") {
        return readDelimitedFile(filePath, options.skipHeader, logFile);
    }

    logMessage("ERROR - unsupported input file extension: " + filePath.string(), logFile);
    return std::nullopt;
}

// Function to import an input file into the raw table, returning the number of rows imported
std::optional<size_t> importFile(const Database& db, const std::filesystem::path& filePath, const ProgramOptions& options, std::ofstream& logFile) {
    auto rawValues = readInputFile(filePath, options, logFile);
    if (!rawValues) {
        return std::nullopt;
    }

    if (!insertRawValues(db, *rawValues, logFile)) {
        logMessage("ERROR - failed to import values into the database: " + filePath.string(), logFile);
        return std::nullopt;
    }

    if (!options.silentMode) {
        logMessage("Imported " + std::to_string(rawValues->size()) + " values from: " + filePath.string(), logFile);
    }

    return rawValues->size();
}
