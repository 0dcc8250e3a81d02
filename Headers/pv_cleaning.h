#pragma once
#include <optional>
#include <string>
#include <vector>

#include "pv_classifier.h"

// A single imported value, absent when the source cell was NULL
using RawRecord = std::optional<std::string>;

// Output of a cleaning and classification pass
struct CleaningResult {
    std::vector<ClassificationResult> results;  // One entry per distinct cleaned value, first occurrence order
    size_t totalCount = 0;                      // Number of raw records received
    size_t excludedCount = 0;                   // NULL or blank records
    size_t duplicateCount = 0;                  // Records collapsed onto an earlier cleaned value
};

// Function to trim surrounding whitespace and uppercase a raw value
// (returns nothing for NULL or blank values)
std::optional<std::string> cleanValue(const RawRecord& raw);

// Function to clean and de-duplicate raw values
std::vector<std::string> cleanValues(const std::vector<RawRecord>& rawValues);

// Function to clean, de-duplicate and classify raw values
CleaningResult cleanAndClassify(const std::vector<RawRecord>& rawValues);
