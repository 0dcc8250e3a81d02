#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "pv_cleaning.h"

namespace {
    const char* const WHITESPACE = " \t\r\n\f\v";

    // Shared pass used by both cleanValues and cleanAndClassify
    std::vector<std::string> collectDistinct(const std::vector<RawRecord>& rawValues,
        size_t& excludedCount, size_t& duplicateCount) {

        std::vector<std::string> distinctValues;
        std::unordered_set<std::string> seen;

        for (const auto& raw : rawValues) {
            auto cleaned = cleanValue(raw);
            if (!cleaned) {
                ++excludedCount;
                continue;
            }

            if (auto [it, inserted] = seen.insert(*cleaned); !inserted) {
                ++duplicateCount;
                continue;
            }

            distinctValues.push_back(std::move(*cleaned));
        }

        return distinctValues;
    }
}

// Function to trim surrounding whitespace and uppercase a raw value
std::optional<std::string> cleanValue(const RawRecord& raw) {
    if (!raw) {
        return std::nullopt;
    }

    const auto first = raw->find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = raw->find_last_not_of(WHITESPACE);

    std::string value = raw->substr(first, last - first + 1);
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
        });

    return value;
}

// Function to clean and de-duplicate raw values
std::vector<std::string> cleanValues(const std::vector<RawRecord>& rawValues) {
    size_t excludedCount = 0;
    size_t duplicateCount = 0;
    return collectDistinct(rawValues, excludedCount, duplicateCount);
}

// Function to clean, de-duplicate and classify raw values
CleaningResult cleanAndClassify(const std::vector<RawRecord>& rawValues) {
    CleaningResult cleaning;
    cleaning.totalCount = rawValues.size();

    auto distinctValues = collectDistinct(rawValues, cleaning.excludedCount, cleaning.duplicateCount);

    cleaning.results.reserve(distinctValues.size());
    for (auto& value : distinctValues) {
        const PanStatus status = classifyPan(value);
        cleaning.results.push_back(ClassificationResult{ std::move(value), status });
    }

    return cleaning;
}
