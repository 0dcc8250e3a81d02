#include <regex>

#include "pv_classifier.h"
#include "pv_patterns.h"

PanStatus PanCheck::status() const noexcept {
    if (formatMatches && !hasAdjacentRepeat && !letterBlockSequential && !digitBlockSequential) {
        return PanStatus::Valid;
    }
    return PanStatus::Invalid;
}

bool ClassificationResult::operator==(const ClassificationResult& other) const noexcept {
    return panNumber == other.panNumber && status == other.status;
}

// Function to check the 5 letters + 4 digits + 1 letter layout
bool matchesPanFormat(std::string_view value) {
    static const std::regex panPattern("^[A-Z]{5}[0-9]{4}[A-Z]$");

    if (value.size() != PAN_LENGTH) {
        return false;
    }
    return std::regex_match(value.begin(), value.end(), panPattern);
}

// Function to evaluate every rule for a trimmed, uppercased value
PanCheck explainPan(std::string_view value) {
    PanCheck check;
    check.formatMatches = matchesPanFormat(value);
    check.hasAdjacentRepeat = hasAdjacentRepeat(value);

    // Block checks only make sense on the 10-character layout
    if (check.formatMatches) {
        check.letterBlockSequential = isStrictAscendingSequence(value.substr(0, PAN_LETTER_BLOCK_LENGTH));
        check.digitBlockSequential = isStrictAscendingSequence(value.substr(PAN_LETTER_BLOCK_LENGTH, PAN_DIGIT_BLOCK_LENGTH));
    }

    return check;
}

// Function to classify a trimmed, uppercased value as Valid or Invalid
PanStatus classifyPan(std::string_view value) {
    return explainPan(value).status();
}

// Function to get the label stored in the database and reports
const char* panStatusLabel(PanStatus status) noexcept {
    switch (status) {
    case PanStatus::Valid:
        return "Valid";
    case PanStatus::Invalid:
        return "Invalid";
    }
    return "Invalid";
}

// Function to read back a stored label
std::optional<PanStatus> parsePanStatus(std::string_view label) noexcept {
    if (label == "Valid") return PanStatus::Valid;
    if (label == "Invalid") return PanStatus::Invalid;
    return std::nullopt;
}
