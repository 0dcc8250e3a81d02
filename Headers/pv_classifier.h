#pragma once
#include <optional>
#include <string>
#include <string_view>

// PAN layout: 5 letters, 4 digits, 1 letter
constexpr size_t PAN_LENGTH = 10;
constexpr size_t PAN_LETTER_BLOCK_LENGTH = 5;
constexpr size_t PAN_DIGIT_BLOCK_LENGTH = 4;

// Define an enumeration for classification outcomes
enum class PanStatus {
    Valid,
    Invalid
};

// Outcome of every rule applied to a single value
struct PanCheck {
    bool formatMatches = false;
    bool hasAdjacentRepeat = false;
    bool letterBlockSequential = false;
    bool digitBlockSequential = false;

    PanStatus status() const noexcept;
};

// Cleaned value paired with its status
struct ClassificationResult {
    std::string panNumber;
    PanStatus status = PanStatus::Invalid;

    bool operator==(const ClassificationResult& other) const noexcept;
};

// Function to check the 5 letters + 4 digits + 1 letter layout
bool matchesPanFormat(std::string_view value);

// Function to evaluate every rule for a trimmed, uppercased value
PanCheck explainPan(std::string_view value);

// Function to classify a trimmed, uppercased value as Valid or Invalid
PanStatus classifyPan(std::string_view value);

// Function to get the label stored in the database and reports
const char* panStatusLabel(PanStatus status) noexcept;

// Function to read back a stored label
std::optional<PanStatus> parsePanStatus(std::string_view label) noexcept;
