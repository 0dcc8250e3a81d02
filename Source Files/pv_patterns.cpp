#include "pv_patterns.h"

// Function to check whether any two consecutive characters are equal
bool hasAdjacentRepeat(std::string_view value) noexcept {
    for (size_t i = 1; i < value.size(); ++i) {
        if (value[i - 1] == value[i]) {
            return true;
        }
    }
    return false;
}

// Function to check whether the whole string is an unbroken ascending run
bool isStrictAscendingSequence(std::string_view value) noexcept {
    for (size_t i = 1; i < value.size(); ++i) {
        const int previous = static_cast<unsigned char>(value[i - 1]);
        const int current = static_cast<unsigned char>(value[i]);
        if (previous + 1 != current) {
            return false;
        }
    }
    return true;
}
