#pragma once
#include <string_view>

// Function to check whether any two consecutive characters are equal
// (strings shorter than 2 characters never contain a repeat)
bool hasAdjacentRepeat(std::string_view value) noexcept;

// Function to check whether the whole string is an unbroken ascending run of
// consecutive character codes, e.g. "ABCDE" or "1234"
// Strings shorter than 2 characters count as a sequence: there is no pair to break the run
bool isStrictAscendingSequence(std::string_view value) noexcept;
