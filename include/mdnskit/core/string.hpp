/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <string_view>

namespace mdk {

/**
 * Tests whether given text starts with a certain string.
 * @param text The text to test.
 * @param starts_with The string to test for.
 * @return True if text starts with starts_with, false otherwise.
 */
inline bool string_starts_with(const std::string_view text, const std::string_view starts_with) {
    return text.rfind(starts_with, 0) == 0;
}

/**
 * Tests whether given text ends with a certain string.
 * @param text The text to test.
 * @param ends_with The string to test for.
 * @return True if text ends with ends_with, false otherwise.
 */
inline bool string_ends_with(const std::string_view text, const std::string_view ends_with) {
    if (ends_with.length() > text.length()) {
        return false;
    }
    return text.compare(text.length() - ends_with.length(), ends_with.length(), ends_with) == 0;
}

/**
 * Returns a view of given string without leading and trailing whitespace.
 * @param string The string to trim.
 * @return The trimmed view, which might be empty.
 */
inline std::string_view string_trim(std::string_view string) {
    const auto is_space = [](const char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (!string.empty() && is_space(string.front())) {
        string.remove_prefix(1);
    }
    while (!string.empty() && is_space(string.back())) {
        string.remove_suffix(1);
    }
    return string;
}

/**
 * Compares 2 strings case-insensitively.
 * @param lhs Left hand side
 * @param rhs Right hand side
 * @return True if strings are equal, false otherwise.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

/**
 * Converts the first `count` characters of a string to lower case.
 * @param str The string to convert.
 * @param count The number of leading characters to convert to lower case.
 * @return A new string with the first `count` characters converted to lower case.
 */
inline std::string string_to_lower(const std::string_view str, std::size_t count = std::numeric_limits<size_t>::max()) {
    std::string result(str);
    if (result.empty() || count == 0) {
        return result;
    }
    count = std::min(count, result.size());
    for (std::size_t i = 0; i < count; ++i) {
        result[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(result[i])));
    }
    return result;
}

}  // namespace mdk
