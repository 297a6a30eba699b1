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

#include <optional>
#include <string_view>

namespace mdk {

/**
 * A handy utility class for parsing strings. It works like a stream, where it maintains a position in the string and
 * every read operation consumes the part of the string that was read.
 */
class StringParser {
  public:
    explicit StringParser(const std::string_view str) : str_(str) {}

    /**
     * Reads until the next delimiter, and consumes the delimiter. If the delimiter is not found, the rest of the string
     * is returned.
     * @param delimiter The delimiter to read until.
     * @return The string until the delimiter, or nullopt if the parser is exhausted.
     */
    std::optional<std::string_view> read_until(const char delimiter) {
        if (str_.empty()) {
            return std::nullopt;
        }

        const auto pos = str_.find(delimiter);
        if (pos == std::string_view::npos) {
            return read_until_end();
        }

        const auto result = str_.substr(0, pos);
        str_.remove_prefix(pos + 1);
        return result;
    }

    /**
     * Reads the remaining string.
     * @return The remaining string, or nullopt if the parser is exhausted.
     */
    std::optional<std::string_view> read_until_end() {
        if (str_.empty()) {
            return std::nullopt;
        }
        const auto result = str_;
        str_ = {};
        return result;
    }

    /**
     * Skips given character if it is the next character in the string.
     * @param chr The character to skip.
     * @return True if the character was skipped, false otherwise.
     */
    bool skip(const char chr) {
        if (str_.empty() || str_.front() != chr) {
            return false;
        }
        str_.remove_prefix(1);
        return true;
    }

    /**
     * @return True if the whole string has been consumed.
     */
    [[nodiscard]] bool exhausted() const {
        return str_.empty();
    }

  private:
    std::string_view str_;
};

}  // namespace mdk
