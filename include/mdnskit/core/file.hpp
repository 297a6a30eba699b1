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

#include "expected.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace mdk::file {

enum class Error {
    invalid_path,
    file_does_not_exist,
    failed_to_open,
    failed_to_read_from_file,
};

inline const char* to_string(const Error error) {
    switch (error) {
        case Error::invalid_path:
            return "invalid_path";
        case Error::file_does_not_exist:
            return "file_does_not_exist";
        case Error::failed_to_open:
            return "failed_to_open";
        case Error::failed_to_read_from_file:
            return "failed_to_read_from_file";
    }
    return "unknown";
}

/**
 * Reads the contents of given file into a string.
 * @param file The file to read from.
 * @return The contents on success, or an Error in case of failure.
 */
inline tl::expected<std::string, Error> read_file_as_string(const std::filesystem::path& file) {
    if (file.empty()) {
        return tl::unexpected(Error::invalid_path);
    }

    if (!std::filesystem::exists(file)) {
        return tl::unexpected(Error::file_does_not_exist);
    }

    std::ifstream stream(file, std::ios::binary);
    if (!stream.is_open()) {
        return tl::unexpected(Error::failed_to_open);
    }

    std::string result((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return tl::unexpected(Error::failed_to_read_from_file);
    }

    return result;
}

}  // namespace mdk::file
