/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_name_matcher.hpp"

#include "mdnskit/core/string.hpp"

#include <cctype>

namespace {

/**
 * @return The length of `name` without a trailing " (<digits>)", or npos if there is no such suffix.
 */
size_t find_uniqueness_suffix(const std::string_view name) {
    if (name.size() < 4 || name.back() != ')') {
        return std::string_view::npos;
    }

    size_t pos = name.size() - 1;
    size_t digits = 0;
    while (pos > 0 && std::isdigit(static_cast<unsigned char>(name[pos - 1]))) {
        --pos;
        ++digits;
    }

    if (digits == 0 || pos < 2 || name[pos - 1] != '(' || name[pos - 2] != ' ') {
        return std::string_view::npos;
    }

    return pos - 2;
}

}  // namespace

std::string mdk::dnssd::normalize_instance_name(std::string_view name) {
    // Strip repeatedly so that normalizing is idempotent, also for names like "X (2) (3)".
    for (auto pos = find_uniqueness_suffix(name); pos != std::string_view::npos; pos = find_uniqueness_suffix(name)) {
        name = name.substr(0, pos);
    }
    return std::string(name);
}

bool mdk::dnssd::instance_name_matches(const std::string_view candidate, const std::string_view target) {
    if (target.empty()) {
        return true;
    }
    const auto c = normalize_instance_name(candidate);
    const auto t = normalize_instance_name(target);
    return c == t || string_starts_with(c, t);
}
