/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_service_type.hpp"

#include "mdnskit/core/log.hpp"
#include "mdnskit/core/string.hpp"
#include "mdnskit/core/string_parser.hpp"

#include <fmt/format.h>

#include <optional>

namespace {

bool is_valid_label(const std::string_view label) {
    return !label.empty() && label.find('.') == std::string_view::npos;
}

std::optional<mdk::dnssd::ServiceType> try_parse(std::string_view text) {
    text = mdk::string_trim(text);
    while (!text.empty() && text.back() == '.') {
        text.remove_suffix(1);
    }

    mdk::StringParser parser(text);
    if (!parser.skip('_')) {
        return std::nullopt;
    }

    const auto label = parser.read_until('.');
    if (!label || !parser.skip('_')) {
        return std::nullopt;
    }

    const auto protocol = parser.read_until_end();
    if (!protocol || !is_valid_label(*label)) {
        return std::nullopt;
    }

    if (!mdk::string_compare_case_insensitive(*protocol, "tcp")
        && !mdk::string_compare_case_insensitive(*protocol, "udp")) {
        return std::nullopt;
    }

    return mdk::dnssd::ServiceType {mdk::string_to_lower(*label), mdk::string_to_lower(*protocol)};
}

}  // namespace

const char* mdk::dnssd::to_string(const TypeParsePolicy policy) {
    switch (policy) {
        case TypeParsePolicy::lenient:
            return "lenient";
        case TypeParsePolicy::strict:
            return "strict";
    }
    return "unknown";
}

std::string mdk::dnssd::ServiceType::full_type() const {
    return to_full_type(label, protocol);
}

std::string mdk::dnssd::to_full_type(const std::string_view label, const std::string_view protocol) {
    return fmt::format("_{}._{}.", label, protocol);
}

tl::expected<mdk::dnssd::ServiceType, mdk::dnssd::Error>
mdk::dnssd::parse_service_type(const std::string_view raw, const TypeParsePolicy policy, const std::string_view fallback) {
    const auto fallback_type = try_parse(fallback);
    if (!fallback_type) {
        return tl::unexpected(Error::validation(fmt::format("Invalid fallback service type: \"{}\"", fallback)));
    }

    if (string_trim(raw).empty()) {
        return *fallback_type;
    }

    if (auto type = try_parse(raw)) {
        return *type;
    }

    if (policy == TypeParsePolicy::strict) {
        return tl::unexpected(Error::validation(fmt::format("Invalid service type: \"{}\"", raw)));
    }

    MDK_WARNING("Invalid service type \"{}\", using {}", raw, fallback_type->full_type());
    return *fallback_type;
}
