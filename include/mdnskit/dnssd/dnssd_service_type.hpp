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

#include "dnssd_error.hpp"
#include "mdnskit/core/expected.hpp"

#include <string>
#include <string_view>

namespace mdk::dnssd {

/// The service type used when none is given.
constexpr auto k_default_service_type = "_http._tcp.";

/**
 * How to handle a service type string which can't be parsed.
 */
enum class TypeParsePolicy {
    /// Log a warning and continue with the fallback type.
    lenient,
    /// Fail with a validation error.
    strict,
};

const char* to_string(TypeParsePolicy policy);

/**
 * A DNS-SD service type, split into its service label and transport protocol. Both parts are stored lowercase and
 * without underscores, so "_HTTP._tcp" is stored as {"http", "tcp"}.
 */
struct ServiceType {
    std::string label;
    std::string protocol;

    /**
     * @return The canonical dot terminated form, like "_http._tcp.".
     */
    [[nodiscard]] std::string full_type() const;

    friend bool operator==(const ServiceType& lhs, const ServiceType& rhs) {
        return lhs.label == rhs.label && lhs.protocol == rhs.protocol;
    }

    friend bool operator!=(const ServiceType& lhs, const ServiceType& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * Builds the canonical form of a service type.
 * @param label The service label without underscore (e.g. "http").
 * @param protocol The protocol without underscore (e.g. "tcp").
 * @return The full type, e.g. "_http._tcp.".
 */
std::string to_full_type(std::string_view label, std::string_view protocol);

/**
 * Parses a service type of the form "_<label>._<protocol>" with any number of trailing dots. The label must be 1 to 15
 * letters, digits or hyphens and can't start or end with a hyphen. The protocol must be tcp or udp.
 * Surrounding whitespace is ignored and empty input yields the fallback.
 * @param raw The text to parse.
 * @param policy What to do with malformed input.
 * @param fallback The type to use for empty input, and for malformed input under the lenient policy.
 * @return The parsed type, or a validation error.
 */
tl::expected<ServiceType, Error> parse_service_type(
    std::string_view raw, TypeParsePolicy policy = TypeParsePolicy::lenient,
    std::string_view fallback = k_default_service_type
);

}  // namespace mdk::dnssd
