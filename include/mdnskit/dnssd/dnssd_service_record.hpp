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

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdk::dnssd {

/// The domain used when none is given or reported.
constexpr auto k_default_domain = "local.";

/// Key/value pairs of a TXT record.
using TxtRecord = std::map<std::string, std::string>;

/**
 * A service which was discovered and resolved. Records are immutable once added to a discovery result.
 */
struct ServiceRecord {
    /// The instance name as advertised, possibly with a uniqueness suffix like " (2)".
    std::string name;
    /// The canonical full service type (i.e. _http._tcp.).
    std::string type;
    /// The dot terminated domain (i.e. local.).
    std::string domain;
    /// The port of the service.
    uint16_t port {};
    /// Numeric IPv4 and IPv6 addresses in the order they were resolved, without duplicates.
    std::vector<std::string> hosts;
    /// The TXT record, absent if the transport can't supply one or none was published.
    std::optional<TxtRecord> txt;

    /**
     * The identity used to recognize the same service reported more than once: the normalized name, the port and the
     * first host address.
     * @return The identity as a single string.
     */
    [[nodiscard]] std::string dedup_key() const;

    /**
     * @return A description of this record for logging purposes.
     */
    [[nodiscard]] std::string description() const;

    friend bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs) {
        return lhs.name == rhs.name && lhs.type == rhs.type && lhs.domain == rhs.domain && lhs.port == rhs.port
            && lhs.hosts == rhs.hosts && lhs.txt == rhs.txt;
    }

    friend bool operator!=(const ServiceRecord& lhs, const ServiceRecord& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * Filters a list of addresses down to numeric IPv4 and IPv6 addresses, removing duplicates while keeping the order.
 * Addresses are returned in their canonical textual form.
 * @param hosts The addresses as reported by the transport.
 * @return The normalized addresses.
 */
std::vector<std::string> normalize_hosts(const std::vector<std::string>& hosts);

/**
 * @param domain The domain as reported by the transport.
 * @return The domain with a single trailing dot, or "local." if the domain is empty.
 */
std::string normalize_domain(std::string_view domain);

}  // namespace mdk::dnssd
