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

#include "dnssd_service_record.hpp"
#include "mdnskit/core/json.hpp"

#include <boost/json/value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mdk::dnssd {

/**
 * Parameters of a discovery. Absent fields are filled in from the node configuration.
 */
struct DiscoveryRequest {
    /// The service type to browse for (i.e. _http._tcp.).
    std::optional<std::string> type;
    /// When set, only services whose instance name matches are resolved, and the discovery finishes on the first match.
    std::optional<std::string> name;
    /// The time budget in milliseconds. Negative values are treated as 0.
    std::optional<int64_t> timeout_ms;
};

/**
 * The outcome of a discovery. Finding nothing is not an error.
 */
struct DiscoveryResult {
    /// True if browsing failed. Services found up to that point are still reported.
    bool error {false};
    std::optional<std::string> error_message;
    size_t services_found {};
    std::vector<ServiceRecord> services;
};

/**
 * Parameters of an advertisement.
 */
struct BroadcastRequest {
    std::optional<std::string> type;
    std::optional<std::string> name;
    std::optional<std::string> domain;
    /// Must be within 1 and 65535.
    int64_t port {};
    std::optional<TxtRecord> txt;
};

struct BroadcastResult {
    bool error {false};
    std::optional<std::string> error_message;
    /// The name the service was registered under, which might differ from the requested name.
    std::string name;
    bool publishing {false};
};

struct StopBroadcastResult {
    bool error {false};
    std::optional<std::string> error_message;
    bool publishing {false};
};

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const ServiceRecord& record);
void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DiscoveryResult& result);
void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const BroadcastResult& result);
void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const StopBroadcastResult& result);

DiscoveryRequest tag_invoke(const boost::json::value_to_tag<DiscoveryRequest>&, const boost::json::value& jv);
BroadcastRequest tag_invoke(const boost::json::value_to_tag<BroadcastRequest>&, const boost::json::value& jv);

}  // namespace mdk::dnssd
