/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_results.hpp"

namespace {

boost::json::value optional_string_to_json(const std::optional<std::string>& str) {
    if (str) {
        return boost::json::value(*str);
    }
    return nullptr;
}

std::optional<std::string> optional_string_from_json(const boost::json::object& obj, const std::string_view key) {
    const auto* value = obj.if_contains(key);
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    return std::string(value->as_string());
}

}  // namespace

void mdk::dnssd::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const ServiceRecord& record) {
    boost::json::object obj {
        {"name", record.name},
        {"type", record.type},
        {"domain", record.domain},
        {"port", record.port},
        {"hosts", boost::json::value_from(record.hosts)},
    };
    if (record.txt) {
        obj["txt"] = boost::json::value_from(*record.txt);
    }
    jv = std::move(obj);
}

void mdk::dnssd::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const DiscoveryResult& result) {
    jv = {
        {"error", result.error},
        {"errorMessage", optional_string_to_json(result.error_message)},
        {"servicesFound", result.services_found},
        {"services", boost::json::value_from(result.services)},
    };
}

void mdk::dnssd::tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const BroadcastResult& result) {
    jv = {
        {"error", result.error},
        {"errorMessage", optional_string_to_json(result.error_message)},
        {"name", result.name},
        {"publishing", result.publishing},
    };
}

void mdk::dnssd::tag_invoke(
    const boost::json::value_from_tag&, boost::json::value& jv, const StopBroadcastResult& result
) {
    jv = {
        {"error", result.error},
        {"errorMessage", optional_string_to_json(result.error_message)},
        {"publishing", result.publishing},
    };
}

mdk::dnssd::DiscoveryRequest
mdk::dnssd::tag_invoke(const boost::json::value_to_tag<DiscoveryRequest>&, const boost::json::value& jv) {
    const auto& obj = jv.as_object();
    DiscoveryRequest request;
    request.type = optional_string_from_json(obj, "type");
    request.name = optional_string_from_json(obj, "name");
    if (const auto* timeout = obj.if_contains("timeout"); timeout != nullptr && !timeout->is_null()) {
        request.timeout_ms = timeout->to_number<int64_t>();
    }
    return request;
}

mdk::dnssd::BroadcastRequest
mdk::dnssd::tag_invoke(const boost::json::value_to_tag<BroadcastRequest>&, const boost::json::value& jv) {
    const auto& obj = jv.as_object();
    BroadcastRequest request;
    request.type = optional_string_from_json(obj, "type");
    request.name = optional_string_from_json(obj, "name");
    request.domain = optional_string_from_json(obj, "domain");
    request.port = obj.at("port").to_number<int64_t>();
    if (const auto* txt = obj.if_contains("txt"); txt != nullptr && !txt->is_null()) {
        request.txt = boost::json::value_to<TxtRecord>(*txt);
    }
    return request;
}
