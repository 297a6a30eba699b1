/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_service_record.hpp"

#include "mdnskit/core/log.hpp"
#include "mdnskit/core/string.hpp"
#include "mdnskit/dnssd/dnssd_name_matcher.hpp"

#include <boost/asio/ip/address.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

std::string mdk::dnssd::ServiceRecord::dedup_key() const {
    return fmt::format("{}|{}|{}", normalize_instance_name(name), port, hosts.empty() ? std::string() : hosts.front());
}

std::string mdk::dnssd::ServiceRecord::description() const {
    std::string txt_description = "none";
    if (txt) {
        txt_description.clear();
        for (auto& [key, value] : *txt) {
            if (!txt_description.empty()) {
                txt_description += ", ";
            }
            txt_description += key;
            txt_description += "=";
            txt_description += value;
        }
    }

    return fmt::format(
        "name: {}, type: {}, domain: {}, port: {}, hosts: [{}], txt: {}", name, type, domain, port,
        fmt::join(hosts, ", "), txt_description
    );
}

std::vector<std::string> mdk::dnssd::normalize_hosts(const std::vector<std::string>& hosts) {
    std::vector<std::string> result;
    result.reserve(hosts.size());

    for (auto& host : hosts) {
        boost::system::error_code ec;
        const auto address = boost::asio::ip::make_address(string_trim(host), ec);
        if (ec) {
            MDK_TRACE("Dropping non numeric host address: {}", host);
            continue;
        }

        auto text = address.to_string();
        if (std::find(result.begin(), result.end(), text) == result.end()) {
            result.push_back(std::move(text));
        }
    }

    return result;
}

std::string mdk::dnssd::normalize_domain(std::string_view domain) {
    domain = string_trim(domain);
    while (!domain.empty() && domain.back() == '.') {
        domain.remove_suffix(1);
    }
    if (domain.empty()) {
        return k_default_domain;
    }
    return std::string(domain) + ".";
}
