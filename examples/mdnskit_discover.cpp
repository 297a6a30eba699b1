/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/core/file.hpp"
#include "mdnskit/core/json.hpp"
#include "mdnskit/core/log.hpp"
#include "mdnskit/node/mdns_node.hpp"

#include <CLI/App.hpp>

#include <iostream>

/**
 * This example discovers services of a type on the local network and prints the result as json.
 */

int main(int const argc, char* argv[]) {
    mdk::set_log_level_from_env();

    CLI::App app {"mdnskit discover example"};
    argv = app.ensure_utf8(argv);

    std::string type;
    std::string name;
    int64_t timeout_ms = -1;
    std::string config_file;
    app.add_option("--type", type, "The service type to browse for (i.e. _http._tcp.)");
    app.add_option("--name", name, "Only resolve services with this instance name, and stop at the first match");
    app.add_option("--timeout", timeout_ms, "The time budget in milliseconds");
    app.add_option("--config", config_file, "A json file holding the node configuration");

    CLI11_PARSE(app, argc, argv);

    mdk::MdnsNode::Configuration config;
    if (!config_file.empty()) {
        const auto json = mdk::file::read_file_as_string(config_file);
        if (!json) {
            MDK_ERROR("Failed to read {}: {}", config_file, mdk::file::to_string(json.error()));
            return 1;
        }
        auto parsed = mdk::parse_json<mdk::MdnsNode::Configuration>(*json);
        if (parsed.has_error()) {
            MDK_ERROR("Invalid configuration in {}: {}", config_file, parsed.error().message());
            return 1;
        }
        config = std::move(*parsed);
    }

    mdk::MdnsNode node(config);
    if (!node.has_transport()) {
        MDK_ERROR("No DNS-SD implementation available for this platform");
    }

    mdk::dnssd::DiscoveryRequest request;
    if (!type.empty()) {
        request.type = type;
    }
    if (!name.empty()) {
        request.name = name;
    }
    if (timeout_ms >= 0) {
        request.timeout_ms = timeout_ms;
    }

    const auto result = node.discover(request).get();
    std::cout << boost::json::serialize(boost::json::value_from(result)) << std::endl;

    node.shutdown();

    return result.error ? 1 : 0;
}
