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
#include <thread>

namespace examples {

bool parse_txt_record(mdk::dnssd::TxtRecord& txt_record, const std::string& string_value) {
    if (string_value.empty())
        return false;

    const size_t pos = string_value.find('=');
    if (pos != std::string::npos)
        txt_record[string_value.substr(0, pos)] = string_value.substr(pos + 1);
    else
        txt_record[string_value] = "";

    return true;
}

}  // namespace examples

/**
 * This example advertises a service on the local network until enter is pressed, or until the given duration passed.
 */

int main(int const argc, char* argv[]) {
    mdk::set_log_level_from_env();

    CLI::App app {"mdnskit broadcast example"};
    argv = app.ensure_utf8(argv);

    std::string type;
    std::string name;
    std::string domain;
    int64_t port = 0;
    std::vector<std::string> txt;
    int64_t duration_ms = 0;
    std::string config_file;
    app.add_option("--type", type, "The service type to advertise (i.e. _http._tcp.)");
    app.add_option("--name", name, "The instance name to advertise");
    app.add_option("--domain", domain, "The domain to advertise in");
    app.add_option("--port", port, "The port of the service")->required();
    app.add_option("--txt", txt, "Entries of the txt record as key=value");
    app.add_option("--duration", duration_ms, "Stop after this many milliseconds instead of waiting for enter");
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

    mdk::dnssd::BroadcastRequest request;
    request.port = port;
    if (!type.empty()) {
        request.type = type;
    }
    if (!name.empty()) {
        request.name = name;
    }
    if (!domain.empty()) {
        request.domain = domain;
    }
    if (!txt.empty()) {
        mdk::dnssd::TxtRecord txt_record;
        for (auto& entry : txt) {
            examples::parse_txt_record(txt_record, entry);
        }
        request.txt = std::move(txt_record);
    }

    const auto result = node.start_broadcast(request).get();
    std::cout << boost::json::serialize(boost::json::value_from(result)) << std::endl;
    if (result.error) {
        return 1;
    }

    if (duration_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
    } else {
        std::cout << "Press enter to exit..." << std::endl;
        std::cin.get();
    }

    const auto stop_result = node.stop_broadcast().get();
    std::cout << boost::json::serialize(boost::json::value_from(stop_result)) << std::endl;

    node.shutdown();

    std::cout << "Exit" << std::endl;

    return stop_result.error ? 1 : 0;
}
