/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_transport.hpp"

#include "mdnskit/core/log.hpp"
#include "mdnskit/dnssd/bonjour/bonjour_transport.hpp"

#include <tuple>

std::unique_ptr<mdk::dnssd::Transport> mdk::dnssd::Transport::create(boost::asio::io_context& io_context) {
#if MDK_HAS_DNSSD
    if (!is_bonjour_service_running()) {
        MDK_WARNING("The mDNS responder is not running");
        return {};
    }
    try {
        return std::make_unique<BonjourTransport>(io_context);
    } catch (const std::exception& e) {
        MDK_ERROR("Failed to create DNS-SD transport: {}", e.what());
        return {};
    }
#else
    std::ignore = io_context;
    return {};
#endif
}
