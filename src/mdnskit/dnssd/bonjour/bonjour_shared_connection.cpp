/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/bonjour/bonjour_shared_connection.hpp"

#if MDK_HAS_DNSSD

mdk::dnssd::BonjourSharedConnection::BonjourSharedConnection() {
    DNSServiceRef ref = nullptr;
    DNSSD_THROW_IF_ERROR(DNSServiceCreateConnection(&ref), "Failed to create shared connection");
    service_ref_ = ref;
}

#endif
