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

#include "bonjour_scoped_dns_service_ref.hpp"

#if MDK_HAS_DNSSD

namespace mdk::dnssd {

/**
 * A connection to the mDNS responder which browse, resolve and register operations share, so that all their results
 * arrive on a single socket.
 */
class BonjourSharedConnection {
  public:
    /**
     * Creates the connection.
     * @throws mdk::Exception if the responder could not be reached.
     */
    BonjourSharedConnection();

    /**
     * @return The DNSServiceRef of the connection, which remains owned by this instance.
     */
    [[nodiscard]] DNSServiceRef service_ref() const noexcept {
        return service_ref_.service_ref();
    }

    /**
     * Closes the connection.
     */
    void reset() noexcept {
        service_ref_.reset();
    }

  private:
    BonjourScopedDnsServiceRef service_ref_;
};

}  // namespace mdk::dnssd

#endif
